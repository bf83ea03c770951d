#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

//
// Parser de palabras de instrucción (una por línea).
// Toma texto (string o archivo) y lo convierte en una lista de palabras de 32 bits.
//
// Formatos aceptados, en este orden:
//   0x0000002A / 0X2a                     // hex con prefijo
//   00000000000000000000000000101010      // exactamente 32 dígitos binarios
//   2a                                    // hex sin prefijo
//
// Notas rápidas:
// - Las líneas vacías o inválidas se descartan (no es error)
// - Se acepta un "+" inicial y "_" entre dígitos (1_000, 0x_ff)
// - No se aceptan "-" ni valores de más de 32 bits
// - Solo leer el archivo puede fallar: se lanza std::runtime_error
//

namespace mipsim {

class WordParser {
public:
  // Una línea -> palabra, o nullopt si está vacía o no se puede parsear.
  static std::optional<Word> parse_word(std::string_view line);

  // Todas las líneas válidas de un texto, en orden.
  static std::vector<Word> parse_words(const std::string& src);

  // Lee el archivo y parsea su contenido.
  static std::vector<Word> read_words_from_file(const std::string& path);

  // PC base en texto: "0x..." en hex, si no decimal. Si falla, devuelve 'fallback'.
  static Addr parse_base_pc(std::string_view text, Addr fallback = cfg::kDefaultBasePc);

private:
  // Quita espacios al inicio y al final.
  static std::string_view trim(std::string_view s);

  // ¿s empieza con p? (case-insensitive)
  static bool starts_with(std::string_view s, std::string_view p);

  // Número completo en la base dada, sin signo y de 32 bits como máximo.
  // En base 16 admite el prefijo 0x.
  static std::optional<Word> parse_uint32(std::string_view digits, int base);
};

} // namespace mipsim
