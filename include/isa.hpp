#pragma once
#include "types.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace mipsim {

// ISA mini (subconjunto MIPS32): 3 formatos y 11 instrucciones.
//
//   R: | op(6)=0 | rs(5) | rt(5) | rd(5) | shamt(5) | funct(6) |
//   I: | op(6)   | rs(5) | rt(5) |        imm(16)             |
//   J: | op(6)   |              address(26)                   |
//
// Los códigos no reconocidos no son error: quedan como UNKNOWN_* con el código crudo.

// Códigos de función (formato R, opcode 0)
inline constexpr std::uint8_t kFunctAdd = 0x20;
inline constexpr std::uint8_t kFunctSub = 0x22;
inline constexpr std::uint8_t kFunctAnd = 0x24;
inline constexpr std::uint8_t kFunctOr  = 0x25;
inline constexpr std::uint8_t kFunctSlt = 0x2A;

// Opcodes (formatos I y J)
inline constexpr std::uint8_t kOpRType = 0x00;
inline constexpr std::uint8_t kOpJ     = 0x02;
inline constexpr std::uint8_t kOpBeq   = 0x04;
inline constexpr std::uint8_t kOpBne   = 0x05;
inline constexpr std::uint8_t kOpAddi  = 0x08;
inline constexpr std::uint8_t kOpLw    = 0x23;
inline constexpr std::uint8_t kOpSw    = 0x2B;

enum class Mnemonic : std::uint8_t {
  ADD, SUB, AND, OR, SLT,      // R
  ADDI, LW, SW, BEQ, BNE,      // I
  J,                           // J
  UNKNOWN_R, UNKNOWN_I, UNKNOWN_J
};

struct RType {
  std::uint8_t opcode = kOpRType;
  RegIdx       rs = 0;
  RegIdx       rt = 0;
  RegIdx       rd = 0;
  std::uint8_t shamt = 0;
  std::uint8_t funct = 0;
  Mnemonic     mnemonic = Mnemonic::UNKNOWN_R;

  bool operator==(const RType&) const = default;
};

struct IType {
  std::uint8_t opcode = 0;
  RegIdx       rs = 0;
  RegIdx       rt = 0;
  std::int32_t imm = 0;        // ya extendido en signo: [-32768, 32767]
  Mnemonic     mnemonic = Mnemonic::UNKNOWN_I;

  bool operator==(const IType&) const = default;
};

struct JType {
  std::uint8_t  opcode = kOpJ;
  std::uint32_t address = 0;   // 26 bits
  Mnemonic      mnemonic = Mnemonic::UNKNOWN_J;

  bool operator==(const JType&) const = default;
};

// Instrucción decodificada: suma de los tres formatos.
using Decoded = std::variant<RType, IType, JType>;

// Entrada del listado estático: pc que ocuparía la palabra + decodificación.
struct DecodedLine {
  Addr    pc{0};
  Word    word{0};
  Decoded decoded;
};

// Helper para std::visit con lambdas
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

// Extensión de signo de un inmediato de 16 bits.
std::int32_t sign_extend16(std::uint32_t raw);

// Total y determinista: nunca falla.
Decoded decode(Word instr);

// Decodifica un programa entero (pc = base + 4*i), sin máquina.
std::vector<DecodedLine> decode_program(const std::vector<Word>& words,
                                        Addr base_pc = cfg::kDefaultBasePc);

// "add", "lw", ..., o "unknown_r(0x3f)" con el código crudo.
std::string mnemonic_name(Mnemonic m, std::uint8_t raw_code);
std::string mnemonic_of(const Decoded& d);

// 'R', 'I' o 'J'
char format_letter(const Decoded& d);

// Texto para mostrar (estable para cada variante).
std::string format_decoded(const Decoded& d);

} // namespace mipsim
