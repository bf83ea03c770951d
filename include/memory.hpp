#pragma once
#include "config.hpp"
#include "types.hpp"
#include <map>
#include <unordered_map>

namespace mipsim {

/**
 * Memoria dispersa de palabras de 32b direccionada por byte.
 * - read32/write32: cualquier dirección, sin chequeo de alineamiento.
 * - Lo que nunca se escribió se lee como 0.
 * - Sin mutex: la máquina tiene un único dueño (un solo hilo).
 */
class Memory {
public:
  Memory() = default;

  Word read32(Addr addr) const;
  void write32(Addr addr, Word value);

  // Snapshot ordenado de las palabras distintas de cero (addr -> valor).
  std::map<Addr, Word> nonzero() const;

  // Cantidad de direcciones escritas alguna vez
  std::size_t size() const { return mem_.size(); }

private:
  std::unordered_map<Addr, Word> mem_;  // backing store
};

} // namespace mipsim
