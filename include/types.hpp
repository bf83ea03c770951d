#pragma once
#include "config.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace mipsim {

using Addr    = std::int64_t;   // Dirección en bytes / pc (sin wraparound; < base queda negativo)
using Word    = std::uint32_t;  // Palabra de 32 bits
using RegIdx  = std::uint8_t;   // 0..31
using RegFile = std::array<Word, cfg::kNumRegs>;

// Resultado de un paso de ejecución
enum class StepStatus : std::uint8_t {
  Ok,
  Halted,        // ya estaba detenida, no se ejecuta nada
  PcOutOfRange,  // pc fuera de la memoria de instrucciones (fin normal)
  UnknownJump,   // formato J con código no reconocido (fatal)
  UnknownType    // formato imposible (rama defensiva)
};

enum class MemAccessType : std::uint8_t { Read, Write };

// Efecto lateral de lw/sw
struct MemAccess {
  MemAccessType type{MemAccessType::Read};
  Addr          addr{0};
  Word          value{0};

  bool operator==(const MemAccess&) const = default;
};

inline const char* status_str(StepStatus s) {
  switch (s) {
    case StepStatus::Ok:           return "ok";
    case StepStatus::Halted:       return "halted";
    case StepStatus::PcOutOfRange: return "pc_out_of_range";
    case StepStatus::UnknownJump:  return "unknown_j";
    case StepStatus::UnknownType:  return "unknown_type";
  }
  return "?";
}

inline const char* access_str(MemAccessType t) {
  switch (t) {
    case MemAccessType::Read:  return "read";
    case MemAccessType::Write: return "write";
  }
  return "?";
}

} // namespace mipsim
