#pragma once
#include "types.hpp"
#include "isa.hpp"
#include "memory.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace mipsim {

// Registro de un paso. Solo los campos que aplican al status vienen cargados:
// - Ok:           todo (pc, instr, decoded, step, mem_access si lw/sw, regs_snapshot)
// - PcOutOfRange: pc (el que quedó fuera de rango)
// - UnknownJump / UnknownType: pc, instr, decoded
// - Halted:       nada
struct StepResult {
  StepStatus               status = StepStatus::Ok;
  Addr                     pc = 0;       // pc ANTES del paso
  Word                     instr = 0;    // palabra cruda leída
  std::optional<Decoded>   decoded;
  std::uint64_t            step = 0;     // step_count luego del paso
  std::optional<MemAccess> mem_access;
  RegFile                  regs_snapshot{};  // copia, no vista viva

  bool ok() const { return status == StepStatus::Ok; }
};

// Foto del estado completo en un instante (todo por valor).
struct MachineSnapshot {
  RegFile              regs{};
  std::map<Addr, Word> memory;     // solo palabras != 0
  Addr                 pc = 0;
  std::uint64_t        step_count = 0;
  bool                 halted = false;
};

// Registros distintos de cero (índice -> valor), para trazas.
std::map<int, Word> nonzero_regs(const RegFile& regs);

class Processor {
public:
  // Construcción: memoria de instrucciones (inmutable) y pc base
  explicit Processor(std::vector<Word> instrs, Addr base_pc = cfg::kDefaultBasePc);

  // Un paso de CPU: fetch, decode, execute. Nunca lanza.
  StepResult step();

  // Hasta n pasos; corta apenas la máquina queda detenida.
  std::vector<StepResult> run(std::size_t n);

  bool is_halted() const { return halted_; }

  // Registros (32 de 32 bits)
  Word    get_reg(int idx) const;
  RegFile regs() const { return reg_; }

  Word read_mem(Addr addr) const { return mem_.read32(addr); }

  Addr          pc() const { return pc_; }
  Addr          base_pc() const { return base_; }
  std::uint64_t step_count() const { return step_count_; }
  std::size_t   program_size() const { return instrs_.size(); }

  MachineSnapshot snapshot() const;

private:
  // Palabra en pc, o nullopt si cae fuera de la memoria de instrucciones
  std::optional<Word> fetch_at(Addr pc) const;

  // Ejecución por formato. Devuelven Ok o el status terminal.
  StepStatus exec_r(const RType& r);
  StepStatus exec_i(const IType& i, std::optional<MemAccess>& access);
  StepStatus exec_j(const JType& j);

  // Estado
  const std::vector<Word> instrs_;
  const Addr              base_;
  Addr                    pc_;
  RegFile                 reg_{};
  Memory                  mem_;
  std::uint64_t           step_count_ = 0;
  bool                    halted_ = false;
};

} // namespace mipsim
