#pragma once
/**
 * Simulator: sesión de simulación sobre un Processor.
 * Guarda lo que un front-end necesita entre interacciones:
 * palabras cargadas, pc base, listado estático y la traza acumulada.
 * Un solo dueño, un solo hilo. Recargar/resetear reemplaza la máquina entera.
 */

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"
#include "isa.hpp"
#include "processor.hpp"

namespace mipsim {

class Simulator {
public:
  Simulator();

  // ---- Carga de programas
  void        load(const std::vector<Word>& words, Addr base_pc = cfg::kDefaultBasePc);
  std::size_t load_from_text(const std::string& src, Addr base_pc = cfg::kDefaultBasePc);
  std::size_t load_from_file(const std::string& path, Addr base_pc = cfg::kDefaultBasePc);

  // Recarga las mismas palabras con la misma base; descarta estado y traza.
  void reset();

  // ---- Ejecución (todo lo producido se agrega a la traza)
  StepResult              step();
  std::vector<StepResult> run(std::size_t n);
  std::vector<StepResult> run_short()     { return run(cfg::kRunShortSteps); }
  std::vector<StepResult> run_long()      { return run(cfg::kRunLongSteps); }
  std::vector<StepResult> run_until_end() { return run(cfg::kRunUntilEndSteps); }

  // ---- Consultas
  bool                            is_loaded() const { return loaded_; }
  const std::vector<DecodedLine>& decoded() const { return decoded_; }
  const std::vector<StepResult>&  trace() const { return trace_; }
  std::vector<StepResult>         recent_trace(std::size_t n = cfg::kTraceTail) const;
  MachineSnapshot                 snapshot() const { return cpu_->snapshot(); }
  const Processor&                cpu() const { return *cpu_; }
  const std::vector<Word>&        words() const { return words_; }
  Addr                            base_pc() const { return base_; }

private:
  std::vector<Word>          words_;
  Addr                       base_ = cfg::kDefaultBasePc;
  bool                       loaded_ = false;

  std::vector<DecodedLine>   decoded_;
  std::unique_ptr<Processor> cpu_;
  std::vector<StepResult>    trace_;

  // Máquina nueva desde words_/base_
  void rebuild();
};

} // namespace mipsim
