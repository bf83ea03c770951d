#include "simulator.hpp"
#include "config.hpp"
#include "word_parser.hpp"

#include <algorithm>
#include <iomanip>
#include <iterator>

namespace mipsim {

// ---------- Ciclo de vida ----------
// Sin carga previa: programa vacío en la base por defecto (el primer step da pc fuera de rango)
Simulator::Simulator() {
  rebuild();
}

void Simulator::rebuild() {
  decoded_ = decode_program(words_, base_);
  cpu_ = std::make_unique<Processor>(words_, base_);
  trace_.clear();
}

// ---------- Carga ----------
void Simulator::load(const std::vector<Word>& words, Addr base_pc) {
  words_ = words;
  base_ = base_pc;
  loaded_ = true;
  rebuild();
  LOG_IF(cfg::kLogSim, "[Sim] " << words_.size() << " instrucciones decodificadas, base=0x"
                       << std::hex << std::setw(8) << std::setfill('0') << base_ << std::dec);
}

std::size_t Simulator::load_from_text(const std::string& src, Addr base_pc) {
  load(WordParser::parse_words(src), base_pc);
  return words_.size();
}

std::size_t Simulator::load_from_file(const std::string& path, Addr base_pc) {
  LOG_IF(cfg::kLogSim, "[Sim] Cargando palabras desde: " << path);
  load(WordParser::read_words_from_file(path), base_pc);
  return words_.size();
}

void Simulator::reset() {
  rebuild();
  LOG_IF(cfg::kLogSim, "[Sim] Reset (" << words_.size() << " instrucciones)");
}

// ---------- Ejecución ----------
StepResult Simulator::step() {
  StepResult r = cpu_->step();
  trace_.push_back(r);
  return r;
}

std::vector<StepResult> Simulator::run(std::size_t n) {
  auto acts = cpu_->run(n);
  trace_.insert(trace_.end(), acts.begin(), acts.end());
  LOG_IF(cfg::kLogSim, "[Sim] run(" << n << "): " << acts.size() << " pasos, pc=0x"
                       << std::hex << cpu_->pc() << std::dec
                       << (cpu_->is_halted() ? " (detenida)" : ""));
  return acts;
}

// ---------- Consultas ----------
std::vector<StepResult> Simulator::recent_trace(std::size_t n) const {
  const std::size_t k = std::min(n, trace_.size());
  return std::vector<StepResult>(std::prev(trace_.end(), static_cast<std::ptrdiff_t>(k)), trace_.end());
}

} // namespace mipsim
