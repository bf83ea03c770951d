#include "processor.hpp"
#include "config.hpp"
#include <iomanip>
#include <stdexcept>
#include <utility>

namespace mipsim
{

  // CPU monociclo del subconjunto MIPS.
  // - step(): fetch en pc, decode, execute, $0 <- 0
  // - run(n): repite step() hasta n veces o hasta quedar detenida
  // - Errores de ejecución: por status en StepResult, nunca excepciones
  Processor::Processor(std::vector<Word> instrs, Addr base_pc)
      : instrs_(std::move(instrs)), base_(base_pc), pc_(base_pc) {}

  Word Processor::get_reg(int idx) const
  {
    if (idx < 0 || idx >= static_cast<int>(cfg::kNumRegs))
      throw std::out_of_range("REG idx");
    return reg_[idx];
  }

  std::map<int, Word> nonzero_regs(const RegFile &regs)
  {
    std::map<int, Word> out;
    for (std::size_t i = 0; i < regs.size(); ++i)
      if (regs[i] != 0) out.emplace(static_cast<int>(i), regs[i]);
    return out;
  }

  MachineSnapshot Processor::snapshot() const
  {
    MachineSnapshot s;
    s.regs = reg_;
    s.memory = mem_.nonzero();
    s.pc = pc_;
    s.step_count = step_count_;
    s.halted = halted_;
    return s;
  }

  std::optional<Word> Processor::fetch_at(Addr pc) const
  {
    // Un pc por debajo de la base queda fuera de rango
    const Addr off = pc - base_;
    if (off < 0)
      return std::nullopt;
    const auto idx = static_cast<std::size_t>(off / static_cast<Addr>(cfg::kWordBytes));
    if (idx >= instrs_.size())
      return std::nullopt;
    return instrs_[idx];
  }

  // ===== Formato R =====
  StepStatus Processor::exec_r(const RType &r)
  {
    const Word a = reg_[r.rs];
    const Word b = reg_[r.rt];

    switch (r.mnemonic)
    {
    case Mnemonic::ADD: reg_[r.rd] = a + b; break;   // módulo 2^32 por ser uint32
    case Mnemonic::SUB: reg_[r.rd] = a - b; break;
    case Mnemonic::AND: reg_[r.rd] = a & b; break;
    case Mnemonic::OR:  reg_[r.rd] = a | b; break;
    case Mnemonic::SLT: reg_[r.rd] = (a < b) ? 1u : 0u; break;  // comparación sin signo
    default:
      // funct desconocido: no-op
      break;
    }
    pc_ += 4;
    return StepStatus::Ok;
  }

  // ===== Formato I =====
  StepStatus Processor::exec_i(const IType &i, std::optional<MemAccess> &access)
  {
    const Word imm = static_cast<Word>(i.imm);  // extendido en signo, visto módulo 2^32
    // Dirección efectiva sin wraparound: registro (sin signo) + inmediato (con signo)
    const Addr addr = static_cast<Addr>(reg_[i.rs]) + i.imm;
    const Addr offset = static_cast<Addr>(i.imm) * 4;
    auto next = [&]{ pc_ += 4; };

    switch (i.mnemonic)
    {
    case Mnemonic::ADDI: {
      reg_[i.rt] = reg_[i.rs] + imm;
      next();
      break;
    }
    case Mnemonic::LW: {
      const Word value = mem_.read32(addr);
      reg_[i.rt] = value;
      access = MemAccess{MemAccessType::Read, addr, value};
      next();
      break;
    }
    case Mnemonic::SW: {
      mem_.write32(addr, reg_[i.rt]);
      access = MemAccess{MemAccessType::Write, addr, mem_.read32(addr)};
      next();
      break;
    }
    case Mnemonic::BEQ: {
      if (reg_[i.rs] == reg_[i.rt]) pc_ = pc_ + 4 + offset;
      else                          next();
      break;
    }
    case Mnemonic::BNE: {
      if (reg_[i.rs] != reg_[i.rt]) pc_ = pc_ + 4 + offset;
      else                          next();
      break;
    }
    default:
      // opcode desconocido: no-op que igual avanza
      next();
      break;
    }
    return StepStatus::Ok;
  }

  // ===== Formato J =====
  StepStatus Processor::exec_j(const JType &j)
  {
    if (j.mnemonic != Mnemonic::J)
      return StepStatus::UnknownJump;

    // 4 bits altos del pc actual + campo de 26 bits desplazado 2
    pc_ = (pc_ & Addr{0xF0000000}) | static_cast<Addr>((j.address << 2) & 0x0FFFFFFFu);
    return StepStatus::Ok;
  }

  StepResult Processor::step()
  {
    StepResult res;
    if (halted_) {
      res.status = StepStatus::Halted;
      return res;
    }

    auto instr = fetch_at(pc_);
    if (!instr) {
      halted_ = true;
      res.status = StepStatus::PcOutOfRange;
      res.pc = pc_;
      LOG_IF(cfg::kLogCpu, "[CPU] pc fuera de rango: 0x" << std::hex << pc_ << std::dec);
      return res;
    }

    const Decoded dec = decode(*instr);
    res.pc = pc_;
    res.instr = *instr;
    res.decoded = dec;

    if (dec.valueless_by_exception()) {
      halted_ = true;
      res.status = StepStatus::UnknownType;
      return res;
    }

    const StepStatus st = std::visit(Overloaded{
      [&](const RType &r) { return exec_r(r); },
      [&](const IType &i) { return exec_i(i, res.mem_access); },
      [&](const JType &j) { return exec_j(j); },
    }, dec);

    if (st != StepStatus::Ok) {
      halted_ = true;
      res.status = st;
      LOG_IF(cfg::kLogCpu, "[CPU] detenida (" << status_str(st) << ") en pc=0x"
                           << std::hex << res.pc << std::dec);
      return res;
    }

    // $zero siempre vale 0
    reg_[0] = 0;
    ++step_count_;

    res.status = StepStatus::Ok;
    res.step = step_count_;
    res.regs_snapshot = reg_;

    LOG_IF(cfg::kLogCpu, "[CPU] #" << step_count_ << " pc=0x" << std::hex << std::setw(8)
                         << std::setfill('0') << res.pc << std::dec << " " << format_decoded(dec));
    return res;
  }

  std::vector<StepResult> Processor::run(std::size_t n)
  {
    std::vector<StepResult> out;
    for (std::size_t k = 0; k < n; ++k) {
      if (halted_) break;
      out.push_back(step());
    }
    return out;
  }

} // namespace mipsim
