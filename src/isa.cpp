#include "isa.hpp"
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace mipsim
{
// Decodificador: extracción de campos + tablas fijas de mnemónicos.

// --- Tablas código -> mnemónico ---
static const std::unordered_map<std::uint8_t, Mnemonic>& r_functs() {
  static const std::unordered_map<std::uint8_t, Mnemonic> T = {
    {kFunctAdd, Mnemonic::ADD},
    {kFunctSub, Mnemonic::SUB},
    {kFunctAnd, Mnemonic::AND},
    {kFunctOr,  Mnemonic::OR},
    {kFunctSlt, Mnemonic::SLT},
  };
  return T;
}

static const std::unordered_map<std::uint8_t, Mnemonic>& i_opcodes() {
  static const std::unordered_map<std::uint8_t, Mnemonic> T = {
    {kOpAddi, Mnemonic::ADDI},
    {kOpLw,   Mnemonic::LW},
    {kOpSw,   Mnemonic::SW},
    {kOpBeq,  Mnemonic::BEQ},
    {kOpBne,  Mnemonic::BNE},
  };
  return T;
}

// Por ahora un único opcode de salto
static const std::unordered_map<std::uint8_t, Mnemonic>& j_opcodes() {
  static const std::unordered_map<std::uint8_t, Mnemonic> T = {
    {kOpJ, Mnemonic::J},
  };
  return T;
}

static Mnemonic lookup(const std::unordered_map<std::uint8_t, Mnemonic>& table,
                       std::uint8_t code, Mnemonic fallback) {
  auto it = table.find(code);
  return it == table.end() ? fallback : it->second;
}

// Campo de 'bits' bits empezando en 'lo'
static inline std::uint32_t field(Word w, unsigned lo, unsigned bits) {
  return (w >> lo) & ((1u << bits) - 1u);
}

std::int32_t sign_extend16(std::uint32_t raw) {
  raw &= 0xFFFFu;
  if (raw & 0x8000u) return static_cast<std::int32_t>(raw) - 0x10000;
  return static_cast<std::int32_t>(raw);
}

Decoded decode(Word instr) {
  const auto opcode = static_cast<std::uint8_t>(field(instr, 26, 6));

  if (opcode == kOpRType) {
    RType r;
    r.opcode   = opcode;
    r.rs       = static_cast<RegIdx>(field(instr, 21, 5));
    r.rt       = static_cast<RegIdx>(field(instr, 16, 5));
    r.rd       = static_cast<RegIdx>(field(instr, 11, 5));
    r.shamt    = static_cast<std::uint8_t>(field(instr, 6, 5));
    r.funct    = static_cast<std::uint8_t>(field(instr, 0, 6));
    r.mnemonic = lookup(r_functs(), r.funct, Mnemonic::UNKNOWN_R);
    return r;
  }

  if (j_opcodes().count(opcode)) {
    JType j;
    j.opcode   = opcode;
    j.address  = field(instr, 0, 26);
    j.mnemonic = lookup(j_opcodes(), opcode, Mnemonic::UNKNOWN_J);
    return j;
  }

  IType i;
  i.opcode   = opcode;
  i.rs       = static_cast<RegIdx>(field(instr, 21, 5));
  i.rt       = static_cast<RegIdx>(field(instr, 16, 5));
  i.imm      = sign_extend16(field(instr, 0, 16));
  i.mnemonic = lookup(i_opcodes(), opcode, Mnemonic::UNKNOWN_I);
  return i;
}

std::vector<DecodedLine> decode_program(const std::vector<Word>& words, Addr base_pc) {
  std::vector<DecodedLine> out;
  out.reserve(words.size());
  Addr pc = base_pc;
  for (Word w : words) {
    out.push_back({pc, w, decode(w)});
    pc += static_cast<Addr>(cfg::kWordBytes);
  }
  return out;
}

static std::string unknown_name(const char* kind, std::uint8_t code) {
  std::ostringstream os;
  os << "unknown_" << kind << "(0x" << std::hex << std::setw(2) << std::setfill('0')
     << static_cast<unsigned>(code) << ")";
  return os.str();
}

std::string mnemonic_name(Mnemonic m, std::uint8_t raw_code) {
  switch (m) {
    case Mnemonic::ADD:       return "add";
    case Mnemonic::SUB:       return "sub";
    case Mnemonic::AND:       return "and";
    case Mnemonic::OR:        return "or";
    case Mnemonic::SLT:       return "slt";
    case Mnemonic::ADDI:      return "addi";
    case Mnemonic::LW:        return "lw";
    case Mnemonic::SW:        return "sw";
    case Mnemonic::BEQ:       return "beq";
    case Mnemonic::BNE:       return "bne";
    case Mnemonic::J:         return "j";
    case Mnemonic::UNKNOWN_R: return unknown_name("r", raw_code);
    case Mnemonic::UNKNOWN_I: return unknown_name("i", raw_code);
    case Mnemonic::UNKNOWN_J: return unknown_name("j", raw_code);
  }
  return "?";
}

std::string mnemonic_of(const Decoded& d) {
  return std::visit(Overloaded{
    [](const RType& r) { return mnemonic_name(r.mnemonic, r.funct); },
    [](const IType& i) { return mnemonic_name(i.mnemonic, i.opcode); },
    [](const JType& j) { return mnemonic_name(j.mnemonic, j.opcode); },
  }, d);
}

char format_letter(const Decoded& d) {
  return std::visit(Overloaded{
    [](const RType&) { return 'R'; },
    [](const IType&) { return 'I'; },
    [](const JType&) { return 'J'; },
  }, d);
}

std::string format_decoded(const Decoded& d) {
  std::ostringstream os;
  std::visit(Overloaded{
    [&](const RType& r) {
      os << "R-type: " << mnemonic_of(d)
         << " rs=$" << unsigned(r.rs) << " rt=$" << unsigned(r.rt) << " rd=$" << unsigned(r.rd)
         << " shamt=" << unsigned(r.shamt)
         << " funct=0x" << std::hex << std::setw(2) << std::setfill('0') << unsigned(r.funct);
    },
    [&](const IType& i) {
      os << "I-type: " << mnemonic_of(d)
         << " rs=$" << unsigned(i.rs) << " rt=$" << unsigned(i.rt) << " imm=" << i.imm;
    },
    [&](const JType& j) {
      os << "J-type: " << mnemonic_of(d)
         << " addr=0x" << std::hex << std::setw(7) << std::setfill('0') << j.address;
    },
  }, d);
  return os.str();
}

} // namespace mipsim
