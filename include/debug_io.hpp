#pragma once
// Utilidades de impresión compactas para listado, traza, registros y memoria.
// Pensado para el driver de línea de comandos y dumps de depuración.

#include "isa.hpp"
#include "processor.hpp"
#include "types.hpp"

#include <cstdint>
#include <iomanip>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace mipsim::dbg {

// 0x0040000c
inline void print_hex8(std::ostream& os, std::uint32_t v) {
  os << "0x" << std::hex << std::setw(8) << std::setfill('0') << v
     << std::dec << std::setfill(' ');
}

// Direcciones y pc: 64 bits con signo, mismo ancho mínimo que una palabra (-0x00000008)
inline void print_addr(std::ostream& os, Addr a) {
  if (a < 0) { os << "-"; a = -a; }
  os << "0x" << std::hex << std::setw(8) << std::setfill('0') << static_cast<std::uint64_t>(a)
     << std::dec << std::setfill(' ');
}

// PC | palabra | decodificación
inline void print_listing(std::ostream& os, const std::vector<DecodedLine>& lines) {
  for (const auto& l : lines) {
    print_addr(os, l.pc);
    os << "  ";
    print_hex8(os, l.word);
    os << "  " << format_decoded(l.decoded) << "\n";
  }
}

// {$1: 5, $9: 15}
inline void print_regs_nonzero(std::ostream& os, const RegFile& regs) {
  os << "{";
  bool first = true;
  for (const auto& [idx, v] : nonzero_regs(regs)) {
    if (!first) os << ", ";
    os << "$" << idx << ": " << v;
    first = false;
  }
  os << "}";
}

inline void print_step(std::ostream& os, const StepResult& r) {
  if (!r.ok()) {
    os << "[" << status_str(r.status) << "]";
    if (r.status == StepStatus::PcOutOfRange) { os << " pc="; print_addr(os, r.pc); }
    if (r.decoded) os << " " << format_decoded(*r.decoded);
    os << "\n";
    return;
  }

  os << "Step " << r.step << "  PC=";
  print_addr(os, r.pc);
  os << "  " << (r.decoded ? format_decoded(*r.decoded) : "N/A") << "\n";
  if (r.mem_access) {
    os << "  mem " << access_str(r.mem_access->type) << " @";
    print_addr(os, r.mem_access->addr);
    os << " = ";
    print_hex8(os, r.mem_access->value);
    os << "\n";
  }
  os << "  regs ";
  print_regs_nonzero(os, r.regs_snapshot);
  os << "\n";
}

// 4 registros por fila
inline void print_regs(std::ostream& os, const RegFile& regs) {
  for (std::size_t i = 0; i < regs.size(); ++i) {
    os << std::left << std::setw(4) << ("$" + std::to_string(i)) << std::right
       << std::setw(11) << regs[i] << ((i % 4 == 3) ? "\n" : "  ");
  }
}

inline void print_memory(std::ostream& os, const std::map<Addr, Word>& mem) {
  if (mem.empty()) { os << "(memoria vacía)\n"; return; }
  for (const auto& [addr, v] : mem) {
    print_addr(os, addr);
    os << " : ";
    print_hex8(os, v);
    os << "\n";
  }
}

// PC = 0x00400014  | Steps executed: 5  | Halted: false
inline void print_state_line(std::ostream& os, const MachineSnapshot& s) {
  os << "PC = ";
  print_addr(os, s.pc);
  os << "  | Steps executed: " << s.step_count
     << "  | Halted: " << (s.halted ? "true" : "false") << "\n";
}

} // namespace mipsim::dbg
