#include "memory.hpp"

namespace mipsim {

Word Memory::read32(Addr addr) const {
  auto it = mem_.find(addr);
  if (it == mem_.end()) return 0;
  return it->second;
}

void Memory::write32(Addr addr, Word value) {
  mem_[addr] = value;
}

std::map<Addr, Word> Memory::nonzero() const {
  std::map<Addr, Word> out;
  for (const auto& [addr, value] : mem_) {
    if (value != 0) out.emplace(addr, value);
  }
  return out;
}

} // namespace mipsim
