#include "simulator.hpp"
#include "debug_io.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace mipsim;

namespace {

// 5 + 4 + 3 + 2 + 1 en $9, guardado en mem[0] y leído en $10
const char* kSumLoop =
    "0x20080005\n"   // addi $8, $0, 5
    "0x20090000\n"   // addi $9, $0, 0
    "0x01284820\n"   // loop: add $9, $9, $8
    "0x2108FFFF\n"   // addi $8, $8, -1
    "0x1500FFFD\n"   // bne $8, $0, loop
    "0xAC090000\n"   // sw $9, 0($0)
    "0x8C0A0000\n";  // lw $10, 0($0)

constexpr std::size_t kSumLoopSteps = 2 + 5 * 3 + 2;

} // namespace

TEST(Simulator, UnloadedSessionIsEmptyProgram) {
  Simulator sim;
  EXPECT_FALSE(sim.is_loaded());
  EXPECT_TRUE(sim.decoded().empty());
  const auto r = sim.step();
  EXPECT_EQ(r.status, StepStatus::PcOutOfRange);
  EXPECT_EQ(r.pc, cfg::kDefaultBasePc);
}

TEST(Simulator, LoadBuildsListing) {
  Simulator sim;
  EXPECT_EQ(sim.load_from_text(kSumLoop, 0x1000), 7u);
  EXPECT_TRUE(sim.is_loaded());
  EXPECT_EQ(sim.base_pc(), 0x1000u);
  ASSERT_EQ(sim.decoded().size(), 7u);
  EXPECT_EQ(sim.decoded()[4].pc, 0x1010u);
  EXPECT_EQ(format_decoded(sim.decoded()[4].decoded), "I-type: bne rs=$8 rt=$0 imm=-3");
  EXPECT_EQ(sim.snapshot().pc, 0x1000u);
}

TEST(Simulator, SumLoopRunsToEnd) {
  Simulator sim;
  sim.load_from_text(kSumLoop);
  const auto acts = sim.run_until_end();
  ASSERT_EQ(acts.size(), kSumLoopSteps + 1);
  EXPECT_EQ(acts.back().status, StepStatus::PcOutOfRange);

  const auto s = sim.snapshot();
  EXPECT_TRUE(s.halted);
  EXPECT_EQ(s.step_count, kSumLoopSteps);
  EXPECT_EQ(s.regs[8], 0u);
  EXPECT_EQ(s.regs[9], 15u);
  EXPECT_EQ(s.regs[10], 15u);
  ASSERT_EQ(s.memory.size(), 1u);
  EXPECT_EQ(s.memory.at(0), 15u);
  EXPECT_EQ(s.pc, cfg::kDefaultBasePc + 7 * 4);
}

TEST(Simulator, TraceAccumulatesAcrossCalls) {
  Simulator sim;
  sim.load_from_text(kSumLoop);
  sim.step();
  sim.run(3);
  sim.run_short();
  EXPECT_EQ(sim.trace().size(), 1u + 3u + 10u);
  EXPECT_EQ(sim.trace()[0].step, 1u);
  EXPECT_EQ(sim.trace()[13].step, 14u);

  const auto tail = sim.recent_trace(4);
  ASSERT_EQ(tail.size(), 4u);
  EXPECT_EQ(tail.front().step, 11u);
  EXPECT_EQ(tail.back().step, 14u);
  EXPECT_EQ(sim.recent_trace(100).size(), 14u);
}

TEST(Simulator, RunLongStopsAtHalt) {
  Simulator sim;
  sim.load_from_text(kSumLoop);
  const auto acts = sim.run_long();
  EXPECT_EQ(acts.size(), kSumLoopSteps + 1);
  EXPECT_TRUE(sim.run_long().empty());
  EXPECT_EQ(sim.step().status, StepStatus::Halted);
  EXPECT_EQ(sim.trace().size(), kSumLoopSteps + 2);
}

TEST(Simulator, ResetDiscardsStateAndTrace) {
  Simulator sim;
  sim.load_from_text(kSumLoop, 0x2000);
  sim.run_until_end();
  ASSERT_TRUE(sim.snapshot().halted);

  sim.reset();
  const auto s = sim.snapshot();
  EXPECT_FALSE(s.halted);
  EXPECT_EQ(s.pc, 0x2000u);
  EXPECT_EQ(s.step_count, 0u);
  EXPECT_TRUE(s.memory.empty());
  for (Word v : s.regs) EXPECT_EQ(v, 0u);
  EXPECT_TRUE(sim.trace().empty());
  EXPECT_EQ(sim.decoded().size(), 7u);

  EXPECT_EQ(sim.run_until_end().size(), kSumLoopSteps + 1);
}

TEST(Simulator, ReloadReplacesProgram) {
  Simulator sim;
  sim.load_from_text(kSumLoop);
  sim.run(4);
  sim.load({0x20010007u});  // addi $1, $0, 7
  EXPECT_TRUE(sim.trace().empty());
  EXPECT_EQ(sim.decoded().size(), 1u);
  sim.run_short();
  EXPECT_EQ(sim.cpu().get_reg(1), 7u);
  EXPECT_EQ(sim.cpu().get_reg(9), 0u);
}

TEST(Simulator, LoadFromFile) {
  Simulator sim;
  EXPECT_EQ(sim.load_from_file(std::string(MIPSIM_PROGRAMS_DIR) + "/sum_loop.txt"), 7u);
  sim.run_until_end();
  EXPECT_EQ(sim.snapshot().regs[10], 15u);
}

TEST(Simulator, LoadFromMissingFileThrows) {
  Simulator sim;
  EXPECT_THROW(sim.load_from_file("/nonexistent/program.txt"), std::runtime_error);
  EXPECT_FALSE(sim.is_loaded());
}

TEST(DebugIo, StateLineAndStep) {
  Simulator sim;
  sim.load_from_text(kSumLoop);
  const auto r = sim.step();

  std::ostringstream step;
  dbg::print_step(step, r);
  EXPECT_NE(step.str().find("Step 1  PC=0x00400000  I-type: addi rs=$0 rt=$8 imm=5"), std::string::npos);
  EXPECT_NE(step.str().find("{$8: 5}"), std::string::npos);

  std::ostringstream state;
  dbg::print_state_line(state, sim.snapshot());
  EXPECT_EQ(state.str(), "PC = 0x00400004  | Steps executed: 1  | Halted: false\n");
}

TEST(DebugIo, AddressesBeyondThirtyTwoBits) {
  std::ostringstream os;
  dbg::print_addr(os, Addr{0x100000004});
  os << " ";
  dbg::print_addr(os, -8);
  EXPECT_EQ(os.str(), "0x100000004 -0x00000008");
}

TEST(DebugIo, MemoryAccessLine) {
  Simulator sim;
  sim.load_from_text(kSumLoop);
  const auto acts = sim.run_until_end();
  std::ostringstream os;
  dbg::print_step(os, acts[kSumLoopSteps - 2]);  // sw
  EXPECT_NE(os.str().find("mem write @0x00000000 = 0x0000000f"), std::string::npos);
}
