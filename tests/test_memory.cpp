#include "memory.hpp"
#include <gtest/gtest.h>

using mipsim::Memory;

TEST(Memory, UnwrittenReadsZero) {
  Memory m;
  EXPECT_EQ(m.read32(0), 0u);
  EXPECT_EQ(m.read32(0xFFFFFFFCu), 0u);
  EXPECT_EQ(m.size(), 0u);
}

TEST(Memory, WriteThenRead) {
  Memory m;
  m.write32(0x10010000u, 0xCAFEBABEu);
  EXPECT_EQ(m.read32(0x10010000u), 0xCAFEBABEu);
  // Sin alineamiento ni solapamiento: cada dirección es una palabra independiente
  m.write32(0x10010001u, 7u);
  EXPECT_EQ(m.read32(0x10010000u), 0xCAFEBABEu);
  EXPECT_EQ(m.read32(0x10010001u), 7u);
}

TEST(Memory, NonzeroIsSortedAndFiltered) {
  Memory m;
  m.write32(0x20, 2);
  m.write32(0x08, 1);
  m.write32(0x10, 0);
  const auto nz = m.nonzero();
  ASSERT_EQ(nz.size(), 2u);
  EXPECT_EQ(nz.begin()->first, 0x08u);
  EXPECT_EQ(nz.rbegin()->first, 0x20u);
  EXPECT_EQ(m.size(), 3u);
}

TEST(Memory, SnapshotIsACopy) {
  Memory m;
  m.write32(4, 9);
  auto nz = m.nonzero();
  m.write32(4, 10);
  EXPECT_EQ(nz.at(4), 9u);
}
