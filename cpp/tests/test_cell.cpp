/// @file test_cell.cpp
/// @brief Unit tests for the packed cell state

#include <gtest/gtest.h>
#include <stdexcept>

#include "cell.hpp"

namespace life {
namespace test {

// ============================================================================
// NeighbourCount Tests
// ============================================================================

TEST(NeighbourCountTest, AcceptsFullRange) {
    for (std::uint8_t b = NeighbourCount::MIN; b <= NeighbourCount::MAX; ++b) {
        EXPECT_EQ(NeighbourCount::from_byte(b).get(), b);
    }
}

TEST(NeighbourCountTest, RejectsAboveMax) {
    EXPECT_THROW(NeighbourCount::from_byte(9), std::out_of_range);
    EXPECT_THROW(NeighbourCount::from_byte(255), std::out_of_range);
}

// ============================================================================
// Cell Tests
// ============================================================================

TEST(CellTest, DefaultIsEmpty) {
    Cell cell;
    EXPECT_TRUE(cell.is_empty());
    EXPECT_FALSE(cell.is_alive());
    EXPECT_EQ(cell.neighbours().get(), 0);
}

TEST(CellTest, FromByteRange) {
    EXPECT_NO_THROW(Cell::from_byte(Cell::MAX));
    EXPECT_TRUE(Cell::from_byte(Cell::MAX).is_alive());
    EXPECT_THROW(Cell::from_byte(0x20), std::out_of_range);
}

TEST(CellTest, FromByteDecodesFields) {
    // alive with 3 neighbours
    Cell cell = Cell::from_byte(0b00000111);
    EXPECT_TRUE(cell.is_alive());
    EXPECT_EQ(cell.neighbours().get(), 3);
}

TEST(CellTest, AliveBitIndependentOfCount) {
    Cell cell;
    cell.try_increment();
    cell.try_increment();
    cell.set_alive();
    EXPECT_TRUE(cell.is_alive());
    EXPECT_EQ(cell.neighbours().get(), 2);

    cell.set_dead();
    EXPECT_FALSE(cell.is_alive());
    EXPECT_EQ(cell.neighbours().get(), 2);
    EXPECT_FALSE(cell.is_empty());
}

TEST(CellTest, CountChangesKeepAliveBit) {
    Cell cell;
    cell.set_alive();
    EXPECT_TRUE(cell.try_increment());
    EXPECT_TRUE(cell.is_alive());
    EXPECT_TRUE(cell.try_decrement());
    EXPECT_TRUE(cell.is_alive());
    EXPECT_EQ(cell.neighbours().get(), 0);
}

TEST(CellTest, IncrementSaturatesAtEight) {
    Cell cell;
    for (int n = 0; n < 8; ++n) {
        EXPECT_TRUE(cell.try_increment());
    }
    EXPECT_EQ(cell.neighbours().get(), 8);

    Cell before = cell;
    EXPECT_FALSE(cell.try_increment());
    EXPECT_EQ(cell, before);
}

TEST(CellTest, DecrementStopsAtZero) {
    Cell cell;
    cell.set_alive();
    Cell before = cell;
    EXPECT_FALSE(cell.try_decrement());
    EXPECT_EQ(cell, before);
}

TEST(CellTest, DecrementFromEight) {
    Cell cell = Cell::from_byte(8 << 1);
    EXPECT_TRUE(cell.try_decrement());
    EXPECT_EQ(cell.neighbours().get(), 7);
}

} // namespace test
} // namespace life
