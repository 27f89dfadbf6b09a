#pragma once

#include <cstdint>

namespace life {

// Number of live neighbours around a cell, always in [MIN, MAX]
class NeighbourCount {
public:
    static constexpr std::uint8_t MAX = 8;
    static constexpr std::uint8_t MIN = 0;

    // Throws std::out_of_range for bytes above MAX
    static NeighbourCount from_byte(std::uint8_t byte);

    std::uint8_t get() const { return value_; }

    bool operator==(const NeighbourCount& other) const { return value_ == other.value_; }
    bool operator!=(const NeighbourCount& other) const { return value_ != other.value_; }

private:
    explicit NeighbourCount(std::uint8_t value) : value_(value) {}

    std::uint8_t value_;
};

// Packed cell state:
//   bit 0     alive flag
//   bits 1-4  live neighbour count
class Cell {
public:
    static constexpr std::uint8_t MAX = 0b00011111;
    static constexpr std::uint8_t MIN = 0;

    Cell() = default;

    // Throws std::out_of_range for bytes above MAX
    static Cell from_byte(std::uint8_t byte);

    bool is_alive() const { return (state_ & ALIVE_BIT) != 0; }

    // Dead and no neighbours; next_generation skips these
    bool is_empty() const { return state_ == 0; }

    void set_alive() { state_ |= ALIVE_BIT; }
    void set_dead() { state_ &= static_cast<std::uint8_t>(~ALIVE_BIT); }

    NeighbourCount neighbours() const;

    bool try_increment();
    bool try_decrement();

    bool operator==(const Cell& other) const { return state_ == other.state_; }
    bool operator!=(const Cell& other) const { return state_ != other.state_; }

private:
    static constexpr std::uint8_t ALIVE_BIT = 0x01;
    static constexpr std::uint8_t COUNT_MASK = 0x1e;

    explicit Cell(std::uint8_t state) : state_(state) {}

    void store_count(std::uint8_t count);

    std::uint8_t state_ = 0;
};

} // namespace life
