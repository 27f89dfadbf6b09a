#include "cell.hpp"
#include <stdexcept>

namespace life {

NeighbourCount NeighbourCount::from_byte(std::uint8_t byte) {
    if (byte > MAX) {
        throw std::out_of_range("byte out of range for neighbour count");
    }
    return NeighbourCount(byte);
}

Cell Cell::from_byte(std::uint8_t byte) {
    if (byte > MAX) {
        throw std::out_of_range("byte out of range for cell");
    }
    return Cell(byte);
}

NeighbourCount Cell::neighbours() const {
    return NeighbourCount::from_byte(static_cast<std::uint8_t>((state_ & COUNT_MASK) >> 1));
}

bool Cell::try_increment() {
    auto count = neighbours().get();
    if (count >= NeighbourCount::MAX) {
        return false;
    }
    store_count(static_cast<std::uint8_t>(count + 1));
    return true;
}

bool Cell::try_decrement() {
    auto count = neighbours().get();
    if (count <= NeighbourCount::MIN) {
        return false;
    }
    store_count(static_cast<std::uint8_t>(count - 1));
    return true;
}

void Cell::store_count(std::uint8_t count) {
    // Keep the alive bit, replace the count bits
    state_ = static_cast<std::uint8_t>((state_ & ~COUNT_MASK) | (count << 1));
}

} // namespace life
