#include "canvas.hpp"
#include <stdexcept>
#include <string>

namespace life {

ConsoleCanvas::ConsoleCanvas(std::size_t width, std::size_t height)
    : width_(width)
    , height_(height)
    , grid_(width * height, kOffColour)
{
}

void ConsoleCanvas::draw_pixel(std::size_t row, std::size_t col, Colour colour) {
    grid_[index(row, col)] = colour;
}

Colour ConsoleCanvas::pixel(std::size_t row, std::size_t col) const {
    return grid_[index(row, col)];
}

void ConsoleCanvas::render(std::ostream& out) const {
    // Build the whole frame first so it hits the stream in one write
    std::string frame;
    frame.reserve(height_ * (width_ * 3 + 1));

    for (std::size_t i = 0; i < height_; ++i) {
        for (std::size_t j = 0; j < width_; ++j) {
            frame += (grid_[i * width_ + j] & 0x1) == kOnColour ? " @ " : " . ";
        }
        frame += '\n';
    }

    out << frame;
}

std::size_t ConsoleCanvas::index(std::size_t row, std::size_t col) const {
    if (row >= height_ || col >= width_) {
        throw std::out_of_range(
            "pixel (" + std::to_string(row) + ", " + std::to_string(col) + ") outside canvas");
    }
    return row * width_ + col;
}

} // namespace life
