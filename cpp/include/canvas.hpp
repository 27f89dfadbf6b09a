#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

namespace life {

using Colour = std::uint8_t;

constexpr Colour kOnColour = 1;   // live cell
constexpr Colour kOffColour = 0;  // dead cell

// Drawing surface that World paints generation changes onto
class Canvas {
public:
    virtual ~Canvas() = default;

    virtual void draw_pixel(std::size_t row, std::size_t col, Colour colour) = 0;
    virtual void render(std::ostream& out) const = 0;
};

class ConsoleCanvas : public Canvas {
public:
    ConsoleCanvas(std::size_t width, std::size_t height);

    void draw_pixel(std::size_t row, std::size_t col, Colour colour) override;
    void render(std::ostream& out) const override;

    Colour pixel(std::size_t row, std::size_t col) const;

    std::size_t width() const { return width_; }
    std::size_t height() const { return height_; }

private:
    std::size_t index(std::size_t row, std::size_t col) const;

    std::size_t width_;
    std::size_t height_;
    std::vector<Colour> grid_;
};

} // namespace life
