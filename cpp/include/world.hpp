#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include "canvas.hpp"
#include "cell.hpp"

namespace life {

// Fixed-size, non-wrapping Game of Life grid.
//
// Every cell carries its own live-neighbour count, which set_cell and
// clear_cell keep current. A generation step then only has to look at
// cells that are alive or have at least one live neighbour.
class World {
public:
    World(std::size_t width, std::size_t height);

    // Makes width*height/2 random picks and turns each picked cell on.
    // The same generator state always yields the same world.
    template <typename Rng>
    static World random(std::size_t width, std::size_t height, Rng& rng);

    // Advance one generation (B3/S23). Only cells that change are drawn
    // onto the canvas. Returns the number of changed cells.
    std::size_t next_generation(Canvas& canvas);

    // Paint the full current state
    void draw(Canvas& canvas) const;

    void set_cell(std::size_t row, std::size_t col);
    void clear_cell(std::size_t row, std::size_t col);

    bool is_alive(std::size_t row, std::size_t col) const;
    NeighbourCount neighbours(std::size_t row, std::size_t col) const;
    std::size_t live_count() const;

    std::size_t width() const { return width_; }
    std::size_t height() const { return height_; }

    std::vector<std::string> rows() const;
    std::string to_string() const;

private:
    std::size_t index(std::size_t row, std::size_t col) const;

    template <typename Fn>
    void for_each_neighbour(std::size_t row, std::size_t col, Fn&& fn);

    void raise_neighbours(std::size_t row, std::size_t col);
    void lower_neighbours(std::size_t row, std::size_t col);

    std::vector<Cell> cells_;
    std::vector<Cell> temp_cells_;
    std::size_t width_;
    std::size_t height_;
};

template <typename Rng>
World World::random(std::size_t width, std::size_t height, Rng& rng) {
    World world(width, height);

    std::uniform_int_distribution<std::size_t> row_dist(0, height - 1);
    std::uniform_int_distribution<std::size_t> col_dist(0, width - 1);

    const std::size_t init_length = (width * height) / 2;
    for (std::size_t n = 0; n < init_length; ++n) {
        auto i = row_dist(rng);
        auto j = col_dist(rng);
        if (!world.is_alive(i, j)) {
            world.set_cell(i, j);
        }
    }

    return world;
}

template <typename Fn>
void World::for_each_neighbour(std::size_t row, std::size_t col, Fn&& fn) {
    for (int di = -1; di <= 1; ++di) {
        for (int dj = -1; dj <= 1; ++dj) {
            if (di == 0 && dj == 0) {
                continue;
            }
            // No wrap-around: positions past an edge do not exist
            if ((di < 0 && row == 0) || (dj < 0 && col == 0)) {
                continue;
            }
            std::size_t ni = row + di;
            std::size_t nj = col + dj;
            if (ni >= height_ || nj >= width_) {
                continue;
            }
            fn(cells_[ni * width_ + nj]);
        }
    }
}

} // namespace life
