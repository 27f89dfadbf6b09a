#include "world.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace life {

World::World(std::size_t width, std::size_t height)
    : width_(width)
    , height_(height)
{
    if (width == 0 || height == 0) {
        throw std::invalid_argument("world dimensions must be non-zero");
    }
    if (width > std::numeric_limits<std::size_t>::max() / height) {
        throw std::invalid_argument("world dimensions overflow the cell count");
    }
    cells_.resize(width * height);
    temp_cells_.resize(width * height);
}

std::size_t World::next_generation(Canvas& canvas) {
    std::copy(cells_.begin(), cells_.end(), temp_cells_.begin());

    std::size_t changed = 0;
    for (std::size_t i = 0; i < height_; ++i) {
        for (std::size_t j = 0; j < width_; ++j) {
            const Cell current = temp_cells_[i * width_ + j];

            // Skim past dead cells with no neighbours
            if (current.is_empty()) {
                continue;
            }

            auto count = current.neighbours().get();
            if (current.is_alive()) {
                if (count != 2 && count != 3) {
                    clear_cell(i, j);
                    canvas.draw_pixel(i, j, kOffColour);
                    ++changed;
                }
            } else if (count == 3) {
                set_cell(i, j);
                canvas.draw_pixel(i, j, kOnColour);
                ++changed;
            }
        }
    }

    return changed;
}

void World::draw(Canvas& canvas) const {
    for (std::size_t i = 0; i < height_; ++i) {
        for (std::size_t j = 0; j < width_; ++j) {
            canvas.draw_pixel(i, j, cells_[i * width_ + j].is_alive() ? kOnColour : kOffColour);
        }
    }
}

void World::set_cell(std::size_t row, std::size_t col) {
    Cell& cell = cells_[index(row, col)];
    if (cell.is_alive()) {
        return;
    }
    cell.set_alive();
    raise_neighbours(row, col);
}

void World::clear_cell(std::size_t row, std::size_t col) {
    Cell& cell = cells_[index(row, col)];
    if (!cell.is_alive()) {
        return;
    }
    cell.set_dead();
    lower_neighbours(row, col);
}

bool World::is_alive(std::size_t row, std::size_t col) const {
    return cells_[index(row, col)].is_alive();
}

NeighbourCount World::neighbours(std::size_t row, std::size_t col) const {
    return cells_[index(row, col)].neighbours();
}

std::size_t World::live_count() const {
    return static_cast<std::size_t>(std::count_if(
        cells_.begin(), cells_.end(), [](const Cell& c) { return c.is_alive(); }));
}

std::vector<std::string> World::rows() const {
    std::vector<std::string> out;
    out.reserve(height_);
    for (std::size_t i = 0; i < height_; ++i) {
        std::string row(width_, '.');
        for (std::size_t j = 0; j < width_; ++j) {
            if (cells_[i * width_ + j].is_alive()) {
                row[j] = '@';
            }
        }
        out.push_back(std::move(row));
    }
    return out;
}

std::string World::to_string() const {
    std::string out;
    out.reserve(height_ * (width_ + 1));
    for (const auto& row : rows()) {
        out += row;
        out += '\n';
    }
    return out;
}

std::size_t World::index(std::size_t row, std::size_t col) const {
    if (row >= height_ || col >= width_) {
        throw std::out_of_range(
            "cell (" + std::to_string(row) + ", " + std::to_string(col) + ") outside world");
    }
    return row * width_ + col;
}

void World::raise_neighbours(std::size_t row, std::size_t col) {
    for_each_neighbour(row, col, [](Cell& n) { n.try_increment(); });
}

void World::lower_neighbours(std::size_t row, std::size_t col) {
    for_each_neighbour(row, col, [](Cell& n) { n.try_decrement(); });
}

} // namespace life
