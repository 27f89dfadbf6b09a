#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace life {

class World;

struct GenerationFrame {
    std::uint64_t generation = 0;
    std::size_t width = 0;
    std::size_t height = 0;
    std::size_t live = 0;
    std::size_t changed = 0;
    std::chrono::system_clock::time_point timestamp;
    std::vector<std::string> rows;

    // Snapshot the world as it stands after `generation` steps
    static GenerationFrame capture(const World& world, std::uint64_t generation, std::size_t changed);

    // Fraction of the grid that is alive
    double density() const {
        return width * height == 0 ? 0.0 : static_cast<double>(live) / static_cast<double>(width * height);
    }

    // Serialize to a single-line JSON object for the frame feed
    std::string to_json() const;
};

} // namespace life
