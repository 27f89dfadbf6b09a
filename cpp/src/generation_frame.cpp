#include "generation_frame.hpp"
#include "world.hpp"
#include <sstream>

namespace life {

GenerationFrame GenerationFrame::capture(const World& world, std::uint64_t generation, std::size_t changed) {
    GenerationFrame frame;
    frame.generation = generation;
    frame.width = world.width();
    frame.height = world.height();
    frame.live = world.live_count();
    frame.changed = changed;
    frame.timestamp = std::chrono::system_clock::now();
    frame.rows = world.rows();
    return frame;
}

std::string GenerationFrame::to_json() const {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()
    ).count();

    // Rows only ever contain '@' and '.', nothing needs escaping
    std::ostringstream oss;
    oss << "{\"generation\":" << generation << ","
        << "\"width\":" << width << ","
        << "\"height\":" << height << ","
        << "\"live\":" << live << ","
        << "\"changed\":" << changed << ","
        << "\"timestamp\":" << ms << ","
        << "\"rows\":[";
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << "\"" << rows[i] << "\"";
    }
    oss << "]}";

    return oss.str();
}

} // namespace life
