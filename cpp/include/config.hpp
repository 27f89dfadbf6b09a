#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace life {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what, std::string usage = std::string())
        : std::runtime_error(what)
        , usage_(std::move(usage))
    {
    }

    // Usage text to show alongside the message, empty if unknown
    const std::string& usage() const { return usage_; }

private:
    std::string usage_;
};

// Runtime settings. Sources in order of precedence:
//   1. command line (--width 64)
//   2. environment  (LIFE_WIDTH=64)
//   3. defaults below
// The environment path exists so a container entrypoint can be tuned
// without rewriting its argument list.
struct Config {
    // Upper bound on width * height, one byte per cell in each of the
    // world's two buffers plus the canvas
    static constexpr std::uint64_t MAX_CELLS = std::uint64_t(1) << 26;

    std::size_t width = 96;
    std::size_t height = 96;
    std::uint64_t generations = 51;
    std::uint64_t seed = 0;
    bool seed_given = false;
    bool render = false;
    unsigned interval_ms = 0;
    unsigned short feed_port = 0;  // 0 disables the frame feed

    bool show_help = false;
    std::string usage;

    // Throws ConfigError on malformed or out-of-range values. The error
    // carries the usage text.
    static Config parse(int argc, const char* const argv[]);

    // seed if one was given, otherwise a fresh one from std::random_device
    std::uint64_t resolve_seed() const;
};

} // namespace life
