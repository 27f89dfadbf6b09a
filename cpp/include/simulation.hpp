#pragma once

#include <boost/asio.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <random>

#include "canvas.hpp"
#include "config.hpp"
#include "generation_frame.hpp"
#include "world.hpp"

namespace asio = boost::asio;

namespace life {

// Drives a World one generation per timer tick on an io_context
class Simulation : public std::enable_shared_from_this<Simulation> {
public:
    using FrameCallback = std::function<void(const GenerationFrame&)>;
    using DoneCallback = std::function<void(std::uint64_t generations)>;

    Simulation(asio::io_context& ioc, const Config& config, std::ostream& out);

    void set_frame_callback(FrameCallback callback) { frame_callback_ = std::move(callback); }
    void set_done_callback(DoneCallback callback) { done_callback_ = std::move(callback); }

    void start();
    void stop();

    std::uint64_t generation() const { return generation_; }
    std::uint64_t seed() const { return seed_; }
    bool finished() const { return finished_; }
    const World& world() const { return world_; }
    const ConsoleCanvas& canvas() const { return canvas_; }

private:
    void schedule_tick();
    void tick();
    void render();
    void finish();

    asio::steady_timer timer_;
    Config config_;
    std::ostream& out_;

    std::uint64_t seed_;
    std::mt19937_64 rng_;
    World world_;
    ConsoleCanvas canvas_;

    FrameCallback frame_callback_;
    DoneCallback done_callback_;
    std::uint64_t generation_;
    bool running_;
    bool finished_;
};

} // namespace life
