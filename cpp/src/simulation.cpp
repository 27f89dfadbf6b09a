#include "simulation.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>

namespace life {

Simulation::Simulation(asio::io_context& ioc, const Config& config, std::ostream& out)
    : timer_(ioc)
    , config_(config)
    , out_(out)
    , seed_(config.resolve_seed())
    , rng_(seed_)
    , world_(World::random(config.width, config.height, rng_))
    , canvas_(config.width, config.height)
    , generation_(0)
    , running_(false)
    , finished_(false)
{
}

void Simulation::start() {
    running_ = true;
    auto initial = GenerationFrame::capture(world_, 0, 0);
    std::cout << "[Simulation] " << initial.width << "x" << initial.height
              << " world, seed " << seed_ << ", " << initial.live
              << " live cells (" << std::fixed << std::setprecision(1)
              << initial.density() * 100.0 << "%), "
              << config_.generations << " generations" << std::endl;

    // Seed population goes onto the canvas before the first step
    world_.draw(canvas_);
    schedule_tick();
}

void Simulation::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    timer_.cancel();
    finish();
}

void Simulation::schedule_tick() {
    timer_.expires_after(std::chrono::milliseconds(config_.interval_ms));
    timer_.async_wait([self = shared_from_this()](boost::system::error_code ec) {
        if (ec == asio::error::operation_aborted || !self->running_) {
            return;
        }
        if (ec) {
            std::cerr << "[Simulation] Timer error: " << ec.message() << std::endl;
            self->stop();
            return;
        }
        self->tick();
    });
}

void Simulation::tick() {
    ++generation_;
    auto changed = world_.next_generation(canvas_);

    if (frame_callback_) {
        frame_callback_(GenerationFrame::capture(world_, generation_, changed));
    }

    if (config_.render) {
        render();
    }

    if (generation_ >= config_.generations) {
        running_ = false;
        finish();
        return;
    }

    schedule_tick();
}

void Simulation::render() {
    // Clear screen and home the cursor
    out_ << "\x1B[2J\x1B[1;1H";
    out_ << "Generation: " << generation_ << "\n";
    canvas_.render(out_);
    out_.flush();
}

void Simulation::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    out_ << "Total generations: " << generation_ << std::endl;

    if (done_callback_) {
        done_callback_(generation_);
    }
}

} // namespace life
