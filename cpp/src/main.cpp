#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <csignal>

#include <boost/asio.hpp>

#include "config.hpp"
#include "frame_feed_server.hpp"
#include "simulation.hpp"

namespace asio = boost::asio;

static std::atomic<bool> running(true);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        running = false;
    }
}

int main(int argc, char* argv[]) {
    life::Config config;
    try {
        config = life::Config::parse(argc, argv);
    } catch (const life::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n\n"
                  << e.usage() << std::flush;
        return 2;
    }

    if (config.show_help) {
        std::cout << config.usage;
        return 0;
    }

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        asio::io_context ioc;

        auto simulation = std::make_shared<life::Simulation>(ioc, config, std::cout);

        // Optional JSON frame feed for external viewers
        std::shared_ptr<life::FrameFeedServer> feed;
        if (config.feed_port != 0) {
            feed = std::make_shared<life::FrameFeedServer>(ioc, config.feed_port);
            feed->start();
            simulation->set_frame_callback([feed](const life::GenerationFrame& frame) {
                feed->broadcast_frame(frame);
            });
        }

        simulation->start();

        // The simulation is strictly sequential, so one thread drives the loop
        while (running && !simulation->finished()) {
            ioc.run_for(std::chrono::milliseconds(100));
        }

        if (!running) {
            std::cout << "\nShutting down gracefully..." << std::endl;
        }
        simulation->stop();

        if (feed) {
            feed->stop();
        }
        ioc.stop();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
