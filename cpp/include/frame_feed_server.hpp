#pragma once

#include <boost/asio.hpp>
#include <memory>
#include <string>
#include <vector>
#include <mutex>

#include "generation_frame.hpp"

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace life {

// TCP server that pushes every generation to subscribers as JSON lines
class FrameFeedServer : public std::enable_shared_from_this<FrameFeedServer> {
public:
    // Port 0 binds an ephemeral port, see port()
    FrameFeedServer(asio::io_context& ioc, unsigned short port);

    void start();
    void stop();
    void broadcast_frame(const GenerationFrame& frame);

    unsigned short port() const { return port_; }
    std::size_t client_count();

private:
    void accept();
    void add_subscriber(tcp::socket socket);

    // Writes one JSON line, false if the subscriber is gone
    static bool send_line(tcp::socket& socket, const std::string& line);

    tcp::acceptor acceptor_;
    unsigned short port_;
    std::vector<std::shared_ptr<tcp::socket>> clients_;
    std::mutex clients_mutex_;
};

} // namespace life
