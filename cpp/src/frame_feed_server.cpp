#include "frame_feed_server.hpp"
#include <algorithm>
#include <iostream>

namespace life {

FrameFeedServer::FrameFeedServer(asio::io_context& ioc, unsigned short port)
    : acceptor_(ioc, tcp::endpoint(tcp::v4(), port))
    , port_(acceptor_.local_endpoint().port())
{
    std::cout << "[FrameFeedServer] Listening on port " << port_ << std::endl;
}

void FrameFeedServer::start() {
    accept();
}

void FrameFeedServer::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        std::cerr << "[FrameFeedServer] Close error: " << ec.message() << std::endl;
    }

    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (auto& socket : clients_) {
        boost::system::error_code ignored;
        socket->shutdown(tcp::socket::shutdown_both, ignored);
        socket->close(ignored);
    }
    clients_.clear();
}

void FrameFeedServer::accept() {
    // Move-accept: the socket is created by the acceptor and handed over
    acceptor_.async_accept(
        [self = shared_from_this()](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !self->acceptor_.is_open()) {
                return;
            }

            if (ec) {
                std::cerr << "[FrameFeedServer] Accept error: " << ec.message() << std::endl;
            } else {
                self->add_subscriber(std::move(socket));
            }

            self->accept();
        }
    );
}

void FrameFeedServer::add_subscriber(tcp::socket socket) {
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        // Peer went away between accept and registration
        return;
    }

    std::size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_.push_back(std::make_shared<tcp::socket>(std::move(socket)));
        total = clients_.size();
    }
    std::cout << "[FrameFeedServer] Subscriber " << endpoint
              << " joined (" << total << " connected)" << std::endl;
}

std::size_t FrameFeedServer::client_count() {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

bool FrameFeedServer::send_line(tcp::socket& socket, const std::string& line) {
    boost::system::error_code ec;
    asio::write(socket, asio::buffer(line), ec);
    if (ec) {
        std::cout << "[FrameFeedServer] Dropping subscriber: " << ec.message() << std::endl;
        return false;
    }
    return true;
}

void FrameFeedServer::broadcast_frame(const GenerationFrame& frame) {
    const std::string line = frame.to_json() + "\n";

    std::lock_guard<std::mutex> lock(clients_mutex_);
    auto alive = std::stable_partition(clients_.begin(), clients_.end(),
        [&line](const std::shared_ptr<tcp::socket>& socket) {
            return send_line(*socket, line);
        });
    clients_.erase(alive, clients_.end());
}

} // namespace life
