/// @file test_frame_feed_server.cpp
/// @brief Loopback tests for the JSON frame feed

#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <chrono>
#include <istream>
#include <memory>
#include <string>

#include "frame_feed_server.hpp"

namespace life {
namespace test {

class FrameFeedServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_shared<FrameFeedServer>(ioc, 0);
        server->start();
    }

    void TearDown() override {
        server->stop();
        ioc.run_for(std::chrono::milliseconds(10));
    }

    // Drive the acceptor until the expected number of clients is registered
    bool wait_for_clients(std::size_t expected) {
        for (int n = 0; n < 200 && server->client_count() != expected; ++n) {
            ioc.run_for(std::chrono::milliseconds(10));
        }
        return server->client_count() == expected;
    }

    std::unique_ptr<tcp::socket> connect_client() {
        auto socket = std::make_unique<tcp::socket>(ioc);
        socket->connect(tcp::endpoint(asio::ip::address_v4::loopback(), server->port()));
        return socket;
    }

    static std::string read_line(tcp::socket& socket) {
        asio::streambuf buf;
        asio::read_until(socket, buf, '\n');
        std::istream is(&buf);
        std::string line;
        std::getline(is, line);
        return line;
    }

    static GenerationFrame sample_frame(std::uint64_t generation) {
        GenerationFrame frame;
        frame.generation = generation;
        frame.width = 2;
        frame.height = 1;
        frame.live = 1;
        frame.rows = {"@."};
        return frame;
    }

    asio::io_context ioc;
    std::shared_ptr<FrameFeedServer> server;
};

TEST_F(FrameFeedServerTest, BindsEphemeralPort) {
    EXPECT_NE(server->port(), 0);
    EXPECT_EQ(server->client_count(), 0u);
}

TEST_F(FrameFeedServerTest, BroadcastReachesEveryClient) {
    auto first = connect_client();
    auto second = connect_client();
    ASSERT_TRUE(wait_for_clients(2));

    auto frame = sample_frame(7);
    server->broadcast_frame(frame);

    EXPECT_EQ(read_line(*first), frame.to_json());
    EXPECT_EQ(read_line(*second), frame.to_json());
}

TEST_F(FrameFeedServerTest, FramesArriveInOrder) {
    auto client = connect_client();
    ASSERT_TRUE(wait_for_clients(1));

    server->broadcast_frame(sample_frame(1));
    server->broadcast_frame(sample_frame(2));

    asio::streambuf buf;
    asio::read_until(*client, buf, '\n');
    std::istream is(&buf);
    std::string line;
    std::getline(is, line);
    EXPECT_EQ(line.rfind("{\"generation\":1,", 0), 0u);

    asio::read_until(*client, buf, '\n');
    std::getline(is, line);
    EXPECT_EQ(line.rfind("{\"generation\":2,", 0), 0u);
}

TEST_F(FrameFeedServerTest, DisconnectedClientIsDropped) {
    auto client = connect_client();
    ASSERT_TRUE(wait_for_clients(1));

    client->close();

    // The first write after a peer close can still succeed; keep pushing
    // until the reset surfaces
    for (int n = 0; n < 50 && server->client_count() > 0; ++n) {
        server->broadcast_frame(sample_frame(n));
        ioc.run_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(server->client_count(), 0u);
}

TEST_F(FrameFeedServerTest, SurvivorKeepsReceivingAfterDrop) {
    auto leaving = connect_client();
    auto staying = connect_client();
    ASSERT_TRUE(wait_for_clients(2));

    leaving->close();
    for (int n = 0; n < 50 && server->client_count() > 1; ++n) {
        server->broadcast_frame(sample_frame(n));
        ioc.run_for(std::chrono::milliseconds(10));
    }
    ASSERT_EQ(server->client_count(), 1u);

    // Drain whatever arrived while the dropped peer was being detected
    asio::streambuf buf;
    server->broadcast_frame(sample_frame(1000));
    std::string line;
    std::istream is(&buf);
    do {
        asio::read_until(*staying, buf, '\n');
        std::getline(is, line);
    } while (line.rfind("{\"generation\":1000,", 0) != 0);

    EXPECT_EQ(line, sample_frame(1000).to_json());
}

} // namespace test
} // namespace life
