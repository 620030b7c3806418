// =============================================================================
// Unit tests for rpc_forwarder.hpp
// Tests: bidirectional pump over socketpairs, forwarding to a live bridge,
//        dropped connections on failed resolution, peer filter
// =============================================================================
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

#include <sys/socket.h>
#include <unistd.h>

#include "rpc_forwarder.hpp"
#include "bridge_server.hpp"
#include "fake_device.hpp"

using namespace phonebridge;
using phonebridge::testing_support::FakeDevice;
using phonebridge::testing_support::kFakeHierarchyText;

namespace {

std::string recvSome(int fd, int timeout_ms = 2000) {
    if (net::wait_readable(fd, timeout_ms) != net::WaitResult::Ready) return "";
    char buf[1024];
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    return n > 0 ? std::string(buf, static_cast<size_t>(n)) : std::string();
}

// Reads one '\n'-terminated line; nullopt on EOF or timeout
std::optional<std::string> readLine(int fd, int timeout_ms = 3000) {
    std::string line;
    char c = 0;
    while (net::wait_readable(fd, timeout_ms) == net::WaitResult::Ready) {
        ssize_t n = ::recv(fd, &c, 1, 0);
        if (n <= 0) return std::nullopt;
        if (c == '\n') return line;
        line += c;
    }
    return std::nullopt;
}

bool closedByPeer(int fd, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buf[256];
    while (std::chrono::steady_clock::now() < deadline) {
        if (net::wait_readable(fd, 50) != net::WaitResult::Ready) continue;
        if (::recv(fd, buf, sizeof(buf), 0) <= 0) return true;
    }
    return false;
}

ForwardTarget testTarget() {
    ForwardTarget t;
    t.device_id = "emulator-5554";
    t.device_port = 45678;
    t.connect_timeout_ms = 500;
    return t;
}

RpcForwarder::Options fastForwarder() {
    RpcForwarder::Options o;
    o.port = 0;
    o.accept_poll_ms = 50;
    o.pump_wake_ms = 50;
    return o;
}

} // namespace

// ---------------------------------------------------------------------------
// pump_bidirectional
// ---------------------------------------------------------------------------
TEST(PumpTest, RelaysBothWaysUntilClose) {
    int local[2];
    int remote[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, local), 0);
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, remote), 0);
    net::UniqueSocket user(local[0]), a(local[1]), b(remote[0]), device(remote[1]);

    std::atomic<bool> stop{false};
    PumpStats stats;
    std::thread pump([&] { stats = pump_bidirectional(a.get(), b.get(), stop, 50); });

    ASSERT_TRUE(net::write_all(user.get(), std::string("ping\n")));
    EXPECT_EQ(recvSome(device.get()), "ping\n");
    ASSERT_TRUE(net::write_all(device.get(), std::string("pong!\n")));
    EXPECT_EQ(recvSome(user.get()), "pong!\n");

    device.reset();
    pump.join();
    EXPECT_EQ(stats.local_to_remote, 5u);
    EXPECT_EQ(stats.remote_to_local, 6u);
}

TEST(PumpTest, StopFlagEndsIdlePump) {
    int local[2];
    int remote[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, local), 0);
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, remote), 0);
    net::UniqueSocket user(local[0]), a(local[1]), b(remote[0]), device(remote[1]);

    std::atomic<bool> stop{false};
    std::thread pump([&] { pump_bidirectional(a.get(), b.get(), stop, 20); });
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    stop.store(true);
    pump.join();
    SUCCEED();
}

// ---------------------------------------------------------------------------
// RpcForwarder
// ---------------------------------------------------------------------------
class RpcForwarderTest : public ::testing::Test {
protected:
    FakeDevice device;
    AutomationDispatcher dispatcher{device};
    std::unique_ptr<BridgeServer> bridge;
    std::thread bridge_thread;

    ConnectionBroker broker;
    std::unique_ptr<RpcForwarder> forwarder;
    std::thread forwarder_thread;
    std::atomic<int> connector_calls{0};

    void startBridge() {
        BridgeServer::Options opts;
        opts.port = 0;
        opts.accept_poll_ms = 50;
        opts.read_poll_ms = 50;
        bridge = std::make_unique<BridgeServer>(dispatcher, opts);
        ASSERT_TRUE(bridge->start().is_ok());
        bridge_thread = std::thread([this] { bridge->run(); });
    }

    // Tunnel strategy whose every hostname resolves to the local bridge
    void addTunnelToBridge() {
        int port = bridge->port();
        broker.add_strategy(std::make_unique<TunnelHostStrategy>(
            ".coredevice.local", nullptr,
            [this, port](const std::string&, int, int timeout_ms) {
                ++connector_calls;
                return net::connect_with_timeout("127.0.0.1", port, timeout_ms);
            }));
    }

    void startForwarder(RpcForwarder::PeerFilter filter = nullptr) {
        forwarder = std::make_unique<RpcForwarder>(broker, testTarget(), fastForwarder());
        if (filter) forwarder->set_peer_filter(std::move(filter));
        ASSERT_TRUE(forwarder->start().is_ok());
        ASSERT_GT(forwarder->port(), 0);
        forwarder_thread = std::thread([this] { forwarder->run(); });
    }

    net::UniqueSocket connectLocal() {
        auto s = net::connect_with_timeout("127.0.0.1", forwarder->port(), 2000);
        EXPECT_TRUE(s.is_ok());
        return s.is_ok() ? std::move(s).value() : net::UniqueSocket();
    }

    void TearDown() override {
        if (forwarder) forwarder->request_stop();
        if (forwarder_thread.joinable()) forwarder_thread.join();
        if (bridge) bridge->request_stop();
        if (bridge_thread.joinable()) bridge_thread.join();
    }
};

TEST_F(RpcForwarderTest, ForwardsRequestsToBridge) {
    startBridge();
    addTunnelToBridge();
    startForwarder();

    net::UniqueSocket client = connectLocal();
    ASSERT_TRUE(client.valid());
    ASSERT_TRUE(net::write_all(client.get(), std::string("{\"id\":1,\"method\":\"get_tree\"}\n")));

    auto line = readLine(client.get());
    ASSERT_TRUE(line.has_value());
    json resp = json::parse(*line);
    EXPECT_EQ(resp["id"], 1);
    EXPECT_EQ(resp["result"]["tree"], kFakeHierarchyText);

    ASSERT_TRUE(net::write_all(client.get(),
        std::string("{\"id\":2,\"method\":\"tap\",\"params\":{\"x\":3,\"y\":4}}\n")));
    auto second = readLine(client.get());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(json::parse(*second)["id"], 2);
    EXPECT_EQ(device.actions(), std::vector<std::string>({"tap 3 4"}));
    EXPECT_EQ(connector_calls.load(), 1);
}

TEST_F(RpcForwarderTest, EachLocalConnectionGetsItsOwnRemote) {
    startBridge();
    addTunnelToBridge();
    startForwarder();

    net::UniqueSocket first = connectLocal();
    net::UniqueSocket second = connectLocal();
    ASSERT_TRUE(net::write_all(first.get(), std::string("{\"id\":1,\"method\":\"get_tree\"}\n")));
    ASSERT_TRUE(net::write_all(second.get(), std::string("{\"id\":2,\"method\":\"get_tree\"}\n")));

    auto a = readLine(first.get());
    auto b = readLine(second.get());
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(json::parse(*a)["id"], 1);
    EXPECT_EQ(json::parse(*b)["id"], 2);
    EXPECT_EQ(connector_calls.load(), 2);
}

TEST_F(RpcForwarderTest, FailedResolutionDropsOnlyThatConnection) {
    broker.add_strategy(std::make_unique<AdbForwardStrategy>(""));
    startForwarder();

    net::UniqueSocket first = connectLocal();
    EXPECT_TRUE(closedByPeer(first.get()));

    // Still accepting afterwards
    net::UniqueSocket second = connectLocal();
    ASSERT_TRUE(second.valid());
    EXPECT_TRUE(closedByPeer(second.get()));
}

TEST_F(RpcForwarderTest, RejectedPeerNeverResolves) {
    startBridge();
    addTunnelToBridge();
    startForwarder([](const sockaddr_storage&) { return false; });

    net::UniqueSocket client = connectLocal();
    EXPECT_TRUE(closedByPeer(client.get()));
    EXPECT_EQ(connector_calls.load(), 0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
