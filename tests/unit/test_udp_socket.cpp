/**
 * @file test_udp_socket.cpp
 * @brief Unit tests for the UDP datagram socket
 */

#include <gtest/gtest.h>
#include <airvol/net/udp_socket.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace airvol::net;
using namespace std::chrono_literals;

class UdpSocketTest : public ::testing::Test {
protected:
    SocketAddress loopback(uint16_t port = 0) const {
        return SocketAddress("127.0.0.1", port);
    }

    std::string datagram_;
    SocketAddress from_;
};

TEST_F(UdpSocketTest, CreateAndClose) {
    UdpSocket socket;
    EXPECT_TRUE(socket.isValid());

    socket.close();
    EXPECT_FALSE(socket.isValid());
    EXPECT_EQ(socket.getLocalPort(), 0);
    EXPECT_EQ(socket.receive(datagram_, from_, 10ms), ReceiveStatus::FAILED);
}

TEST_F(UdpSocketTest, BindToEphemeralPort) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(loopback()));
    EXPECT_GT(socket.getLocalPort(), 0);
}

TEST_F(UdpSocketTest, MoveTransfersHandle) {
    UdpSocket first;
    ASSERT_TRUE(first.isValid());
    SocketHandle handle = first.handle();

    UdpSocket second(std::move(first));
    EXPECT_FALSE(first.isValid());
    EXPECT_EQ(second.handle(), handle);
}

TEST_F(UdpSocketTest, SendReceiveLoopback) {
    UdpSocket sender;
    UdpSocket receiver;
    ASSERT_TRUE(sender.bind(loopback()));
    ASSERT_TRUE(receiver.bind(loopback()));

    const std::string probe = R"({"type":"discover","service":"airvol"})";
    EXPECT_TRUE(sender.sendTo(loopback(receiver.getLocalPort()), probe));

    ASSERT_EQ(receiver.receive(datagram_, from_, 1s), ReceiveStatus::DATAGRAM);
    EXPECT_EQ(datagram_, probe);
    EXPECT_EQ(from_, loopback(sender.getLocalPort()));
}

TEST_F(UdpSocketTest, LongDatagramIsTruncated) {
    UdpSocket sender;
    UdpSocket receiver(16);
    ASSERT_TRUE(receiver.bind(loopback()));

    ASSERT_TRUE(sender.sendTo(loopback(receiver.getLocalPort()), std::string(64, 'x')));
    ASSERT_EQ(receiver.receive(datagram_, from_, 1s), ReceiveStatus::DATAGRAM);
    EXPECT_EQ(datagram_, std::string(16, 'x'));
}

TEST_F(UdpSocketTest, ReceiveTimeout) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(loopback()));

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(socket.receive(datagram_, from_, 100ms), ReceiveStatus::TIMEOUT);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 90ms);
}

TEST_F(UdpSocketTest, SendToInvalidAddressFails) {
    UdpSocket socket;
    EXPECT_FALSE(socket.sendTo(SocketAddress("not-an-address", 4210), "{}"));
}

TEST_F(UdpSocketTest, EnableBroadcast) {
    UdpSocket socket;
    EXPECT_TRUE(socket.enableBroadcast());
}

TEST_F(UdpSocketTest, ReuseAddressAllowsSharedPort) {
    UdpSocket first;
    ASSERT_TRUE(first.enableAddressReuse());
    ASSERT_TRUE(first.bind(loopback()));

    UdpSocket second;
    ASSERT_TRUE(second.enableAddressReuse());
    EXPECT_TRUE(second.bind(loopback(first.getLocalPort())));
}

TEST_F(UdpSocketTest, BindInvalidAddressFails) {
    UdpSocket socket;
    EXPECT_FALSE(socket.bind(SocketAddress("not-an-address", 0)));
}

TEST_F(UdpSocketTest, ShutdownWakesBlockedReceive) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(loopback()));

    std::atomic<bool> returned{false};
    std::thread receiver([&]() {
        std::string datagram;
        SocketAddress from;
        socket.receive(datagram, from, 5s);
        returned.store(true);
    });

    std::this_thread::sleep_for(50ms);
    auto start = std::chrono::steady_clock::now();
    socket.shutdown();
    receiver.join();

    EXPECT_TRUE(returned.load());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(UdpSocketTest, SocketAddressToString) {
    SocketAddress address("192.168.1.20", 4210);
    EXPECT_EQ(address.toString(), "192.168.1.20:4210");
    EXPECT_EQ(address, SocketAddress("192.168.1.20", 4210));
    EXPECT_EQ(SocketAddress().toString(), "0.0.0.0:0");
}
