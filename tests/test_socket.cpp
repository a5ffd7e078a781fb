#include <gtest/gtest.h>
#include "../src/net/Socket.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <thread>

namespace plug_scan {

static const uint32_t LOOPBACK = 0x7F000001u;

// Listening loopback socket on an ephemeral port.
class LoopbackListener {
public:
    LoopbackListener() : fd_(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
        int one = 1;
        ::setsockopt(fd_.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in sa{};
        sa.sin_family = AF_INET;
        sa.sin_addr.s_addr = htonl(LOOPBACK);
        sa.sin_port = 0;
        ok_ = ::bind(fd_.get(), reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) == 0 && ::listen(fd_.get(), 8) == 0;
        socklen_t len = sizeof(sa);
        if (ok_ && ::getsockname(fd_.get(), reinterpret_cast<sockaddr*>(&sa), &len) == 0) port_ = ntohs(sa.sin_port);
    }
    bool ok() const { return ok_ && port_ != 0; }
    uint16_t port() const { return port_; }
    int accept_one() { return ::accept(fd_.get(), nullptr, nullptr); }
    void close() { fd_.reset(); }
private:
    SocketGuard fd_;
    uint16_t port_ = 0;
    bool ok_ = false;
};

class SocketTest : public ::testing::Test {
protected:
    Clock::time_point deadline(int ms) { return Clock::now() + std::chrono::milliseconds(ms); }
};

TEST_F(SocketTest, GuardClosesOnReset) {
    SocketGuard g(::socket(AF_INET, SOCK_STREAM, 0));
    ASSERT_TRUE(g.valid());
    SocketGuard moved(std::move(g));
    EXPECT_FALSE(g.valid());
    EXPECT_TRUE(moved.valid());
    moved.reset();
    EXPECT_FALSE(moved.valid());
}

TEST_F(SocketTest, ConnectsToListener) {
    LoopbackListener listener;
    ASSERT_TRUE(listener.ok());
    SocketGuard sock;
    EXPECT_EQ(connect_tcp(LOOPBACK, listener.port(), deadline(2000), sock), ConnectResult::Connected);
    EXPECT_TRUE(sock.valid());
}

TEST_F(SocketTest, ClosedPortIsRefused) {
    uint16_t port = 0;
    {
        LoopbackListener listener;
        ASSERT_TRUE(listener.ok());
        port = listener.port();
    }
    SocketGuard sock;
    EXPECT_EQ(connect_tcp(LOOPBACK, port, deadline(2000), sock), ConnectResult::Refused);
    EXPECT_FALSE(sock.valid());
}

TEST_F(SocketTest, SendAndReceiveUntilClose) {
    LoopbackListener listener;
    ASSERT_TRUE(listener.ok());
    std::thread server([&]{
        SocketGuard peer(listener.accept_one());
        char buf[64];
        ssize_t n = ::recv(peer.get(), buf, sizeof(buf), 0);
        std::string reply = "echo:" + std::string(buf, n > 0 ? static_cast<size_t>(n) : 0);
        ::send(peer.get(), reply.data(), reply.size(), MSG_NOSIGNAL);
    });
    SocketGuard sock;
    ASSERT_EQ(connect_tcp(LOOPBACK, listener.port(), deadline(2000), sock), ConnectResult::Connected);
    EXPECT_TRUE(send_all(sock.get(), "ping", deadline(2000)));
    std::string out;
    EXPECT_TRUE(recv_all(sock.get(), out, 1024, deadline(2000)));
    server.join();
    EXPECT_EQ(out, "echo:ping");
}

TEST_F(SocketTest, ReceiveStopsAtLimit) {
    LoopbackListener listener;
    ASSERT_TRUE(listener.ok());
    std::thread server([&]{
        SocketGuard peer(listener.accept_one());
        std::string big(20000, 'x');
        ::send(peer.get(), big.data(), big.size(), MSG_NOSIGNAL);
    });
    SocketGuard sock;
    ASSERT_EQ(connect_tcp(LOOPBACK, listener.port(), deadline(2000), sock), ConnectResult::Connected);
    std::string out;
    EXPECT_TRUE(recv_all(sock.get(), out, 100, deadline(2000)));
    server.join();
    EXPECT_GE(out.size(), 100u);
    EXPECT_LE(out.size(), 100u + 4096u);
}

TEST_F(SocketTest, SilentPeerTimesOutEmpty) {
    LoopbackListener listener;
    ASSERT_TRUE(listener.ok());
    SocketGuard sock;
    ASSERT_EQ(connect_tcp(LOOPBACK, listener.port(), deadline(2000), sock), ConnectResult::Connected);
    std::string out;
    auto start = Clock::now();
    EXPECT_FALSE(recv_all(sock.get(), out, 1024, deadline(50)));
    EXPECT_LT(Clock::now() - start, std::chrono::seconds(2));
    EXPECT_TRUE(out.empty());
}

TEST(ConnectResultTest, Names) {
    EXPECT_STREQ(connect_result_name(ConnectResult::Connected), "connected");
    EXPECT_STREQ(connect_result_name(ConnectResult::Refused), "refused");
    EXPECT_STREQ(connect_result_name(ConnectResult::Timeout), "timeout");
    EXPECT_STREQ(connect_result_name(ConnectResult::Unreachable), "unreachable");
}

} // namespace plug_scan
