#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace plug_scan {

using Clock = std::chrono::steady_clock;

enum class ConnectResult { Connected, Refused, Timeout, Unreachable, Error };
const char* connect_result_name(ConnectResult r);

// Owns a socket descriptor.
class SocketGuard {
public:
    SocketGuard() = default;
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard(){ reset(); }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    SocketGuard(SocketGuard&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    SocketGuard& operator=(SocketGuard&& o) noexcept { if(this != &o){ reset(); fd_ = o.fd_; o.fd_ = -1; } return *this; }
    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset(int fd = -1);
private:
    int fd_ = -1;
};

// Non-blocking connect bounded by deadline; on Connected, sock holds the open socket.
ConnectResult connect_tcp(uint32_t addr, uint16_t port, Clock::time_point deadline, SocketGuard& sock);
bool send_all(int fd, const std::string& data, Clock::time_point deadline);
// Reads until the peer closes, max_bytes is reached or the deadline passes.
// False on read error or deadline with nothing received.
bool recv_all(int fd, std::string& out, size_t max_bytes, Clock::time_point deadline);

}
