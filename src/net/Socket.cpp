#include "Socket.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace plug_scan {

const char* connect_result_name(ConnectResult r){
    switch(r){
        case ConnectResult::Connected: return "connected";
        case ConnectResult::Refused: return "refused";
        case ConnectResult::Timeout: return "timeout";
        case ConnectResult::Unreachable: return "unreachable";
        case ConnectResult::Error: return "error";
    }
    return "error";
}

void SocketGuard::reset(int fd){
    if(fd_ >= 0) ::close(fd_);
    fd_ = fd;
}

static int remaining_ms(Clock::time_point deadline){
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    if(left <= 0) return 0;
    if(left > 60000) return 60000;
    return static_cast<int>(left);
}

static ConnectResult classify_errno(int err){
    switch(err){
        case 0: return ConnectResult::Connected;
        case ECONNREFUSED: return ConnectResult::Refused;
        case ETIMEDOUT: return ConnectResult::Timeout;
        case EHOSTUNREACH: case ENETUNREACH: case EHOSTDOWN: case ENETDOWN: return ConnectResult::Unreachable;
        default: return ConnectResult::Error;
    }
}

ConnectResult connect_tcp(uint32_t addr, uint16_t port, Clock::time_point deadline, SocketGuard& sock){
    SocketGuard s(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if(!s.valid()) return ConnectResult::Error;

    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    sa.sin_addr.s_addr = htonl(addr);
    if(::connect(s.get(), reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) == 0){
        sock = std::move(s);
        return ConnectResult::Connected;
    }
    if(errno != EINPROGRESS) return classify_errno(errno);

    for(;;){
        pollfd pfd{}; pfd.fd = s.get(); pfd.events = POLLOUT;
        int rc = ::poll(&pfd, 1, remaining_ms(deadline));
        if(rc < 0){ if(errno == EINTR) continue; return ConnectResult::Error; }
        if(rc == 0){ if(Clock::now() < deadline) continue; return ConnectResult::Timeout; }
        break;
    }
    int so_error = 0; socklen_t len = sizeof(so_error);
    if(::getsockopt(s.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) return ConnectResult::Error;
    ConnectResult r = classify_errno(so_error);
    if(r == ConnectResult::Connected) sock = std::move(s);
    return r;
}

bool send_all(int fd, const std::string& data, Clock::time_point deadline){
    size_t sent = 0;
    while(sent < data.size()){
        pollfd pfd{}; pfd.fd = fd; pfd.events = POLLOUT;
        int rc = ::poll(&pfd, 1, remaining_ms(deadline));
        if(rc < 0){ if(errno == EINTR) continue; return false; }
        if(rc == 0){ if(Clock::now() < deadline) continue; return false; }
        ssize_t n = ::send(fd, data.data()+sent, data.size()-sent, MSG_NOSIGNAL);
        if(n < 0){ if(errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue; return false; }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool recv_all(int fd, std::string& out, size_t max_bytes, Clock::time_point deadline){
    char buf[4096];
    while(out.size() < max_bytes){
        pollfd pfd{}; pfd.fd = fd; pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, remaining_ms(deadline));
        if(rc < 0){ if(errno == EINTR) continue; return false; }
        if(rc == 0){ if(Clock::now() < deadline) continue; return !out.empty(); }
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if(n < 0){ if(errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue; return false; }
        if(n == 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return true;
}

}
