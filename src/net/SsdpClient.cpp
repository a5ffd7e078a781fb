#include "SsdpClient.h"
#include "HttpClient.h"
#include "Socket.h"
#include "../core/Cancellation.h"
#include "../core/Logging.h"
#include <algorithm>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <set>
#include <sstream>

namespace plug_scan {

static const long long POLL_SLICE_MS = 100;

std::string build_msearch(const std::string& search_target, int mx){
    std::ostringstream os;
    os << "M-SEARCH * HTTP/1.1\r\n"
       << "HOST: " << SSDP_MULTICAST_ADDR << ":" << SSDP_PORT << "\r\n"
       << "MAN: \"ssdp:discover\"\r\n"
       << "MX: " << mx << "\r\n"
       << "ST: " << search_target << "\r\n"
       << "\r\n";
    return os.str();
}

bool parse_location(const std::string& url, SsdpLocation& out){
    const std::string scheme = "http://";
    if(url.size() <= scheme.size() || to_lower(url.substr(0, scheme.size())) != scheme) return false;
    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    std::string path = slash == std::string::npos ? "/" : rest.substr(slash);
    if(authority.empty()) return false;
    uint16_t port = 80;
    size_t colon = authority.rfind(':');
    std::string host = authority;
    if(colon != std::string::npos){
        host = authority.substr(0, colon);
        std::string p = authority.substr(colon + 1);
        if(p.empty() || p.size() > 5 || p.find_first_not_of("0123456789") != std::string::npos) return false;
        unsigned long v = std::stoul(p);
        if(v == 0 || v > 65535) return false;
        port = static_cast<uint16_t>(v);
    }
    if(host.empty()) return false;
    out.url = url; out.host = host; out.port = port; out.path = path;
    return true;
}

std::optional<SsdpResponse> parse_ssdp_response(const std::string& datagram){
    std::istringstream in(datagram);
    std::string line;
    if(!std::getline(in, line)) return std::nullopt;
    std::string first = to_lower(trim(line));
    if(first.rfind("http/1.", 0) != 0 && first.rfind("notify", 0) != 0) return std::nullopt;
    SsdpResponse r;
    std::string location;
    while(std::getline(in, line)){
        line = trim(line);
        if(line.empty()) break;
        size_t colon = line.find(':');
        if(colon == std::string::npos) continue;
        std::string key = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        if(key == "location") location = value;
        else if(key == "st" || key == "nt") r.st = value;
        else if(key == "usn") r.usn = value;
        else if(key == "server") r.server = value;
    }
    if(location.empty() || !parse_location(location, r.location)) return std::nullopt;
    return r;
}

std::vector<SsdpResponse> SsdpClient::search(std::chrono::milliseconds timeout, const CancelToken* token) const {
    SocketGuard sock(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if(!sock.valid()) throw SsdpError(std::string("cannot create SSDP socket: ") + std::strerror(errno));
    unsigned char ttl = 2;
    if(setsockopt(sock.get(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) != 0)
        Logger::instance().warn(std::string("SSDP: IP_MULTICAST_TTL failed: ") + std::strerror(errno));

    sockaddr_in dst{};
    dst.sin_family = AF_INET;
    dst.sin_port = htons(SSDP_PORT);
    inet_pton(AF_INET, SSDP_MULTICAST_ADDR, &dst.sin_addr);
    const std::string msg = build_msearch(search_target_, mx_);
    int sent = 0;
    for(int i=0;i<2;++i){
        if(::sendto(sock.get(), msg.data(), msg.size(), 0, reinterpret_cast<sockaddr*>(&dst), sizeof(dst)) == static_cast<ssize_t>(msg.size())) ++sent;
    }
    if(sent == 0) throw SsdpError(std::string("cannot send M-SEARCH: ") + std::strerror(errno));
    Logger::instance().debug("SSDP: sent " + std::to_string(sent) + " M-SEARCH for " + search_target_);

    std::vector<SsdpResponse> out;
    std::set<std::string> seen;
    auto deadline = Clock::now() + timeout;
    char buf[2048];
    for(;;){
        if(token && token->cancelled()){
            Logger::instance().debug("SSDP: search cancelled");
            break;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if(left <= 0) break;
        pollfd pfd{sock.get(), POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(left, POLL_SLICE_MS)));
        if(rc < 0){
            if(errno == EINTR) continue;
            throw SsdpError(std::string("SSDP poll failed: ") + std::strerror(errno));
        }
        if(rc == 0) continue;
        sockaddr_in from{};
        socklen_t fromlen = sizeof(from);
        ssize_t n = ::recvfrom(sock.get(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&from), &fromlen);
        if(n <= 0) continue;
        auto resp = parse_ssdp_response(std::string(buf, static_cast<size_t>(n)));
        if(!resp) continue;
        if(!seen.insert(resp->location.url).second) continue;
        Logger::instance().debug("SSDP: reply from " + resp->location.host + " (" + resp->location.url + ")");
        out.push_back(std::move(*resp));
    }
    Logger::instance().info("SSDP search found " + std::to_string(out.size()) + " responders");
    return out;
}

}
