#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace plug_scan {

class CancelToken;

class SsdpError : public std::runtime_error {
public:
    explicit SsdpError(const std::string& what) : std::runtime_error(what) {}
};

struct SsdpLocation {
    std::string url;
    std::string host;
    uint16_t port = 80;
    std::string path = "/";
};

struct SsdpResponse {
    SsdpLocation location;
    std::string st;
    std::string usn;
    std::string server;
};

constexpr const char* SSDP_MULTICAST_ADDR = "239.255.255.250";
constexpr uint16_t SSDP_PORT = 1900;
constexpr const char* BASIC_EVENT_TARGET = "urn:Belkin:service:basicevent:1";

std::string build_msearch(const std::string& search_target, int mx);
// "http://host[:port][/path]"; false for anything else.
bool parse_location(const std::string& url, SsdpLocation& out);
// A search reply or NOTIFY carrying a usable LOCATION header.
std::optional<SsdpResponse> parse_ssdp_response(const std::string& datagram);

// Multicast M-SEARCH; collects replies until the timeout, one per distinct LOCATION.
class SsdpClient {
public:
    explicit SsdpClient(std::string search_target = BASIC_EVENT_TARGET, int mx = 2)
        : search_target_(std::move(search_target)), mx_(mx) {}
    // Throws SsdpError when the socket cannot be created or the search cannot be sent.
    // A cancelled token ends the search early with what was collected so far.
    std::vector<SsdpResponse> search(std::chrono::milliseconds timeout, const CancelToken* token = nullptr) const;
private:
    std::string search_target_;
    int mx_;
};

}
