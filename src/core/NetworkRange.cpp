#include "NetworkRange.h"
#include "JsonUtil.h"
#include "Logging.h"
#include "Cancellation.h"
#include "ThreadPool.h"
#include "../net/Prober.h"
#include <algorithm>
#include <cctype>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <net/if.h>

namespace plug_scan {

std::string ipv4_to_string(uint32_t addr){
    return std::to_string((addr>>24)&0xFF) + "." + std::to_string((addr>>16)&0xFF) + "." + std::to_string((addr>>8)&0xFF) + "." + std::to_string(addr&0xFF);
}

// Four dotted decimal octets, 1-3 digits each, no leading zeros.
bool parse_ipv4(const std::string& text, uint32_t& out){
    uint32_t value = 0; int octets = 0; size_t i = 0;
    while(octets < 4){
        size_t start = i;
        while(i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
        size_t len = i - start;
        if(len == 0 || len > 3) return false;
        if(len > 1 && text[start] == '0') return false;
        int octet = std::stoi(text.substr(start, len));
        if(octet > 255) return false;
        value = (value << 8) | static_cast<uint32_t>(octet);
        ++octets;
        if(octets < 4){
            if(i >= text.size() || text[i] != '.') return false;
            ++i;
        }
    }
    if(i != text.size()) return false;
    out = value;
    return true;
}

NetworkRange::NetworkRange(uint32_t address, int prefix) : prefix_(prefix) {
    if(prefix_ < 0) prefix_ = 0;
    if(prefix_ > 32) prefix_ = 32;
    base_ = address & mask();
}

std::string NetworkRange::cidr() const { return ipv4_to_string(base_) + "/" + std::to_string(prefix_); }

uint64_t NetworkRange::host_count() const {
    if(prefix_ == 32) return 1;
    if(prefix_ == 31) return 2;
    return (uint64_t{1} << (32 - prefix_)) - 2;
}

uint32_t NetworkRange::first_host() const { return prefix_ >= 31 ? base_ : base_ + 1; }

uint32_t NetworkRange::last_host() const {
    if(prefix_ == 32) return base_;
    if(prefix_ == 31) return base_ + 1;
    return broadcast_address() - 1;
}

std::string NetworkRange::estimated_scan_time() const {
    double secs = std::max(1.0, static_cast<double>(host_count()) * 0.1);
    return jsonutil::fixed1(secs) + "s";
}

static bool is_netmask(uint32_t m){ uint32_t inv = ~m; return (inv & (inv + 1)) == 0; }
static int popcount32(uint32_t v){ int n=0; while(v){ v &= v-1; ++n; } return n; }

RangeValidation validate_network(const std::string& raw){
    RangeValidation r;
    r.error.input = raw;
    std::string input = raw;
    size_t b = input.find_first_not_of(" \t\r\n");
    if(b == std::string::npos){ r.error.message = "Network input must be a non-empty string"; return r; }
    input = input.substr(b, input.find_last_not_of(" \t\r\n") - b + 1);

    size_t slash = input.find('/');
    if(slash == std::string::npos){
        uint32_t addr = 0;
        if(!parse_ipv4(input, addr)){ r.error.message = "Invalid network format: '" + input + "' is not a valid IPv4 address"; return r; }
        r.range = NetworkRange(addr, 32);
        return r;
    }
    if(input.find('/', slash+1) != std::string::npos){
        r.error.message = "Invalid network format. Use CIDR notation (e.g., 192.168.1.0/24)";
        return r;
    }
    std::string ip_part = input.substr(0, slash);
    std::string mask_part = input.substr(slash+1);
    uint32_t addr = 0;
    if(!parse_ipv4(ip_part, addr)){ r.error.message = "Invalid IP address: " + ip_part; return r; }
    if(mask_part.empty()){ r.error.message = "Invalid network format. Use CIDR notation (e.g., 192.168.1.0/24)"; return r; }

    bool digits = std::all_of(mask_part.begin(), mask_part.end(), [](unsigned char c){ return std::isdigit(c); });
    int prefix = 0;
    if(digits){
        if(mask_part.size() > 3 || std::stoi(mask_part) > 32){ r.error.message = "CIDR prefix length must be between 0 and 32"; return r; }
        prefix = std::stoi(mask_part);
    } else {
        uint32_t m = 0;
        if(!parse_ipv4(mask_part, m)){ r.error.message = "Invalid subnet mask: " + mask_part; return r; }
        if(is_netmask(m)) prefix = popcount32(m);
        else if(is_netmask(~m)) prefix = popcount32(~m); // host mask form, e.g. 0.0.0.255
        else { r.error.message = "Invalid subnet mask: " + mask_part; return r; }
    }
    r.range = NetworkRange(addr, prefix);
    return r;
}

const char* evidence_name(RangeEvidence e){
    switch(e){
        case RangeEvidence::DeviceAnswered: return "device_answered";
        case RangeEvidence::Routable: return "routable";
        case RangeEvidence::LocalInterface: return "local_interface";
        case RangeEvidence::Default: return "default";
    }
    return "default";
}

std::vector<uint32_t> local_ipv4_addresses(){
    std::vector<uint32_t> out;
    ifaddrs* ifs = nullptr;
    if(getifaddrs(&ifs) != 0){
        Logger::instance().debug("getifaddrs failed; no local interface ranges");
        return out;
    }
    for(ifaddrs* it = ifs; it; it = it->ifa_next){
        if(!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
        if(it->ifa_flags & IFF_LOOPBACK) continue;
        if(!(it->ifa_flags & IFF_UP)) continue;
        uint32_t a = ntohl(reinterpret_cast<sockaddr_in*>(it->ifa_addr)->sin_addr.s_addr);
        if(std::find(out.begin(), out.end(), a) == out.end()) out.push_back(a);
    }
    freeifaddrs(ifs);
    return out;
}

NetworkRangeResolver::NetworkRangeResolver(Prober& prober, Options opts) : prober_(prober), opts_(opts) {}

const std::vector<std::string>& NetworkRangeResolver::default_ranges(){
    static const std::vector<std::string> ranges = {
        "192.168.1.0/24", "192.168.0.0/24", "10.0.0.0/24", "10.0.1.0/24", "172.16.0.0/24",
        "192.168.2.0/24", "192.168.10.0/24", "192.168.11.0/24", "192.168.20.0/24",
        "192.168.50.0/24", "192.168.100.0/24",
    };
    return ranges;
}

RangeEvidence NetworkRangeResolver::classify(const NetworkRange& range, RangeEvidence fallback, std::string& detail, const CancelToken* token) const {
    auto cancelled = [&]{ return token && token->cancelled(); };
    static const uint32_t representative[] = {169, 100, 101, 150};
    for(uint32_t offset : representative){
        uint32_t addr = range.network_address() + offset;
        if(!range.contains(addr)) continue;
        if(cancelled()) return fallback;
        if(prober_.connect(addr, opts_.control_port, opts_.probe_timeout) == ConnectResult::Connected){
            detail = ipv4_to_string(addr);
            return RangeEvidence::DeviceAnswered;
        }
    }
    uint32_t gateway = range.network_address() + 1;
    for(uint16_t port : {uint16_t(80), uint16_t(443)}){
        if(cancelled()) return fallback;
        ConnectResult r = prober_.connect(gateway, port, opts_.probe_timeout);
        if(r == ConnectResult::Connected || r == ConnectResult::Refused){
            detail = ipv4_to_string(gateway) + ":" + std::to_string(port);
            return RangeEvidence::Routable;
        }
    }
    return fallback;
}

std::vector<RangeCandidate> NetworkRangeResolver::auto_detect(const std::vector<uint32_t>& local_addresses, const CancelToken* token) const {
    std::vector<RangeCandidate> candidates;
    auto add = [&](const NetworkRange& r, RangeEvidence ev, const std::string& detail){
        for(const auto& c : candidates) if(c.range == r) return;
        candidates.push_back({r, ev, detail});
    };
    for(uint32_t a : local_addresses) add(NetworkRange(a, 24), RangeEvidence::LocalInterface, "interface " + ipv4_to_string(a));
    for(const auto& s : default_ranges()){
        auto v = validate_network(s);
        if(v.ok()) add(*v.range, RangeEvidence::Default, "default");
    }

    if(opts_.probe){
        parallel_for(candidates.size(), opts_.max_concurrency, [&](size_t i){
            std::string detail;
            RangeEvidence ev = classify(candidates[i].range, candidates[i].evidence, detail, token);
            if(ev != candidates[i].evidence){
                candidates[i].evidence = ev;
                candidates[i].detail = detail;
            }
        }, token);
    }
    std::stable_sort(candidates.begin(), candidates.end(), [](const RangeCandidate& a, const RangeCandidate& b){
        return static_cast<int>(a.evidence) < static_cast<int>(b.evidence); });
    for(const auto& c : candidates){
        if(c.evidence == RangeEvidence::DeviceAnswered) Logger::instance().info("Device answered in " + c.range.cidr() + " (" + c.detail + ")");
        else if(c.evidence == RangeEvidence::Routable) Logger::instance().debug("Reachable network " + c.range.cidr());
    }
    return candidates;
}

NetworkRange NetworkRangeResolver::pick(const std::vector<RangeCandidate>& candidates) const {
    if(!candidates.empty()) return candidates.front().range;
    Logger::instance().warn("Could not detect network range, using default 192.168.1.0/24");
    return NetworkRange((192u<<24)|(168u<<16)|(1u<<8), 24);
}

}
