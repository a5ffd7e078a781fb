#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <chrono>

namespace plug_scan {

class CancelToken;
class Prober;

// IPv4 helpers (host byte order).
std::string ipv4_to_string(uint32_t addr);
bool parse_ipv4(const std::string& text, uint32_t& out);

// Canonical {base address, prefix length}; base is always masked.
class NetworkRange {
public:
    NetworkRange() = default;
    NetworkRange(uint32_t address, int prefix);

    uint32_t network_address() const { return base_; }
    uint32_t broadcast_address() const { return base_ | ~mask(); }
    int prefix() const { return prefix_; }
    uint32_t mask() const { return prefix_ == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix_)); }
    std::string cidr() const;

    // Usable hosts: 2^(32-prefix) minus network/broadcast when prefix < 31.
    uint64_t host_count() const;
    uint32_t first_host() const;
    uint32_t last_host() const;
    // i in [0, host_count())
    uint32_t host_at(uint64_t i) const { return first_host() + static_cast<uint32_t>(i); }
    bool is_single_host() const { return host_count() == 1; }
    bool contains(uint32_t addr) const { return (addr & mask()) == base_; }
    // "25.4s" at roughly 0.1s per host, never below 1s.
    std::string estimated_scan_time() const;

    bool operator==(const NetworkRange& o) const { return base_ == o.base_ && prefix_ == o.prefix_; }
    bool operator!=(const NetworkRange& o) const { return !(*this == o); }
private:
    uint32_t base_ = 0;
    int prefix_ = 32;
};

struct ValidationError {
    std::string input;
    std::string message;
};

struct RangeValidation {
    std::optional<NetworkRange> range;
    ValidationError error;
    bool ok() const { return range.has_value(); }
};

// Accepts "a.b.c.d/n", "a.b.c.d/w.x.y.z" and bare "a.b.c.d" (a /32). Pure; never throws.
RangeValidation validate_network(const std::string& input);

enum class RangeEvidence { DeviceAnswered=0, Routable=1, LocalInterface=2, Default=3 };
const char* evidence_name(RangeEvidence e);

struct RangeCandidate {
    NetworkRange range;
    RangeEvidence evidence = RangeEvidence::Default;
    std::string detail; // address that answered, or where the range came from
};

// IPv4 addresses of local non-loopback interfaces.
std::vector<uint32_t> local_ipv4_addresses();

class NetworkRangeResolver {
public:
    struct Options {
        uint16_t control_port = 49153;
        std::chrono::milliseconds probe_timeout{1000};
        size_t max_concurrency = 16;
        bool probe = true; // false = order by source only
    };

    NetworkRangeResolver(Prober& prober, Options opts);

    // Ordered: device answered < merely routable < local interface < untested default.
    // Once token is cancelled no further probe starts; unprobed candidates keep their source evidence.
    std::vector<RangeCandidate> auto_detect(const std::vector<uint32_t>& local_addresses, const CancelToken* token = nullptr) const;
    std::vector<RangeCandidate> auto_detect(const CancelToken* token = nullptr) const { return auto_detect(local_ipv4_addresses(), token); }
    // First candidate, falling back to 192.168.1.0/24.
    NetworkRange pick(const std::vector<RangeCandidate>& candidates) const;

    static const std::vector<std::string>& default_ranges();
private:
    RangeEvidence classify(const NetworkRange& range, RangeEvidence fallback, std::string& detail, const CancelToken* token) const;
    Prober& prober_;
    Options opts_;
};

}
