#pragma once
#include "../core/NetworkRange.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace plug_scan {

class ScanSession;

// An address worth identifying. A non-empty error means it was rejected before identification.
struct Candidate {
    std::string input; // caller-supplied text for manual addresses
    std::string host;
    uint16_t port = 0;
    std::string source;
    std::string error;
};

struct DiscoveryRequest {
    bool broadcast = false;
    std::optional<NetworkRange> range;
    std::vector<std::string> addresses;
};

class DiscoveryStrategy {
public:
    virtual ~DiscoveryStrategy() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual bool applies(const DiscoveryRequest& request) const = 0;
    // Throws on failure to run at all; the orchestrator records that as a failed strategy.
    virtual std::vector<Candidate> discover(const DiscoveryRequest& request, ScanSession* session) = 0;
};

using DiscoveryStrategyPtr = std::unique_ptr<DiscoveryStrategy>;

}
