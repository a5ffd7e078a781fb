#pragma once
#include "DiscoveryStrategy.h"
#include "../net/SsdpClient.h"
#include <chrono>

namespace plug_scan {

class BroadcastDiscovery : public DiscoveryStrategy {
public:
    explicit BroadcastDiscovery(std::chrono::milliseconds timeout) : timeout_(timeout) {}
    std::string name() const override { return "broadcast"; }
    std::string description() const override { return "SSDP M-SEARCH for the basicevent service"; }
    bool applies(const DiscoveryRequest& request) const override { return request.broadcast; }
    std::vector<Candidate> discover(const DiscoveryRequest& request, ScanSession* session) override;
private:
    std::chrono::milliseconds timeout_;
    SsdpClient client_;
};

}
