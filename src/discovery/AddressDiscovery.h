#pragma once
#include "DiscoveryStrategy.h"

namespace plug_scan {

// Caller-supplied addresses, each identified directly on the control port.
class AddressDiscovery : public DiscoveryStrategy {
public:
    explicit AddressDiscovery(uint16_t port) : port_(port) {}
    std::string name() const override { return "address"; }
    std::string description() const override { return "Identify devices at explicit addresses"; }
    bool applies(const DiscoveryRequest& request) const override { return !request.addresses.empty(); }
    std::vector<Candidate> discover(const DiscoveryRequest& request, ScanSession* session) override;
private:
    uint16_t port_;
};

// Dotted quad of 1-3 digit decimal octets; "192.168.001.005" is 192.168.1.5.
bool parse_manual_ipv4(const std::string& text, uint32_t& out);

// Splits on whitespace, commas and semicolons; empty tokens are dropped.
std::vector<std::string> split_addresses(const std::string& text);

}
