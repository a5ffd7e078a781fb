#pragma once
#include "DiscoveryStrategy.h"
#include "PortScanner.h"

namespace plug_scan {

class RangeScanDiscovery : public DiscoveryStrategy {
public:
    RangeScanDiscovery(Prober& prober, PortScanOptions opts) : scanner_(prober), opts_(opts) {}
    std::string name() const override { return "range_scan"; }
    std::string description() const override { return "TCP sweep of a network range on the control port"; }
    bool applies(const DiscoveryRequest& request) const override { return request.range.has_value(); }
    std::vector<Candidate> discover(const DiscoveryRequest& request, ScanSession* session) override;
private:
    PortScanner scanner_;
    PortScanOptions opts_;
};

}
