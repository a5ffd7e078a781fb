#include "RangeScanDiscovery.h"

namespace plug_scan {

std::vector<Candidate> RangeScanDiscovery::discover(const DiscoveryRequest& request, ScanSession* session){
    std::vector<Candidate> out;
    for(uint32_t addr : scanner_.scan(*request.range, opts_, session)){
        Candidate c;
        c.host = ipv4_to_string(addr);
        c.port = opts_.port;
        c.source = name();
        out.push_back(std::move(c));
    }
    return out;
}

}
