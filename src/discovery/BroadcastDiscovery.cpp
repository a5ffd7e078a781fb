#include "BroadcastDiscovery.h"
#include "../core/ScanProgress.h"

namespace plug_scan {

std::vector<Candidate> BroadcastDiscovery::discover(const DiscoveryRequest&, ScanSession* session){
    if(session) session->step("Broadcast discovery");
    std::vector<Candidate> out;
    for(const auto& r : client_.search(timeout_, session ? &session->token() : nullptr)){
        Candidate c;
        c.host = r.location.host;
        c.port = r.location.port;
        c.source = name();
        out.push_back(std::move(c));
    }
    return out;
}

}
