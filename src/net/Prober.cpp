#include "Prober.h"
#include "HttpClient.h"
#include "../core/Logging.h"
#include "../core/NetworkRange.h"

namespace plug_scan {

ConnectResult TcpProber::connect(uint32_t addr, uint16_t port, std::chrono::milliseconds timeout){
    SocketGuard sock;
    return connect_tcp(addr, port, Clock::now() + timeout, sock);
}

SignatureResult TcpProber::verify_signature(uint32_t addr, uint16_t port, std::chrono::milliseconds timeout){
    try {
        HttpResponse resp = http_request(addr, port, "GET", "/setup.xml", {}, "", timeout);
        if(resp.status != 200){
            // only a readable description without the signature rules the address out
            Logger::instance().trace("setup.xml at " + ipv4_to_string(addr) + " returned HTTP " + std::to_string(resp.status));
            return SignatureResult::Unavailable;
        }
        return has_device_signature(resp.body) ? SignatureResult::Match : SignatureResult::Mismatch;
    } catch(const HttpError& ex) {
        Logger::instance().trace("signature check " + ipv4_to_string(addr) + ": " + ex.what());
        return SignatureResult::Unavailable;
    }
}

bool has_device_signature(const std::string& body){
    std::string lower = to_lower(body);
    return lower.find("belkin") != std::string::npos || lower.find("wemo") != std::string::npos;
}

}
