#pragma once
#include "Socket.h"
#include <chrono>
#include <cstdint>
#include <string>

namespace plug_scan {

enum class SignatureResult { Match, Mismatch, Unavailable };

// Network probes used by range scans and auto-detection.
class Prober {
public:
    virtual ~Prober() = default;
    virtual ConnectResult connect(uint32_t addr, uint16_t port, std::chrono::milliseconds timeout) = 0;
    // Fetches the device description and looks for the vendor signature.
    // Unavailable when the HTTP exchange fails or answers with an error status.
    virtual SignatureResult verify_signature(uint32_t addr, uint16_t port, std::chrono::milliseconds timeout) = 0;
};

class TcpProber : public Prober {
public:
    ConnectResult connect(uint32_t addr, uint16_t port, std::chrono::milliseconds timeout) override;
    SignatureResult verify_signature(uint32_t addr, uint16_t port, std::chrono::milliseconds timeout) override;
};

// Case-insensitive search for "belkin", "wemo" or "urn:belkin".
bool has_device_signature(const std::string& body);

}
