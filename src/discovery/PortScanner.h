#pragma once
#include "../core/NetworkRange.h"
#include "../core/ScanProgress.h"
#include "../net/Prober.h"
#include <chrono>
#include <cstdint>
#include <vector>

namespace plug_scan {

struct PortScanOptions {
    uint16_t port = 49153;
    std::chrono::milliseconds probe_timeout{2000};
    size_t max_concurrency = 50;
    bool verify_signature = true;
};

// Probes every usable host of a range on one TCP port with a bounded number of workers.
class PortScanner {
public:
    explicit PortScanner(Prober& prober) : prober_(prober) {}

    // Returns responding addresses in ascending order. With a session, progress is reported per probe and
    // its cancellation token stops further dispatch (partial results are returned, never an error).
    // Throws ResourceError when no worker can be started.
    std::vector<uint32_t> scan(const NetworkRange& range, const PortScanOptions& opts, ScanSession* session = nullptr);

    // Single probe: connect, then optionally check the signature within what is left of the timeout.
    bool probe(uint32_t addr, const PortScanOptions& opts);
private:
    Prober& prober_;
};

}
