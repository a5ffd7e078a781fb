#include "PortScanner.h"
#include "../core/Logging.h"
#include "../core/ThreadPool.h"
#include <algorithm>
#include <mutex>

namespace plug_scan {

bool PortScanner::probe(uint32_t addr, const PortScanOptions& opts){
    auto deadline = Clock::now() + opts.probe_timeout;
    ConnectResult cr = prober_.connect(addr, opts.port, opts.probe_timeout);
    if(cr != ConnectResult::Connected){
        Logger::instance().trace("probe " + ipv4_to_string(addr) + ": " + connect_result_name(cr));
        return false;
    }
    if(!opts.verify_signature) return true;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if(left < std::chrono::milliseconds(100)) left = std::chrono::milliseconds(100);
    SignatureResult sig = prober_.verify_signature(addr, opts.port, left);
    switch(sig){
        case SignatureResult::Match:
            return true;
        case SignatureResult::Unavailable:
            // port answered but the description could not be fetched; keep the address
            Logger::instance().debug("probe " + ipv4_to_string(addr) + ": open, signature unavailable");
            return true;
        case SignatureResult::Mismatch:
            Logger::instance().debug("probe " + ipv4_to_string(addr) + ": open, not a device");
            return false;
    }
    return false;
}

std::vector<uint32_t> PortScanner::scan(const NetworkRange& range, const PortScanOptions& opts, ScanSession* session){
    const uint64_t total = range.host_count();
    if(session){
        session->set_range(range);
        session->step("Preparing to scan " + range.cidr(), 5.0);
        session->step("Starting scan of " + std::to_string(total) + " addresses", 10.0);
        session->set_total(total);
        session->step("Scanning " + range.cidr() + " on port " + std::to_string(opts.port), 15.0);
    }
    Logger::instance().info("Scanning " + range.cidr() + " (" + std::to_string(total) + " hosts, port " + std::to_string(opts.port) +
                            ", " + std::to_string(opts.max_concurrency) + " workers)");

    std::vector<uint32_t> found;
    std::mutex found_mutex;
    const CancelToken* token = session ? &session->token() : nullptr;
    size_t dispatched = parallel_for(static_cast<size_t>(total), opts.max_concurrency, [&](size_t i){
        uint32_t addr = range.host_at(i);
        bool hit = false;
        try {
            hit = probe(addr, opts);
        } catch(const std::exception& ex) {
            Logger::instance().debug("probe " + ipv4_to_string(addr) + " failed: " + ex.what());
        }
        if(hit){
            std::lock_guard<std::mutex> lock(found_mutex);
            found.push_back(addr);
            Logger::instance().info("Device port open at " + ipv4_to_string(addr));
        }
        if(session) session->record_probe(hit);
    }, token);

    std::sort(found.begin(), found.end());
    if(token && token->cancelled())
        Logger::instance().info("Scan of " + range.cidr() + " cancelled after " + std::to_string(dispatched) + "/" + std::to_string(total) + " probes");
    else
        Logger::instance().info("Scan of " + range.cidr() + " finished: " + std::to_string(found.size()) + " responding");
    return found;
}

}
