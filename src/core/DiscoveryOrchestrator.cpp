#include "DiscoveryOrchestrator.h"
#include "Config.h"
#include "DeviceRegistry.h"
#include "Logging.h"
#include "ScanProgress.h"
#include "ThreadPool.h"
#include "../discovery/AddressDiscovery.h"
#include "../discovery/BroadcastDiscovery.h"
#include "../discovery/RangeScanDiscovery.h"
#include <algorithm>
#include <exception>
#include <mutex>
#include <set>

namespace plug_scan {

static const std::chrono::milliseconds CANCEL_POLL{25};

const char* candidate_outcome_name(CandidateOutcome o){
    switch(o){
        case CandidateOutcome::Added: return "added";
        case CandidateOutcome::AlreadyKnown: return "already_known";
        case CandidateOutcome::Failed: return "failed";
    }
    return "failed";
}

void DiscoveryOrchestrator::register_strategy(DiscoveryStrategyPtr strategy){
    strategies_.push_back(std::move(strategy));
}

void DiscoveryOrchestrator::register_all_default(Prober& prober, const Config& cfg){
    PortScanOptions scan;
    scan.port = static_cast<uint16_t>(cfg.control_port);
    scan.probe_timeout = std::chrono::milliseconds(cfg.probe_timeout_ms);
    scan.max_concurrency = static_cast<size_t>(cfg.scan_concurrency);
    scan.verify_signature = cfg.verify_signature;
    register_strategy(std::make_unique<BroadcastDiscovery>(std::chrono::milliseconds(cfg.broadcast_timeout_ms)));
    register_strategy(std::make_unique<RangeScanDiscovery>(prober, scan));
    register_strategy(std::make_unique<AddressDiscovery>(static_cast<uint16_t>(cfg.control_port)));
}

CandidateResult DiscoveryOrchestrator::identify(const Candidate& c){
    CandidateResult r;
    r.input = c.input.empty() ? c.host : c.input;
    r.host = c.host; r.port = c.port; r.source = c.source;
    if(!c.error.empty()){ r.error = c.error; return r; }
    try {
        auto info = control_.identify(c.host, c.port, opts_.identify_timeout);
        if(!info){
            r.error = "No device found";
            Logger::instance().debug("No device found at " + c.host);
            return r;
        }
        r.outcome = registry_.merge(*info) == MergeOutcome::Added ? CandidateOutcome::Added : CandidateOutcome::AlreadyKnown;
        r.device = std::move(info);
    } catch(const std::exception& ex) {
        r.error = ex.what();
        Logger::instance().debug("Failed to identify device at " + c.host + ": " + ex.what());
    }
    return r;
}

void DiscoveryOrchestrator::identify_all(const std::vector<Candidate>& candidates, std::vector<CandidateResult>& results, ScanSession* session){
    if(candidates.empty()) return;
    ThreadPool pool(std::min(candidates.size(), std::max<size_t>(opts_.identify_concurrency, 1)));
    for(size_t i=0;i<candidates.size();++i) pool.submit([this, &candidates, &results, i]{ results[i] = identify(candidates[i]); });
    // a cancel that arrives mid-identification closes the session without waiting for the stragglers
    while(!pool.wait_idle_until(std::chrono::steady_clock::now() + CANCEL_POLL)){
        if(session && session->open() && session->cancelled()) session->complete("");
    }
}

DiscoverySummary DiscoveryOrchestrator::discover(const DiscoveryRequest& request, ScanSession* session){
    DiscoverySummary summary;
    try {
        std::vector<DiscoveryStrategy*> active;
        for(auto& s : strategies_) if(s->applies(request)) active.push_back(s.get());
        if(session) session->step("Discovering devices");

        std::vector<std::vector<Candidate>> found(active.size());
        std::vector<std::string> errors(active.size());
        std::exception_ptr fatal;
        std::mutex fatal_mutex;
        auto run = [&](size_t i){
            DiscoveryStrategy* s = active[i];
            if(session && session->cancelled()){
                Logger::instance().debug("Skipping strategy after cancel: " + s->name());
                return;
            }
            Logger::instance().debug("Starting strategy: " + s->name());
            try {
                found[i] = s->discover(request, session);
            } catch(const ResourceError&) {
                std::lock_guard<std::mutex> lock(fatal_mutex);
                if(!fatal) fatal = std::current_exception();
            } catch(const std::exception& ex) {
                errors[i] = ex.what();
                if(errors[i].empty()) errors[i] = "unknown error";
            }
            Logger::instance().debug("Finished strategy: " + s->name() + " (" + std::to_string(found[i].size()) + " candidates)");
        };
        if(opts_.parallel && active.size() > 1) parallel_for(active.size(), active.size(), run);
        else for(size_t i=0;i<active.size();++i) run(i);
        if(fatal) std::rethrow_exception(fatal);

        std::vector<Candidate> candidates;
        std::set<std::string> seen;
        for(size_t i=0;i<active.size();++i){
            summary.strategies_run.push_back(active[i]->name());
            if(!errors[i].empty()){
                Logger::instance().error("Strategy " + active[i]->name() + " failed: " + errors[i]);
                summary.failed_strategies.push_back({active[i]->name(), errors[i]});
            }
            for(auto& c : found[i]){
                // the same responder may be reported by broadcast and scan; manual entries are kept as typed
                if(c.input.empty() && !seen.insert(c.host + ":" + std::to_string(c.port)).second) continue;
                candidates.push_back(std::move(c));
            }
        }

        if(session){
            session->set_found(candidates.size());
            // a cancelled scan goes Idle now; what it found is still identified below
            if(session->cancelled()) session->complete("");
            else session->step("Processing discovered devices", 90.0);
        }
        summary.results.resize(candidates.size());
        identify_all(candidates, summary.results, session);
        for(const auto& r : summary.results){
            switch(r.outcome){
                case CandidateOutcome::Added: ++summary.added; break;
                case CandidateOutcome::AlreadyKnown: ++summary.already_known; break;
                case CandidateOutcome::Failed: ++summary.failed; break;
            }
        }
    } catch(const ResourceError& ex) {
        if(session) session->fail(ex.what());
        throw;
    }
    summary.device_count = registry_.size();
    summary.cancelled = session && session->cancelled();
    summary.finished_at = std::chrono::system_clock::now();
    Logger::instance().info("Discovery finished: " + std::to_string(summary.added) + " added, " + std::to_string(summary.already_known) +
                            " already known, " + std::to_string(summary.failed) + " failed, " + std::to_string(summary.device_count) + " devices");
    if(session) session->complete("Discovery completed - Found " + std::to_string(summary.device_count) + " devices");
    return summary;
}

}
