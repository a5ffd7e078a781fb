#pragma once
#include "Device.h"
#include "../discovery/DiscoveryStrategy.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace plug_scan {

class DeviceRegistry;
class Prober;
class ScanSession;
struct Config;

enum class CandidateOutcome { Added, AlreadyKnown, Failed };
const char* candidate_outcome_name(CandidateOutcome o);

struct CandidateResult {
    std::string input;
    std::string host;
    uint16_t port = 0;
    std::string source;
    CandidateOutcome outcome = CandidateOutcome::Failed;
    std::optional<DeviceInfo> device;
    std::string error;
};

struct StrategyFailure {
    std::string strategy;
    std::string error;
};

struct DiscoverySummary {
    size_t added = 0;
    size_t already_known = 0;
    size_t failed = 0;
    std::vector<CandidateResult> results;
    std::vector<std::string> strategies_run;
    std::vector<StrategyFailure> failed_strategies;
    bool cancelled = false;
    size_t device_count = 0;
    std::chrono::system_clock::time_point finished_at{};
};

// Runs the applicable strategies, identifies every candidate and merges it into the registry by identity.
class DiscoveryOrchestrator {
public:
    struct Options {
        std::chrono::milliseconds identify_timeout{5000};
        size_t identify_concurrency = 10;
        bool parallel = false; // run strategies concurrently
    };

    DiscoveryOrchestrator(DeviceRegistry& registry, DeviceControl& control, Options opts)
        : registry_(registry), control_(control), opts_(opts) {}

    void register_strategy(DiscoveryStrategyPtr strategy);
    // broadcast, range_scan, address
    void register_all_default(Prober& prober, const Config& cfg);
    size_t strategy_count() const { return strategies_.size(); }

    // A failing strategy never stops the others. With a session, progress and completion are reported
    // through it; a cancelled session is closed before identification starts. Only ResourceError
    // escapes (after failing the session).
    DiscoverySummary discover(const DiscoveryRequest& request, ScanSession* session = nullptr);
private:
    CandidateResult identify(const Candidate& c);
    void identify_all(const std::vector<Candidate>& candidates, std::vector<CandidateResult>& results, ScanSession* session);
    DeviceRegistry& registry_;
    DeviceControl& control_;
    Options opts_;
    std::vector<DiscoveryStrategyPtr> strategies_;
};

}
