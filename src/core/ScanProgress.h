#pragma once
#include "Cancellation.h"
#include "NetworkRange.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace plug_scan {

enum class ScanKind { Network, Custom, Refresh };
const char* scan_kind_name(ScanKind k);

struct ScanProgress {
    bool active = false;
    ScanKind kind = ScanKind::Network;
    std::chrono::system_clock::time_point started_at{};
    double percent = 0;
    std::string step;
    uint64_t scanned = 0;
    uint64_t total = 0;
    uint64_t found = 0;
    std::optional<NetworkRange> range;
    bool cancel_requested = false;
    bool can_cancel = false;
    double elapsed_seconds = 0;
    double estimated_remaining_seconds = 0;
    // Outcome of the most recent scan once Idle again.
    bool cancelled = false;
    std::string error;
};

enum class CancelResult { Accepted, AlreadyRequested, NotActive };

class ScanProgressTracker;

// Write handle for the single active scan. Closing it (complete/fail/destructor) returns the
// tracker to Idle; a session destroyed while still open is recorded as a failure.
class ScanSession {
public:
    ScanSession(ScanSession&& o) noexcept;
    ScanSession& operator=(ScanSession&& o) noexcept;
    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;
    ~ScanSession();

    const CancelToken& token() const { return token_; }
    bool cancelled() const { return token_.cancelled(); }

    void set_range(const NetworkRange& range);
    // Starts the probing phase; per-probe progress maps onto 15..90%.
    void set_total(uint64_t total);
    void record_probe(bool found);
    // Percent never decreases and stays below 100 until complete().
    void step(const std::string& description, std::optional<double> percent = std::nullopt);
    void set_found(uint64_t found);

    // Natural completion reaches 100%; a cancelled scan keeps its last percent.
    void complete(const std::string& description);
    void fail(const std::string& error);
    bool open() const { return tracker_ != nullptr; }
private:
    friend class ScanProgressTracker;
    ScanSession(ScanProgressTracker* tracker, uint64_t generation, CancelToken token)
        : tracker_(tracker), generation_(generation), token_(std::move(token)) {}
    ScanProgressTracker* tracker_ = nullptr;
    uint64_t generation_ = 0;
    CancelToken token_;
};

// Process-wide record of the one active scan. Idle -> Active only through try_begin.
class ScanProgressTracker {
public:
    // Fails when a scan is already active; current receives its snapshot.
    std::optional<ScanSession> try_begin(ScanKind kind, std::optional<NetworkRange> range, ScanProgress* current = nullptr);
    ScanProgress snapshot() const;
    bool active() const;
    // Idempotent: a second request while one is pending is AlreadyRequested.
    CancelResult request_cancel();
private:
    friend class ScanSession;
    void update(uint64_t generation, const std::function<void(ScanProgress&)>& fn);
    void close(uint64_t generation, bool completed, const std::string& description, const std::string& error);
    void fill_timing(ScanProgress& p) const;

    mutable std::mutex mutex_;
    ScanProgress state_;
    std::chrono::steady_clock::time_point started_steady_{};
    std::chrono::steady_clock::time_point probing_started_{};
    uint64_t generation_ = 0;
    CancelToken token_;
};

}
