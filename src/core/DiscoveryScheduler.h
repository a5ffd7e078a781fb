#pragma once
#include "Cancellation.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace plug_scan {

class ScanProgressTracker;
class ScanSession;

// Periodic background discovery. Each tick waits one period, then runs the job under the tracker's
// one-active-scan gate; a tick that finds a scan active is skipped. Job failures are logged only.
class DiscoveryScheduler {
public:
    using Job = std::function<void(ScanSession&)>;

    DiscoveryScheduler(ScanProgressTracker& tracker, Job job, std::chrono::milliseconds period, bool enabled = true)
        : tracker_(tracker), job_(std::move(job)), period_(period), enabled_(enabled) {}
    ~DiscoveryScheduler();
    DiscoveryScheduler(const DiscoveryScheduler&) = delete;
    DiscoveryScheduler& operator=(const DiscoveryScheduler&) = delete;

    void start();
    // Cancels a run in flight and joins the worker.
    void stop();
    bool running() const { return running_.load(); }
    void set_enabled(bool on);
    bool enabled() const { return enabled_.load(); }
    std::chrono::milliseconds period() const { return period_; }

    // One tick without waiting; false when disabled or a scan is already active.
    bool run_once() { return run(false); }
    size_t runs() const { return runs_.load(); }
    size_t skipped() const { return skipped_.load(); }
    size_t failures() const { return failures_.load(); }
private:
    // from_worker: a stop() racing the tick cancels it.
    bool run(bool from_worker);
    void loop();
    ScanProgressTracker& tracker_;
    Job job_;
    std::chrono::milliseconds period_;
    std::atomic<bool> enabled_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> runs_{0};
    std::atomic<size_t> skipped_{0};
    std::atomic<size_t> failures_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::thread thread_;
    std::mutex run_mutex_;
    std::optional<CancelToken> run_token_; // token of the session run_once holds

};

}
