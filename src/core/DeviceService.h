#pragma once
#include "AliasStore.h"
#include "Config.h"
#include "Device.h"
#include "DeviceRegistry.h"
#include "DiscoveryOrchestrator.h"
#include "DiscoveryScheduler.h"
#include "NetworkRange.h"
#include "ScanProgress.h"
#include "StatusChecker.h"
#include "../net/Socket.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace plug_scan {

class Prober;

class DeviceNotFound : public std::runtime_error {
public:
    explicit DeviceNotFound(const std::string& udn) : std::runtime_error("Device not found: " + udn), udn_(udn) {}
    const std::string& udn() const { return udn_; }
private:
    std::string udn_;
};

// Rejection of a second scan, carrying the one in progress.
struct ScanConflict {
    ScanProgress current;
};

struct ScanStart {
    bool accepted = false;
    ScanKind kind = ScanKind::Network;
    std::optional<NetworkRange> range; // unset while auto-detection is pending
    std::optional<ScanConflict> conflict;
    std::optional<ValidationError> error;
    std::string message;
};

struct RefreshRequest {
    bool broadcast = true;
    bool scan = false;
    std::string network; // empty = auto-detect when scanning
};

struct RefreshResult {
    std::optional<DiscoverySummary> summary;
    std::optional<ScanConflict> conflict;
    std::optional<ValidationError> error;
};

struct AddressDiscoveryResult {
    size_t total = 0;
    DiscoverySummary summary;
    std::string message; // "Processed 3 IPs: 1 new device added, 1 failed"
    std::string error;
};

struct ForgetResult {
    std::vector<Device> removed;
    size_t remaining = 0;
};

struct AliasResult {
    std::string udn;
    std::optional<std::string> alias;
    std::string display_name;
};

struct BulkItem {
    std::string udn;
    std::string name;
    std::string host;
    std::string status; // success, error, skipped
    std::string message;
};

struct BulkPowerResult {
    bool on = false;
    size_t total = 0;
    size_t successful = 0;
    size_t failed = 0;
    size_t skipped = 0;
    std::vector<BulkItem> results;
    std::string message;
    std::string error; // "No devices available"
};

struct DiscoveryStatus {
    std::chrono::system_clock::time_point last_discovery{};
    size_t discovery_count = 0;
    bool auto_discovery_enabled = false;
    bool background_running = false;
    std::chrono::milliseconds interval{0};
    size_t device_count = 0;
};

struct DeviceProbe {
    std::string udn;
    std::string name;
    std::string host;
    uint16_t port = 0;
    ConnectResult result = ConnectResult::Error;
};

struct NetworkDiagnostics {
    std::vector<std::string> local_addresses;
    std::vector<RangeCandidate> candidates;
    NetworkRange selected;
    std::vector<DeviceProbe> device_probes;
};

// Owns the registry, progress tracker, orchestrator, status checker and scheduler and exposes the
// request/response operations of the presentation layer.
class DeviceService {
public:
    DeviceService(const Config& cfg, DeviceControl& control, Prober& prober);
    ~DeviceService();
    DeviceService(const DeviceService&) = delete;
    DeviceService& operator=(const DeviceService&) = delete;

    void start_background();
    void stop_background();

    RangeValidation validate_network(const std::string& input) const;
    // Empty network = auto-detect. The scan itself runs on a background job.
    ScanStart start_scan(const std::string& network);
    ScanProgress progress() const { return tracker_.snapshot(); }
    CancelResult cancel_scan() { return tracker_.request_cancel(); }
    // Waits for the background scan job; false if it is still running at the timeout.
    bool wait_for_scan(std::chrono::milliseconds timeout);
    std::optional<DiscoverySummary> last_scan_summary() const;

    AddressDiscoveryResult discover_addresses(const std::string& text);
    RefreshResult refresh(const RefreshRequest& request);
    std::vector<Device> devices() const { return registry_.snapshot(); }
    StatusReport status();

    std::optional<ForgetResult> forget(const std::string& udn);
    ForgetResult forget_all();

    std::optional<AliasResult> get_alias(const std::string& udn) const;
    // Blank alias removes it.
    std::optional<AliasResult> set_alias(const std::string& udn, const std::string& alias);
    std::optional<AliasResult> delete_alias(const std::string& udn);

    // Throws DeviceNotFound or DeviceError.
    CommandResult invoke(const std::string& udn, const std::string& command, const std::vector<std::string>& args = {});
    BulkPowerResult bulk_power(bool on);

    DiscoveryStatus discovery_status() const;
    // No value toggles. Returns the new setting.
    bool set_auto_discovery(std::optional<bool> enabled);
    NetworkDiagnostics network_diagnostics();

    ScanProgressTracker& tracker() { return tracker_; }
    DeviceRegistry& registry() { return registry_; }
    DiscoveryOrchestrator& orchestrator() { return orchestrator_; }
    DiscoveryScheduler& scheduler() { return *scheduler_; }
private:
    DiscoverySummary run_discovery(const DiscoveryRequest& request, ScanSession* session);
    NetworkRange detect_range(const CancelToken& token);
    std::optional<ValidationError> resolve_range(const std::string& network, std::optional<NetworkRange>& out) const;
    void join_job();

    Config cfg_;
    DeviceControl& control_;
    Prober& prober_;
    AliasStore aliases_;
    DeviceRegistry registry_;
    ScanProgressTracker tracker_;
    DiscoveryOrchestrator orchestrator_;
    BatchStatusChecker status_checker_;
    std::unique_ptr<DiscoveryScheduler> scheduler_;

    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point last_discovery_{};
    size_t discovery_count_ = 0;
    std::optional<DiscoverySummary> last_scan_;

    std::mutex job_mutex_;
    std::thread job_;
};

// "Processed 3 IPs: 1 new device added, 1 device already known, 1 failed"
std::string address_summary_message(size_t total, const DiscoverySummary& s);

}
