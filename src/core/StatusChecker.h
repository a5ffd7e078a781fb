#pragma once
#include "Device.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace plug_scan {

class ThreadPool;

struct DeviceStatus {
    std::string udn;
    std::string name;
    std::string host;
    PowerState state = PowerState::Unknown;
    Connectivity connectivity = Connectivity::Unknown;
    std::string error;
    std::chrono::system_clock::time_point checked_at{};
};

struct StatusSummary {
    size_t total = 0;
    size_t online = 0;
    size_t offline = 0;
    size_t unknown = 0;
};

struct StatusReport {
    std::vector<DeviceStatus> devices; // same order as the input snapshot
    StatusSummary summary;
    std::chrono::system_clock::time_point checked_at{};
};

StatusSummary summarize(const std::vector<DeviceStatus>& statuses);

// One concurrent state query per device. The batch returns by its deadline; anything still running is
// reported offline with "Connection timeout" and finishes in the background.
class BatchStatusChecker {
public:
    struct Options {
        std::chrono::milliseconds per_device_timeout{5000};
        size_t max_concurrency = 10;
        std::chrono::milliseconds deadline{15000};
    };

    BatchStatusChecker(DeviceControl& control, Options opts);
    ~BatchStatusChecker();
    BatchStatusChecker(const BatchStatusChecker&) = delete;
    BatchStatusChecker& operator=(const BatchStatusChecker&) = delete;

    // Throws ResourceError when no worker can be started.
    StatusReport check_all(const std::vector<Device>& devices);
    // Pools whose stragglers have not returned yet.
    size_t pending_batches();
private:
    struct Batch;
    void reap();
    DeviceControl& control_;
    Options opts_;
    std::mutex retired_mutex_;
    std::vector<std::unique_ptr<ThreadPool>> retired_;
};

}
