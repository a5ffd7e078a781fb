#include "StatusChecker.h"
#include "Logging.h"
#include "ThreadPool.h"
#include <algorithm>
#include <atomic>
#include <optional>

namespace plug_scan {

struct BatchStatusChecker::Batch {
    std::mutex mutex;
    std::vector<std::optional<DeviceStatus>> results;
    std::atomic<bool> expired{false};
};

StatusSummary summarize(const std::vector<DeviceStatus>& statuses){
    StatusSummary s;
    s.total = statuses.size();
    for(const auto& d : statuses){
        switch(d.connectivity){
            case Connectivity::Online: ++s.online; break;
            case Connectivity::Offline: ++s.offline; break;
            case Connectivity::Unknown: ++s.unknown; break;
        }
    }
    return s;
}

namespace {
DeviceStatus base_status(const Device& d){
    DeviceStatus s;
    s.udn = d.udn;
    s.name = d.display_name();
    s.host = d.host;
    return s;
}

DeviceStatus query_one(DeviceControl& control, const Device& d, std::chrono::milliseconds timeout){
    DeviceStatus s = base_status(d);
    try {
        s.state = control.query_state(d, timeout);
        s.connectivity = s.state == PowerState::Unknown ? Connectivity::Unknown : Connectivity::Online;
    } catch(const std::exception& ex) {
        s.state = PowerState::Unknown;
        s.connectivity = Connectivity::Offline;
        s.error = ex.what();
        Logger::instance().debug("Failed to get status for device " + d.display_name() + ": " + ex.what());
    }
    s.checked_at = std::chrono::system_clock::now();
    return s;
}
}

BatchStatusChecker::BatchStatusChecker(DeviceControl& control, Options opts) : control_(control), opts_(opts) {}

BatchStatusChecker::~BatchStatusChecker(){
    std::lock_guard<std::mutex> lock(retired_mutex_);
    retired_.clear();
}

void BatchStatusChecker::reap(){
    std::lock_guard<std::mutex> lock(retired_mutex_);
    retired_.erase(std::remove_if(retired_.begin(), retired_.end(), [](const std::unique_ptr<ThreadPool>& p){ return p->idle(); }), retired_.end());
}

size_t BatchStatusChecker::pending_batches(){
    reap();
    std::lock_guard<std::mutex> lock(retired_mutex_);
    return retired_.size();
}

StatusReport BatchStatusChecker::check_all(const std::vector<Device>& devices){
    reap();
    StatusReport report;
    if(devices.empty()){
        report.checked_at = std::chrono::system_clock::now();
        return report;
    }
    auto batch = std::make_shared<Batch>();
    batch->results.resize(devices.size());
    auto deadline = std::chrono::steady_clock::now() + opts_.deadline;
    auto pool = std::make_unique<ThreadPool>(std::min(devices.size(), std::max<size_t>(opts_.max_concurrency, 1)));
    DeviceControl& control = control_;
    auto timeout = opts_.per_device_timeout;
    for(size_t i=0;i<devices.size();++i){
        pool->submit([&control, batch, dev = devices[i], i, timeout]{
            if(batch->expired.load()) return;
            DeviceStatus s = query_one(control, dev, timeout);
            std::lock_guard<std::mutex> lock(batch->mutex);
            batch->results[i] = std::move(s);
        });
    }
    bool finished = pool->wait_idle_until(deadline);
    batch->expired.store(true);

    auto now = std::chrono::system_clock::now();
    {
        std::lock_guard<std::mutex> lock(batch->mutex);
        for(size_t i=0;i<devices.size();++i){
            if(batch->results[i]){
                report.devices.push_back(*batch->results[i]);
                continue;
            }
            DeviceStatus s = base_status(devices[i]);
            s.connectivity = Connectivity::Offline;
            s.error = "Connection timeout";
            s.checked_at = now;
            report.devices.push_back(std::move(s));
        }
    }
    if(!finished){
        Logger::instance().warn("Status batch hit its deadline; " + std::to_string(std::count_if(report.devices.begin(), report.devices.end(),
            [](const DeviceStatus& s){ return s.error == "Connection timeout"; })) + " devices timed out");
        std::lock_guard<std::mutex> lock(retired_mutex_);
        retired_.push_back(std::move(pool));
    }
    report.summary = summarize(report.devices);
    report.checked_at = now;
    Logger::instance().debug("Status check: " + std::to_string(report.summary.online) + " online, " + std::to_string(report.summary.offline) +
                             " offline, " + std::to_string(report.summary.unknown) + " unknown");
    return report;
}

}
