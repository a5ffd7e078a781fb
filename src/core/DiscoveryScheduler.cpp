#include "DiscoveryScheduler.h"
#include "Logging.h"
#include "ScanProgress.h"

namespace plug_scan {

DiscoveryScheduler::~DiscoveryScheduler(){ stop(); }

void DiscoveryScheduler::start(){
    std::lock_guard<std::mutex> lock(mutex_);
    if(thread_.joinable()) return;
    stop_ = false;
    running_.store(true);
    thread_ = std::thread([this]{ loop(); });
    Logger::instance().info("Background discovery worker started (every " + std::to_string(period_.count() / 1000) + "s)");
}

void DiscoveryScheduler::stop(){
    std::thread t;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(!thread_.joinable()) return;
        stop_ = true;
        t = std::move(thread_);
    }
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if(run_token_ && run_token_->request()) Logger::instance().info("Cancelling background discovery in progress");
    }
    cv_.notify_all();
    t.join();
    running_.store(false);
    Logger::instance().info("Background discovery worker stopped");
}

void DiscoveryScheduler::set_enabled(bool on){
    enabled_.store(on);
    Logger::instance().info(std::string("Auto-discovery ") + (on ? "enabled" : "disabled"));
}

bool DiscoveryScheduler::run(bool from_worker){
    if(!enabled_.load()){ ++skipped_; return false; }
    ScanProgress current;
    auto session = tracker_.try_begin(ScanKind::Refresh, std::nullopt, &current);
    if(!session){
        ++skipped_;
        Logger::instance().info(std::string("Background discovery skipped: ") + scan_kind_name(current.kind) + " scan in progress");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        run_token_ = session->token();
        if(from_worker){
            std::lock_guard<std::mutex> state(mutex_);
            if(stop_) run_token_->request();
        }
    }
    Logger::instance().info("Running background device discovery");
    try {
        job_(*session);
        session->complete("Background discovery completed");
        ++runs_;
    } catch(const std::exception& ex) {
        ++failures_;
        Logger::instance().error(std::string("Background discovery error: ") + ex.what());
        session->fail(ex.what());
    }
    std::lock_guard<std::mutex> lock(run_mutex_);
    run_token_.reset();
    return true;
}

void DiscoveryScheduler::loop(){
    for(;;){
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if(cv_.wait_for(lock, period_, [&]{ return stop_; })) return;
        }
        run(true);
    }
}

}
