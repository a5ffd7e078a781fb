#include "ScanProgress.h"
#include "Logging.h"
#include <algorithm>
#include <functional>

namespace plug_scan {

const char* scan_kind_name(ScanKind k){
    switch(k){
        case ScanKind::Network: return "network";
        case ScanKind::Custom: return "custom";
        case ScanKind::Refresh: return "refresh";
    }
    return "network";
}

// --- ScanSession ---

ScanSession::ScanSession(ScanSession&& o) noexcept : tracker_(o.tracker_), generation_(o.generation_), token_(o.token_) {
    o.tracker_ = nullptr;
}

ScanSession& ScanSession::operator=(ScanSession&& o) noexcept {
    if(this != &o){
        if(tracker_) tracker_->close(generation_, false, "", "scan session replaced");
        tracker_ = o.tracker_; generation_ = o.generation_; token_ = o.token_;
        o.tracker_ = nullptr;
    }
    return *this;
}

ScanSession::~ScanSession(){
    if(tracker_) tracker_->close(generation_, false, "", "scan ended unexpectedly");
}

void ScanSession::set_range(const NetworkRange& range){
    if(!tracker_) return;
    tracker_->update(generation_, [&](ScanProgress& p){ p.range = range; });
}

void ScanSession::set_total(uint64_t total){
    if(!tracker_) return;
    std::lock_guard<std::mutex> lock(tracker_->mutex_);
    if(tracker_->generation_ != generation_ || !tracker_->state_.active) return;
    tracker_->state_.total = total;
    tracker_->state_.scanned = 0;
    tracker_->probing_started_ = std::chrono::steady_clock::now();
}

void ScanSession::record_probe(bool found){
    if(!tracker_) return;
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(tracker_->mutex_);
    if(tracker_->generation_ != generation_ || !tracker_->state_.active) return;
    ScanProgress& p = tracker_->state_;
    ++p.scanned;
    if(found) ++p.found;
    if(p.total > 0){
        double pct = 15.0 + 75.0 * (static_cast<double>(p.scanned) / static_cast<double>(p.total));
        p.percent = std::max(p.percent, std::min(pct, 99.0));
        double elapsed = std::chrono::duration<double>(now - tracker_->probing_started_).count();
        double per_probe = elapsed / static_cast<double>(p.scanned);
        uint64_t remaining = p.total > p.scanned ? p.total - p.scanned : 0;
        p.estimated_remaining_seconds = per_probe * static_cast<double>(remaining);
    }
    if(!p.cancel_requested)
        p.step = "Scanned " + std::to_string(p.scanned) + "/" + std::to_string(p.total) + " addresses - found " + std::to_string(p.found);
}

void ScanSession::step(const std::string& description, std::optional<double> percent){
    if(!tracker_) return;
    tracker_->update(generation_, [&](ScanProgress& p){
        if(!p.cancel_requested) p.step = description;
        if(percent) p.percent = std::max(p.percent, std::min(std::max(*percent, 0.0), 99.0));
    });
}

void ScanSession::set_found(uint64_t found){
    if(!tracker_) return;
    tracker_->update(generation_, [&](ScanProgress& p){ p.found = found; });
}

void ScanSession::complete(const std::string& description){
    if(!tracker_) return;
    tracker_->close(generation_, true, description, "");
    tracker_ = nullptr;
}

void ScanSession::fail(const std::string& error){
    if(!tracker_) return;
    tracker_->close(generation_, false, "", error);
    tracker_ = nullptr;
}

// --- ScanProgressTracker ---

std::optional<ScanSession> ScanProgressTracker::try_begin(ScanKind kind, std::optional<NetworkRange> range, ScanProgress* current){
    std::lock_guard<std::mutex> lock(mutex_);
    if(state_.active){
        if(current){ *current = state_; fill_timing(*current); }
        return std::nullopt;
    }
    ++generation_;
    token_ = CancelToken();
    state_ = ScanProgress{};
    state_.active = true;
    state_.kind = kind;
    state_.started_at = std::chrono::system_clock::now();
    state_.step = "Starting scan...";
    state_.range = range;
    state_.can_cancel = true;
    started_steady_ = std::chrono::steady_clock::now();
    probing_started_ = started_steady_;
    Logger::instance().info(std::string("Scan started (") + scan_kind_name(kind) + (range ? ", " + range->cidr() : std::string()) + ")");
    return ScanSession(this, generation_, token_);
}

void ScanProgressTracker::update(uint64_t generation, const std::function<void(ScanProgress&)>& fn){
    std::lock_guard<std::mutex> lock(mutex_);
    if(generation != generation_ || !state_.active) return;
    fn(state_);
}

void ScanProgressTracker::close(uint64_t generation, bool completed, const std::string& description, const std::string& error){
    std::lock_guard<std::mutex> lock(mutex_);
    if(generation != generation_ || !state_.active) return;
    state_.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_steady_).count();
    state_.active = false;
    state_.can_cancel = false;
    state_.estimated_remaining_seconds = 0;
    if(token_.cancelled()){
        state_.cancelled = true;
        state_.step = "Scan cancelled";
        Logger::instance().info("Scan cancelled after " + std::to_string(state_.scanned) + " probes, found " + std::to_string(state_.found));
    } else if(completed){
        state_.percent = 100;
        state_.step = description;
        Logger::instance().info("Scan completed: " + description);
    } else {
        state_.error = error;
        state_.step = "Scan error: " + error;
        Logger::instance().error("Scan failed: " + error);
    }
}

void ScanProgressTracker::fill_timing(ScanProgress& p) const {
    if(p.active) p.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_steady_).count();
}

ScanProgress ScanProgressTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ScanProgress p = state_;
    fill_timing(p);
    return p;
}

bool ScanProgressTracker::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.active;
}

CancelResult ScanProgressTracker::request_cancel(){
    std::lock_guard<std::mutex> lock(mutex_);
    if(!state_.active) return CancelResult::NotActive;
    if(state_.cancel_requested) return CancelResult::AlreadyRequested;
    state_.cancel_requested = true;
    state_.can_cancel = false;
    state_.step = "Cancelling scan...";
    token_.request();
    Logger::instance().info(std::string("Scan cancellation requested: ") + scan_kind_name(state_.kind));
    return CancelResult::Accepted;
}

}
