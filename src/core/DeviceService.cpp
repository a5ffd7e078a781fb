#include "DeviceService.h"
#include "Logging.h"
#include "ThreadPool.h"
#include "../discovery/AddressDiscovery.h"
#include "../net/Prober.h"
#include <algorithm>
#include <system_error>

namespace plug_scan {

namespace {
DiscoveryOrchestrator::Options orchestrator_options(const Config& cfg){
    DiscoveryOrchestrator::Options o;
    o.identify_timeout = std::chrono::milliseconds(cfg.identify_timeout_ms);
    o.identify_concurrency = static_cast<size_t>(cfg.status_concurrency);
    o.parallel = cfg.parallel;
    return o;
}

BatchStatusChecker::Options status_options(const Config& cfg){
    BatchStatusChecker::Options o;
    o.per_device_timeout = std::chrono::milliseconds(cfg.status_timeout_ms);
    o.max_concurrency = static_cast<size_t>(cfg.status_concurrency);
    o.deadline = std::chrono::milliseconds(cfg.status_deadline_ms);
    return o;
}

NetworkRangeResolver::Options resolver_options(const Config& cfg){
    NetworkRangeResolver::Options o;
    o.control_port = static_cast<uint16_t>(cfg.control_port);
    o.probe_timeout = std::chrono::milliseconds(cfg.probe_timeout_ms);
    return o;
}

std::string plural(size_t n, const std::string& word){ return std::to_string(n) + " " + word + (n == 1 ? "" : "s"); }
}

std::string address_summary_message(size_t total, const DiscoverySummary& s){
    std::string parts;
    auto add = [&](const std::string& p){ if(!parts.empty()) parts += ", "; parts += p; };
    if(s.added > 0) add(std::to_string(s.added) + " new device" + (s.added == 1 ? "" : "s") + " added");
    if(s.already_known > 0) add(plural(s.already_known, "device") + " already known");
    if(s.failed > 0) add(std::to_string(s.failed) + " failed");
    return "Processed " + plural(total, "IP") + ": " + parts;
}

DeviceService::DeviceService(const Config& cfg, DeviceControl& control, Prober& prober)
    : cfg_(cfg), control_(control), prober_(prober), aliases_(cfg.alias_file), registry_(aliases_),
      orchestrator_(registry_, control_, orchestrator_options(cfg)), status_checker_(control_, status_options(cfg)) {
    aliases_.load();
    orchestrator_.register_all_default(prober_, cfg_);
    scheduler_ = std::make_unique<DiscoveryScheduler>(tracker_, [this](ScanSession& session){
        DiscoveryRequest req;
        req.broadcast = cfg_.broadcast;
        std::optional<NetworkRange> range;
        if(!cfg_.network.empty()){
            if(auto err = resolve_range(cfg_.network, range)) throw std::runtime_error(err->message);
        } else {
            session.step("Detecting network range", 2.0);
            range = detect_range(session.token());
        }
        req.range = range;
        run_discovery(req, &session);
    }, std::chrono::milliseconds(static_cast<long long>(cfg.discovery_interval_s) * 1000), cfg.auto_discovery);
}

DeviceService::~DeviceService(){
    tracker_.request_cancel();
    stop_background();
    join_job();
}

void DeviceService::start_background(){
    if(scheduler_->enabled()) scheduler_->start();
}

void DeviceService::stop_background(){
    scheduler_->stop();
}

RangeValidation DeviceService::validate_network(const std::string& input) const {
    return plug_scan::validate_network(input);
}

std::optional<ValidationError> DeviceService::resolve_range(const std::string& network, std::optional<NetworkRange>& out) const {
    RangeValidation v = plug_scan::validate_network(network);
    if(!v.ok()) return v.error;
    if(v.range->host_count() > static_cast<uint64_t>(cfg_.max_scan_hosts)){
        return ValidationError{network, "Network range too large: " + std::to_string(v.range->host_count()) + " hosts (maximum " +
                               std::to_string(cfg_.max_scan_hosts) + ")"};
    }
    out = v.range;
    return std::nullopt;
}

NetworkRange DeviceService::detect_range(const CancelToken& token){
    NetworkRangeResolver resolver(prober_, resolver_options(cfg_));
    NetworkRange r = resolver.pick(resolver.auto_detect(&token));
    if(token.cancelled()) Logger::instance().info("Network range detection cancelled");
    else Logger::instance().info("Auto-detected network range " + r.cidr());
    return r;
}

DiscoverySummary DeviceService::run_discovery(const DiscoveryRequest& request, ScanSession* session){
    DiscoverySummary summary = orchestrator_.discover(request, session);
    std::lock_guard<std::mutex> lock(mutex_);
    last_discovery_ = summary.finished_at;
    ++discovery_count_;
    return summary;
}

void DeviceService::join_job(){
    std::lock_guard<std::mutex> lock(job_mutex_);
    if(job_.joinable()) job_.join();
}

ScanStart DeviceService::start_scan(const std::string& network){
    ScanStart res;
    std::optional<NetworkRange> range;
    if(!network.empty()){
        if(auto err = resolve_range(network, range)){
            res.error = err;
            res.message = err->message;
            return res;
        }
    }
    res.kind = network.empty() ? ScanKind::Network : ScanKind::Custom;
    res.range = range;
    ScanProgress current;
    auto session = tracker_.try_begin(res.kind, range, &current);
    if(!session){
        res.conflict = ScanConflict{current};
        res.message = "Scan already in progress";
        return res;
    }
    std::lock_guard<std::mutex> lock(job_mutex_);
    if(job_.joinable()) job_.join(); // previous job already closed its session
    try {
        job_ = std::thread([this, s = std::move(*session), range]() mutable {
            try {
                NetworkRange target;
                if(range) target = *range;
                else {
                    s.step("Detecting network range", 2.0);
                    target = detect_range(s.token());
                }
                DiscoveryRequest req;
                req.range = target;
                DiscoverySummary summary = run_discovery(req, &s);
                std::lock_guard<std::mutex> lk(mutex_);
                last_scan_ = std::move(summary);
            } catch(const std::exception& ex) {
                Logger::instance().error(std::string("Scan job failed: ") + ex.what());
                s.fail(ex.what());
            }
        });
    } catch(const std::system_error& ex) {
        res.message = std::string("Unable to start scan: ") + ex.what();
        return res;
    }
    res.accepted = true;
    res.message = range ? "Scan of " + range->cidr() + " started" : "Network scan started";
    return res;
}

bool DeviceService::wait_for_scan(std::chrono::milliseconds timeout){
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(tracker_.active()){
        if(std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    join_job();
    return true;
}

std::optional<DiscoverySummary> DeviceService::last_scan_summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_scan_;
}

AddressDiscoveryResult DeviceService::discover_addresses(const std::string& text){
    AddressDiscoveryResult res;
    DiscoveryRequest req;
    req.addresses = split_addresses(text);
    res.total = req.addresses.size();
    if(req.addresses.empty()){
        res.error = "No valid IP addresses provided";
        return res;
    }
    res.summary = run_discovery(req, nullptr);
    res.message = address_summary_message(res.total, res.summary);
    Logger::instance().info(res.message);
    return res;
}

RefreshResult DeviceService::refresh(const RefreshRequest& request){
    RefreshResult res;
    std::optional<NetworkRange> range;
    if(request.scan && !request.network.empty()){
        if(auto err = resolve_range(request.network, range)){ res.error = err; return res; }
    }
    ScanProgress current;
    auto session = tracker_.try_begin(ScanKind::Refresh, range, &current);
    if(!session){
        res.conflict = ScanConflict{current};
        return res;
    }
    if(request.scan && !range){
        session->step("Detecting network range", 2.0);
        range = detect_range(session->token());
    }
    DiscoveryRequest req;
    req.broadcast = request.broadcast;
    req.range = range;
    res.summary = run_discovery(req, &*session);
    return res;
}

StatusReport DeviceService::status(){
    return status_checker_.check_all(registry_.snapshot());
}

std::optional<ForgetResult> DeviceService::forget(const std::string& udn){
    auto d = registry_.forget(udn);
    if(!d) return std::nullopt;
    ForgetResult r;
    r.removed.push_back(std::move(*d));
    r.remaining = registry_.size();
    return r;
}

ForgetResult DeviceService::forget_all(){
    ForgetResult r;
    r.removed = registry_.forget_all();
    r.remaining = registry_.size();
    return r;
}

std::optional<AliasResult> DeviceService::get_alias(const std::string& udn) const {
    auto d = registry_.find(udn);
    if(!d) return std::nullopt;
    return AliasResult{d->udn, d->alias, d->display_name()};
}

std::optional<AliasResult> DeviceService::set_alias(const std::string& udn, const std::string& alias){
    auto d = registry_.set_alias(udn, alias);
    if(!d) return std::nullopt;
    return AliasResult{d->udn, d->alias, d->display_name()};
}

std::optional<AliasResult> DeviceService::delete_alias(const std::string& udn){
    auto d = registry_.clear_alias(udn);
    if(!d) return std::nullopt;
    return AliasResult{d->udn, d->alias, d->display_name()};
}

CommandResult DeviceService::invoke(const std::string& udn, const std::string& command, const std::vector<std::string>& args){
    auto d = registry_.find(udn);
    if(!d) throw DeviceNotFound(udn);
    const auto& cmds = supported_commands();
    if(std::find(cmds.begin(), cmds.end(), command) == cmds.end()) throw DeviceError("Unsupported command: " + command);
    return control_.invoke(*d, command, args, std::chrono::milliseconds(cfg_.status_timeout_ms));
}

BulkPowerResult DeviceService::bulk_power(bool on){
    BulkPowerResult res;
    res.on = on;
    auto devs = registry_.snapshot();
    res.total = devs.size();
    if(devs.empty()){
        res.error = "No devices available";
        return res;
    }
    const std::string command = on ? "on" : "off";
    Logger::instance().info("Turning " + command + " all " + std::to_string(devs.size()) + " devices");
    res.results.resize(devs.size());
    parallel_for(devs.size(), static_cast<size_t>(cfg_.status_concurrency), [&](size_t i){
        const Device& d = devs[i];
        BulkItem& item = res.results[i];
        item.udn = d.udn; item.name = d.display_name(); item.host = d.host;
        try {
            control_.invoke(d, command, {}, std::chrono::milliseconds(cfg_.status_timeout_ms));
            item.status = "success";
            item.message = "Device turned " + command + " successfully";
        } catch(const std::exception& ex) {
            item.status = "error";
            item.message = ex.what();
            Logger::instance().error("Failed to turn " + command + " " + d.display_name() + ": " + ex.what());
        }
    });
    for(auto& item : res.results){
        if(item.status == "success") ++res.successful;
        else if(item.status == "error") ++res.failed;
        else { item.status = "skipped"; item.message = "Device was not processed"; ++res.skipped; }
    }
    res.message = "Bulk turn " + command + " completed: " + std::to_string(res.successful) + " successful, " + std::to_string(res.failed) + " failed";
    return res;
}

DiscoveryStatus DeviceService::discovery_status() const {
    DiscoveryStatus s;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.last_discovery = last_discovery_;
        s.discovery_count = discovery_count_;
    }
    s.auto_discovery_enabled = scheduler_->enabled();
    s.background_running = scheduler_->running();
    s.interval = scheduler_->period();
    s.device_count = registry_.size();
    return s;
}

bool DeviceService::set_auto_discovery(std::optional<bool> enabled){
    bool value = enabled ? *enabled : !scheduler_->enabled();
    scheduler_->set_enabled(value);
    if(value && !scheduler_->running()) scheduler_->start();
    return value;
}

NetworkDiagnostics DeviceService::network_diagnostics(){
    NetworkDiagnostics diag;
    auto local = local_ipv4_addresses();
    for(uint32_t a : local) diag.local_addresses.push_back(ipv4_to_string(a));
    NetworkRangeResolver resolver(prober_, resolver_options(cfg_));
    diag.candidates = resolver.auto_detect(local);
    diag.selected = resolver.pick(diag.candidates);
    auto devs = registry_.snapshot();
    for(size_t i=0; i<devs.size() && i<3; ++i){
        DeviceProbe p;
        p.udn = devs[i].udn; p.name = devs[i].display_name(); p.host = devs[i].host; p.port = devs[i].port;
        uint32_t addr = 0;
        p.result = parse_ipv4(p.host, addr) ? prober_.connect(addr, p.port, std::chrono::milliseconds(cfg_.probe_timeout_ms)) : ConnectResult::Error;
        diag.device_probes.push_back(std::move(p));
    }
    return diag;
}

}
