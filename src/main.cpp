#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/DeviceService.h"
#include "core/JSONWriter.h"
#include "core/JsonUtil.h"
#include "core/Logging.h"
#include "core/Privilege.h"
#include "net/Prober.h"
#include "net/UpnpDeviceControl.h"
#include <csignal>
#include <fstream>
#include <iostream>
#include <thread>

using namespace plug_scan;

static volatile std::sig_atomic_t g_interrupted = 0;

static void on_sigint(int){ g_interrupted = 1; }

static void install_sigint(){
    struct sigaction sa{};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

static void merge_summary(std::optional<DiscoverySummary>& into, DiscoverySummary from){
    if(!into){ into = std::move(from); return; }
    into->added += from.added;
    into->already_known += from.already_known;
    into->failed += from.failed;
    for(auto& r : from.results) into->results.push_back(std::move(r));
    for(auto& s : from.strategies_run) into->strategies_run.push_back(std::move(s));
    for(auto& f : from.failed_strategies) into->failed_strategies.push_back(std::move(f));
    into->cancelled = into->cancelled || from.cancelled;
    into->device_count = from.device_count;
    into->finished_at = from.finished_at;
}

static bool emit(const Config& cfg, const std::string& json, bool append = false){
    if(cfg.output_file.empty()){
        std::cout << json;
        if(json.empty() || json.back() != '\n') std::cout << "\n";
        std::cout.flush();
        return true;
    }
    std::ofstream ofs(cfg.output_file, append ? std::ios::app : std::ios::trunc);
    if(!ofs){ std::cerr << "Cannot write output file: " << cfg.output_file << "\n"; return false; }
    ofs << json;
    if(json.empty() || json.back() != '\n') ofs << "\n";
    return static_cast<bool>(ofs);
}

static void print_progress(const ScanProgress& p){
    std::cerr << "[" << jsonutil::fixed1(p.percent) << "%] " << p.step;
    if(p.active && p.estimated_remaining_seconds > 0) std::cerr << " (about " << jsonutil::format_duration(p.estimated_remaining_seconds) << " left)";
    std::cerr << "\n";
}

static int run_scan(DeviceService& service, const Config& cfg, const JSONWriter& writer, std::optional<DiscoverySummary>& discovery){
    ScanStart start = service.start_scan(cfg.network);
    if(!start.accepted){
        std::cerr << writer.write(start) << "\n";
        return 1;
    }
    bool cancel_sent = false;
    std::string last_step;
    while(!service.wait_for_scan(std::chrono::milliseconds(250))){
        if(g_interrupted && !cancel_sent){
            cancel_sent = true;
            service.cancel_scan();
        }
        if(cfg.progress){
            ScanProgress p = service.progress();
            if(p.step != last_step){ print_progress(p); last_step = p.step; }
        }
    }
    ScanProgress final_state = service.progress();
    if(cfg.progress) print_progress(final_state);
    if(auto s = service.last_scan_summary()) merge_summary(discovery, std::move(*s));
    if(!final_state.error.empty()){
        std::cerr << "Scan failed: " << final_state.error << "\n";
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)){
        if(parser.early_exit()) return 0;
        parser.print_help();
        return 2;
    }
    ConfigValidator validator;
    if(!validator.validate(cfg)) return 2;

    LogLevel lvl = LogLevel::Info;
    parse_log_level(cfg.log_level, lvl);
    Logger::instance().set_level(lvl);

    if(cfg.drop_priv && !drop_capabilities()){
        std::cerr << "Failed to drop capabilities\n";
        return 4;
    }

    JSONWriter writer(cfg.pretty);
    if(!cfg.validate_network.empty()){
        RangeValidation v = validate_network(cfg.validate_network);
        if(!emit(cfg, writer.write(v, cfg.validate_network))) return 1;
        return v.ok() ? 0 : 1;
    }

    install_sigint();
    UpnpDeviceControl control;
    TcpProber prober;
    DeviceService service(cfg, control, prober);

    int rc = 0;
    std::optional<DiscoverySummary> discovery;
    if(cfg.broadcast && !g_interrupted){
        RefreshRequest req;
        req.broadcast = true;
        RefreshResult r = service.refresh(req);
        if(r.summary) merge_summary(discovery, std::move(*r.summary));
    }
    if(cfg.scan && !g_interrupted) rc = run_scan(service, cfg, writer, discovery);
    if(!cfg.addresses.empty() && !g_interrupted){
        std::string text;
        for(const auto& a : cfg.addresses){ if(!text.empty()) text += ","; text += a; }
        AddressDiscoveryResult r = service.discover_addresses(text);
        if(r.error.empty()) merge_summary(discovery, std::move(r.summary));
    }

    StatusReport status = service.status();
    if(!emit(cfg, writer.write_pass(discovery, service.devices(), status))) return 1;

    if(cfg.watch_interval_s > 0){
        JSONWriter line_writer(false);
        service.start_background();
        auto next = std::chrono::steady_clock::now() + std::chrono::seconds(cfg.watch_interval_s);
        while(!g_interrupted){
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            if(std::chrono::steady_clock::now() < next) continue;
            next += std::chrono::seconds(cfg.watch_interval_s);
            if(!emit(cfg, line_writer.write(service.status()), true)){ rc = 1; break; }
        }
        Logger::instance().info("Interrupted; stopping");
        service.stop_background();
    }
    return rc;
}
