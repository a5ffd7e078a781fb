#include "ConfigValidator.h"
#include "Logging.h"
#include "NetworkRange.h"
#include <iostream>

namespace plug_scan {

bool ConfigValidator::validate(Config& cfg) {
    // pretty vs compact: if both set, compact wins
    if(cfg.pretty && cfg.compact) {
        cfg.pretty = false;
    }

    if(!validate_log_level(cfg.log_level)) {
        return false;
    }

    if(!check_range(cfg.control_port, 1, 65535, "--port")) return false;
    if(!check_range(cfg.probe_timeout_ms, 50, 60000, "--probe-timeout")) return false;
    if(!check_range(cfg.scan_concurrency, 1, 1024, "--scan-concurrency")) return false;
    if(!check_range(cfg.max_scan_hosts, 1, 16777216, "--max-hosts")) return false;
    if(!check_range(cfg.broadcast_timeout_ms, 100, 120000, "--broadcast-timeout")) return false;
    if(!check_range(cfg.identify_timeout_ms, 50, 60000, "--identify-timeout")) return false;
    if(!check_range(cfg.status_timeout_ms, 50, 60000, "--status-timeout")) return false;
    if(!check_range(cfg.status_concurrency, 1, 256, "--status-concurrency")) return false;
    if(!check_range(cfg.status_deadline_ms, 100, 600000, "--status-deadline")) return false;
    if(!check_range(cfg.discovery_interval_s, 1, 86400, "--interval")) return false;
    if(!check_range(cfg.watch_interval_s, 0, 86400, "--watch")) return false;

    if(cfg.status_deadline_ms < cfg.status_timeout_ms) {
        std::cerr << "--status-deadline must not be shorter than --status-timeout\n";
        return false;
    }

    if(!cfg.network.empty()) {
        RangeValidation v = validate_network(cfg.network);
        if(!v.ok()) {
            std::cerr << "Invalid --network: " << v.error.message << "\n";
            return false;
        }
        if(v.range->host_count() > static_cast<uint64_t>(cfg.max_scan_hosts)) {
            std::cerr << "--network " << v.range->cidr() << " has " << v.range->host_count() << " hosts, more than --max-hosts " << cfg.max_scan_hosts << "\n";
            return false;
        }
        // a custom range implies scanning it
        cfg.scan = true;
    }

    for(const auto& a : cfg.addresses) {
        uint32_t addr = 0;
        if(!parse_ipv4(a, addr)) {
            std::cerr << "Invalid --address value: " << a << "\n";
            return false;
        }
    }

    if(cfg.progress && !cfg.scan) {
        std::cerr << "--progress requires --scan or --network\n";
        return false;
    }

    return true;
}

bool ConfigValidator::validate_log_level(const std::string& level) {
    LogLevel lvl;
    if(!parse_log_level(level, lvl)) {
        std::cerr << "Invalid --log-level value: " << level << "\n";
        return false;
    }
    return true;
}

bool ConfigValidator::check_range(int value, int min, int max, const std::string& flag_name) {
    if(value < min || value > max) {
        std::cerr << flag_name << " must be between " << min << " and " << max << " (got " << value << ")\n";
        return false;
    }
    return true;
}

}
