#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace plug_scan {

struct Config {
    // Device protocol
    int control_port = 49153;
    // Range scan
    int probe_timeout_ms = 2000;
    int scan_concurrency = 50;
    bool verify_signature = true; // GET /setup.xml before accepting an open port
    int max_scan_hosts = 65536; // refuse larger ranges at scan start
    std::string network; // custom range; empty = auto-detect
    bool scan = false; // run a range scan in the one-shot CLI pass
    // Broadcast / manual discovery
    bool broadcast = true;
    int broadcast_timeout_ms = 10000;
    int identify_timeout_ms = 5000;
    std::vector<std::string> addresses;
    bool parallel = false; // run discovery strategies concurrently
    // Status checks
    int status_timeout_ms = 5000;
    int status_concurrency = 10;
    int status_deadline_ms = 15000;
    // Background discovery
    bool auto_discovery = true;
    int discovery_interval_s = 300;
    int watch_interval_s = 0; // 0 = single pass
    // Persistence
    std::string alias_file = "/var/lib/plug-scan/aliases.json"; // empty = memory only
    // Output
    std::string output_file;
    bool pretty = false;
    bool compact = false;
    bool progress = false;
    std::string validate_network; // --validate
    std::string log_level = "info";
    // Hardening
    bool drop_priv = false;
};

}
