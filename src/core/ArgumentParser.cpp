#include "ArgumentParser.h"
#include "BuildInfo.h"
#include <iostream>

namespace plug_scan {

std::vector<std::string> ArgumentParser::split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur; for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c);} if(!cur.empty()) out.push_back(cur); return out; }

static bool parse_int(const std::string& v, const char* flag, int& out){
    try {
        size_t used = 0; int n = std::stoi(v, &used);
        if(used != v.size()) throw std::invalid_argument(v);
        out = n; return true;
    } catch(const std::exception&) {
        std::cerr << "Invalid integer for " << flag << "\n";
        return false;
    }
}

std::vector<ArgumentParser::FlagSpec> ArgumentParser::build_specs(Config& cfg){
    auto int_flag = [](const char* flag, int& field){ return [flag, &field](const std::string& v){ return parse_int(v, flag, field); }; };
    return {
        {"--network", ArgKind::String, "Range to scan (CIDR, a.b.c.d/mask or single address)", [&](const std::string& v){ cfg.network = v; return true; }},
        {"--scan", ArgKind::None, "Run a range scan (custom --network or auto-detected)", [&](const std::string&){ cfg.scan = true; return true; }},
        {"--address", ArgKind::CSV, "Probe specific addresses (comma-separated)", [&](const std::string& v){ cfg.addresses = split_csv(v); return true; }},
        {"--no-broadcast", ArgKind::None, "Skip SSDP broadcast discovery", [&](const std::string&){ cfg.broadcast = false; return true; }},
        {"--broadcast-timeout", ArgKind::Int, "SSDP listen window in ms", int_flag("--broadcast-timeout", cfg.broadcast_timeout_ms)},
        {"--identify-timeout", ArgKind::Int, "Device description fetch timeout in ms", int_flag("--identify-timeout", cfg.identify_timeout_ms)},
        {"--port", ArgKind::Int, "Device control port", int_flag("--port", cfg.control_port)},
        {"--probe-timeout", ArgKind::Int, "Per-address probe timeout in ms", int_flag("--probe-timeout", cfg.probe_timeout_ms)},
        {"--scan-concurrency", ArgKind::Int, "Max concurrent probes", int_flag("--scan-concurrency", cfg.scan_concurrency)},
        {"--max-hosts", ArgKind::Int, "Refuse scans over more hosts than N", int_flag("--max-hosts", cfg.max_scan_hosts)},
        {"--no-verify", ArgKind::None, "Accept any open control port without fetching setup.xml", [&](const std::string&){ cfg.verify_signature = false; return true; }},
        {"--parallel", ArgKind::None, "Run discovery strategies concurrently", [&](const std::string&){ cfg.parallel = true; return true; }},
        {"--status-timeout", ArgKind::Int, "Per-device state query timeout in ms", int_flag("--status-timeout", cfg.status_timeout_ms)},
        {"--status-concurrency", ArgKind::Int, "Max concurrent state queries", int_flag("--status-concurrency", cfg.status_concurrency)},
        {"--status-deadline", ArgKind::Int, "Overall status batch deadline in ms", int_flag("--status-deadline", cfg.status_deadline_ms)},
        {"--interval", ArgKind::Int, "Background discovery period in seconds", int_flag("--interval", cfg.discovery_interval_s)},
        {"--no-auto-discovery", ArgKind::None, "Start with background discovery disabled", [&](const std::string&){ cfg.auto_discovery = false; return true; }},
        {"--watch", ArgKind::Int, "Keep running, emit status every N seconds", int_flag("--watch", cfg.watch_interval_s)},
        {"--alias-file", ArgKind::String, "Alias store path (empty = memory only)", [&](const std::string& v){ cfg.alias_file = v; return true; }},
        {"--validate", ArgKind::String, "Validate a network specification and exit", [&](const std::string& v){ cfg.validate_network = v; return true; }},
        {"--output", ArgKind::String, "Write JSON to FILE (default stdout)", [&](const std::string& v){ cfg.output_file = v; return true; }},
        {"--pretty", ArgKind::None, "Pretty-print JSON", [&](const std::string&){ cfg.pretty = true; return true; }},
        {"--compact", ArgKind::None, "Minified JSON output", [&](const std::string&){ cfg.compact = true; return true; }},
        {"--progress", ArgKind::None, "Print scan progress to stderr", [&](const std::string&){ cfg.progress = true; return true; }},
        {"--log-level", ArgKind::String, "error|warn|info|debug|trace", [&](const std::string& v){ cfg.log_level = v; return true; }},
        {"--drop-priv", ArgKind::None, "Drop Linux capabilities early", [&](const std::string&){ cfg.drop_priv = true; return true; }},
    };
}

void ArgumentParser::print_help() const {
    std::cout << "plug-scan options:\n";
    Config scratch;
    auto specs = build_specs(scratch);
    auto line = [](const std::string& name, const std::string& help){
        std::cout << "  " << name; if(name.size() < 30) for(size_t i=name.size(); i<30; ++i) std::cout << ' '; else std::cout << ' '; std::cout << help << "\n"; };
    for(const auto& s : specs){
        std::string name = s.name;
        if(s.kind == ArgKind::Int) name += " N";
        else if(s.kind == ArgKind::String) name += " VALUE";
        else if(s.kind == ArgKind::CSV) name += " a,b,...";
        line(name, s.help);
    }
    line("--version", "Print version & exit");
    line("--help", "Show this help");
}

void ArgumentParser::print_version() const {
    std::cout << "plug-scan " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
              << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
              << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    early_exit_ = false;
    auto specs = build_specs(cfg);
    auto find_spec = [&](const std::string& flag)->FlagSpec*{ for(auto& s: specs) if(flag==s.name) return &s; return nullptr; };
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--help"){ print_help(); early_exit_ = true; return false; }
        if(a=="--version"){ print_version(); early_exit_ = true; return false; }
        auto* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: " << a << "\n"; return false; }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i+1>=argc){ std::cerr << "Missing value for " << a << "\n"; return false; }
            val = argv[++i];
        }
        if(!spec->apply(val)) return false;
    }
    return true;
}

}
