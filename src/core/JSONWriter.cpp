#include "JSONWriter.h"
#include "JsonUtil.h"
#include <map>
#include <sstream>

namespace plug_scan {
namespace {
    struct CanonVal {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM, T_BOOL, T_NULL } type = T_OBJ;
        std::map<std::string, CanonVal> obj;
        std::vector<CanonVal> arr;
        std::string str; // string, number or literal token text
        CanonVal() = default;
        explicit CanonVal(Type t): type(t) {}
    };

    using jsonutil::escape; using jsonutil::time_to_iso;

    static void canon_emit(const CanonVal& v, std::ostream& os);

    static void put_str(CanonVal& o, const std::string& k, const std::string& v){ o.obj[k].type = CanonVal::T_STR; o.obj[k].str = v; }
    static void put_num(CanonVal& o, const std::string& k, long long v){ o.obj[k].type = CanonVal::T_NUM; o.obj[k].str = std::to_string(v); }
    static void put_dbl(CanonVal& o, const std::string& k, double v){ o.obj[k].type = CanonVal::T_NUM; o.obj[k].str = jsonutil::fixed1(v); }
    static void put_bool(CanonVal& o, const std::string& k, bool v){ o.obj[k].type = CanonVal::T_BOOL; o.obj[k].str = v ? "true" : "false"; }
    static void put_null(CanonVal& o, const std::string& k){ o.obj[k].type = CanonVal::T_NULL; o.obj[k].str = "null"; }
    static void put_opt(CanonVal& o, const std::string& k, const std::optional<std::string>& v){ if(v) put_str(o, k, *v); else put_null(o, k); }
    static void put_time(CanonVal& o, const std::string& k, std::chrono::system_clock::time_point tp){
        std::string iso = time_to_iso(tp);
        if(iso.empty()) put_null(o, k); else put_str(o, k, iso);
    }
    static CanonVal str_val(const std::string& s){ CanonVal v{CanonVal::T_STR}; v.str = s; return v; }

    static void emit_array(const CanonVal& v, std::ostream& os) {
        os << '[';
        bool first = true;
        for (const auto& e : v.arr) {
            if (!first) os << ',';
            first = false;
            canon_emit(e, os);
        }
        os << ']';
    }

    static void emit_object(const CanonVal& v, std::ostream& os) {
        os << '{';
        bool first = true;
        for (const auto& kv : v.obj) {
            if (!first) os << ',';
            first = false;
            os << '"' << escape(kv.first) << '"' << ':';
            canon_emit(kv.second, os);
        }
        os << '}';
    }

    static void canon_emit(const CanonVal& v, std::ostream& os) {
        switch (v.type) {
            case CanonVal::T_STR:
                os << '"' << escape(v.str) << '"';
                break;
            case CanonVal::T_NUM:
            case CanonVal::T_BOOL:
            case CanonVal::T_NULL:
                os << v.str;
                break;
            case CanonVal::T_ARR:
                emit_array(v, os);
                break;
            case CanonVal::T_OBJ:
                emit_object(v, os);
                break;
        }
    }

    static std::string pretty_print_json(const std::string& compact_json) {
        std::string out;
        out.reserve(compact_json.size() * 2);
        int depth = 0;
        bool in_string = false;
        bool esc = false;

        auto indent = [&](int d) {
            for (int i = 0; i < d; i++) out.append("  ");
        };

        for (size_t i = 0; i < compact_json.size(); ++i) {
            char c = compact_json[i];
            if (in_string) {
                out.push_back(c);
                if (esc) esc = false;
                else if (c == '\\') esc = true;
                else if (c == '"') in_string = false;
                continue;
            }
            switch (c) {
                case '"':
                    out.push_back(c);
                    in_string = true;
                    break;
                case '{':
                case '[': {
                    out.push_back(c);
                    char next = i + 1 < compact_json.size() ? compact_json[i + 1] : '\0';
                    if (next == '}' || next == ']') { out.push_back(next); ++i; break; } // empty container
                    out.push_back('\n');
                    depth++;
                    indent(depth);
                    break;
                }
                case '}':
                case ']':
                    out.push_back('\n');
                    depth--;
                    if (depth < 0) depth = 0;
                    indent(depth);
                    out.push_back(c);
                    break;
                case ',':
                    out.push_back(c);
                    out.push_back('\n');
                    indent(depth);
                    break;
                case ':':
                    out.push_back(c);
                    out.push_back(' ');
                    break;
                default:
                    out.push_back(c);
                    break;
            }
        }
        out.push_back('\n');
        return out;
    }

    static CanonVal range_val(const NetworkRange& r) {
        CanonVal o{CanonVal::T_OBJ};
        put_str(o, "network_address", ipv4_to_string(r.network_address()));
        put_str(o, "broadcast_address", ipv4_to_string(r.broadcast_address()));
        put_str(o, "cidr", r.cidr());
        put_num(o, "prefix_length", r.prefix());
        put_num(o, "host_count", static_cast<long long>(r.host_count()));
        put_str(o, "first_host", ipv4_to_string(r.first_host()));
        put_str(o, "last_host", ipv4_to_string(r.last_host()));
        put_bool(o, "is_single_host", r.is_single_host());
        put_str(o, "estimated_scan_time", r.estimated_scan_time());
        return o;
    }

    static CanonVal progress_val(const ScanProgress& p) {
        CanonVal o{CanonVal::T_OBJ};
        put_bool(o, "is_scanning", p.active);
        put_str(o, "scan_type", scan_kind_name(p.kind));
        put_time(o, "start_time", p.started_at);
        put_dbl(o, "progress_percent", p.percent);
        put_str(o, "current_step", p.step);
        put_num(o, "ips_scanned", static_cast<long long>(p.scanned));
        put_num(o, "total_ips", static_cast<long long>(p.total));
        put_num(o, "devices_found", static_cast<long long>(p.found));
        if (p.range) o.obj["network_range"] = str_val(p.range->cidr()); else put_null(o, "network_range");
        put_bool(o, "cancel_requested", p.cancel_requested);
        put_bool(o, "can_cancel", p.can_cancel);
        put_bool(o, "cancelled", p.cancelled);
        if (!p.error.empty()) put_str(o, "error", p.error);
        put_dbl(o, "elapsed_time", p.elapsed_seconds);
        put_str(o, "elapsed_time_formatted", p.elapsed_seconds > 0 ? jsonutil::format_duration(p.elapsed_seconds) : "0s");
        put_dbl(o, "estimated_time_remaining", p.estimated_remaining_seconds);
        if (p.active && p.estimated_remaining_seconds > 0)
            put_str(o, "estimated_time_remaining_formatted", jsonutil::format_duration(p.estimated_remaining_seconds));
        else
            put_null(o, "estimated_time_remaining_formatted");
        return o;
    }

    static CanonVal info_val(const DeviceInfo& d) {
        CanonVal o{CanonVal::T_OBJ};
        put_str(o, "udn", d.udn);
        put_str(o, "name", d.name);
        put_str(o, "model", d.model);
        put_str(o, "serial", d.serial);
        put_str(o, "ip_address", d.host);
        put_num(o, "port", d.port);
        return o;
    }

    static CanonVal device_val(const Device& d) {
        CanonVal o{CanonVal::T_OBJ};
        put_str(o, "udn", d.udn);
        put_str(o, "name", d.name);
        put_opt(o, "alias", d.alias);
        put_str(o, "display_name", d.display_name());
        put_str(o, "model", d.model);
        put_str(o, "serial", d.serial);
        put_str(o, "ip_address", d.host);
        put_num(o, "port", d.port);
        put_time(o, "first_seen", d.first_seen);
        put_time(o, "last_seen", d.last_seen);
        return o;
    }

    static CanonVal devices_val(const std::vector<Device>& devices) {
        CanonVal arr{CanonVal::T_ARR};
        for (const auto& d : devices) arr.arr.push_back(device_val(d));
        return arr;
    }

    static CanonVal summary_val(const DiscoverySummary& s) {
        CanonVal o{CanonVal::T_OBJ};
        put_num(o, "newly_discovered", static_cast<long long>(s.added));
        put_num(o, "already_existed", static_cast<long long>(s.already_known));
        put_num(o, "failed", static_cast<long long>(s.failed));
        put_num(o, "device_count", static_cast<long long>(s.device_count));
        put_bool(o, "cancelled", s.cancelled);
        put_time(o, "discovery_time", s.finished_at);
        CanonVal run{CanonVal::T_ARR};
        for (const auto& n : s.strategies_run) run.arr.push_back(str_val(n));
        o.obj["strategies"] = std::move(run);
        CanonVal failed{CanonVal::T_ARR};
        for (const auto& f : s.failed_strategies) {
            CanonVal e{CanonVal::T_OBJ};
            put_str(e, "strategy", f.strategy);
            put_str(e, "error", f.error);
            put_str(e, "message", "strategy " + f.strategy + " failed");
            failed.arr.push_back(std::move(e));
        }
        o.obj["failed_strategies"] = std::move(failed);
        CanonVal results{CanonVal::T_ARR};
        for (const auto& r : s.results) {
            CanonVal e{CanonVal::T_OBJ};
            put_str(e, "ip", r.input);
            put_str(e, "source", r.source);
            put_str(e, "outcome", candidate_outcome_name(r.outcome));
            put_bool(e, "success", r.outcome != CandidateOutcome::Failed);
            if (r.device) {
                e.obj["device"] = info_val(*r.device);
                put_bool(e, "already_discovered", r.outcome == CandidateOutcome::AlreadyKnown);
            }
            if (!r.error.empty()) put_str(e, "error", r.error);
            results.arr.push_back(std::move(e));
        }
        o.obj["results"] = std::move(results);
        return o;
    }

    static CanonVal status_val(const StatusReport& r) {
        CanonVal o{CanonVal::T_OBJ};
        CanonVal arr{CanonVal::T_ARR};
        for (const auto& d : r.devices) {
            CanonVal e{CanonVal::T_OBJ};
            put_str(e, "udn", d.udn);
            put_str(e, "name", d.name);
            put_str(e, "ip_address", d.host);
            put_str(e, "state", power_state_name(d.state));
            put_str(e, "status", connectivity_name(d.connectivity));
            if (!d.error.empty()) put_str(e, "error", d.error);
            put_time(e, "last_checked", d.checked_at);
            arr.arr.push_back(std::move(e));
        }
        o.obj["devices"] = std::move(arr);
        CanonVal sum{CanonVal::T_OBJ};
        put_num(sum, "total", static_cast<long long>(r.summary.total));
        put_num(sum, "online", static_cast<long long>(r.summary.online));
        put_num(sum, "offline", static_cast<long long>(r.summary.offline));
        put_num(sum, "unknown", static_cast<long long>(r.summary.unknown));
        o.obj["summary"] = std::move(sum);
        put_time(o, "timestamp", r.checked_at);
        return o;
    }

    static CanonVal validation_error_val(const ValidationError& e) {
        CanonVal o{CanonVal::T_OBJ};
        put_bool(o, "valid", false);
        put_str(o, "input", e.input);
        put_str(o, "error", e.message);
        return o;
    }

    static CanonVal conflict_val(const ScanConflict& c) {
        CanonVal o{CanonVal::T_OBJ};
        put_str(o, "error", "Scan already in progress");
        o.obj["current_scan"] = progress_val(c.current);
        return o;
    }

    static std::string finish(const CanonVal& root, bool pretty) {
        std::ostringstream os;
        canon_emit(root, os);
        if (pretty) return pretty_print_json(os.str());
        return os.str();
    }
}


std::string JSONWriter::write(const RangeValidation& v, const std::string& input) const {
    if (!v.ok()) return finish(validation_error_val(v.error), pretty_);
    CanonVal o{CanonVal::T_OBJ};
    put_bool(o, "valid", true);
    put_str(o, "input", input);
    put_str(o, "normalized", v.range->cidr());
    o.obj["info"] = range_val(*v.range);
    return finish(o, pretty_);
}

std::string JSONWriter::write(const ScanStart& s) const {
    if (s.error) return finish(validation_error_val(*s.error), pretty_);
    if (s.conflict) return finish(conflict_val(*s.conflict), pretty_);
    CanonVal o{CanonVal::T_OBJ};
    put_bool(o, "accepted", s.accepted);
    put_str(o, "scan_type", scan_kind_name(s.kind));
    put_str(o, "message", s.message);
    if (s.range) o.obj["network_info"] = range_val(*s.range); else put_null(o, "network_info");
    return finish(o, pretty_);
}

std::string JSONWriter::write(const ScanProgress& p) const {
    return finish(progress_val(p), pretty_);
}

std::string JSONWriter::write(CancelResult r) const {
    CanonVal o{CanonVal::T_OBJ};
    switch (r) {
        case CancelResult::Accepted:
            put_bool(o, "success", true);
            put_str(o, "message", "Scan cancellation requested");
            break;
        case CancelResult::AlreadyRequested:
            put_bool(o, "success", true);
            put_str(o, "message", "Scan cancellation already in progress");
            break;
        case CancelResult::NotActive:
            put_bool(o, "success", false);
            put_str(o, "error", "No scan in progress");
            break;
    }
    return finish(o, pretty_);
}

std::string JSONWriter::write(const DiscoverySummary& s) const {
    return finish(summary_val(s), pretty_);
}

std::string JSONWriter::write(const AddressDiscoveryResult& r) const {
    CanonVal o{CanonVal::T_OBJ};
    if (!r.error.empty()) {
        put_str(o, "error", r.error);
        return finish(o, pretty_);
    }
    o = summary_val(r.summary);
    put_num(o, "total_ips_processed", static_cast<long long>(r.total));
    put_str(o, "summary", r.message);
    return finish(o, pretty_);
}

std::string JSONWriter::write(const RefreshResult& r) const {
    if (r.error) return finish(validation_error_val(*r.error), pretty_);
    if (r.conflict) return finish(conflict_val(*r.conflict), pretty_);
    CanonVal o{CanonVal::T_OBJ};
    if (r.summary) o = summary_val(*r.summary);
    return finish(o, pretty_);
}

std::string JSONWriter::write(const std::vector<Device>& devices) const {
    return finish(devices_val(devices), pretty_);
}

std::string JSONWriter::write(const StatusReport& r) const {
    return finish(status_val(r), pretty_);
}

std::string JSONWriter::write(const ForgetResult& r) const {
    CanonVal o{CanonVal::T_OBJ};
    o.obj["removed"] = devices_val(r.removed);
    put_num(o, "removed_count", static_cast<long long>(r.removed.size()));
    put_num(o, "remaining_devices", static_cast<long long>(r.remaining));
    return finish(o, pretty_);
}

std::string JSONWriter::write(const AliasResult& r) const {
    CanonVal o{CanonVal::T_OBJ};
    put_str(o, "udn", r.udn);
    put_opt(o, "alias", r.alias);
    put_str(o, "display_name", r.display_name);
    return finish(o, pretty_);
}

std::string JSONWriter::write(const CommandResult& r) const {
    CanonVal o{CanonVal::T_OBJ};
    put_str(o, "command", r.command);
    if (r.state) put_str(o, "state", power_state_name(*r.state)); else put_null(o, "state");
    put_str(o, "message", r.message);
    return finish(o, pretty_);
}

std::string JSONWriter::write(const BulkPowerResult& r) const {
    CanonVal o{CanonVal::T_OBJ};
    if (!r.error.empty()) {
        put_str(o, "error", r.error);
        return finish(o, pretty_);
    }
    put_str(o, "message", r.message);
    CanonVal sum{CanonVal::T_OBJ};
    put_num(sum, "total_devices", static_cast<long long>(r.total));
    put_num(sum, "successful", static_cast<long long>(r.successful));
    put_num(sum, "failed", static_cast<long long>(r.failed));
    put_num(sum, "skipped", static_cast<long long>(r.skipped));
    o.obj["summary"] = std::move(sum);
    CanonVal arr{CanonVal::T_ARR};
    for (const auto& i : r.results) {
        CanonVal e{CanonVal::T_OBJ};
        put_str(e, "udn", i.udn);
        put_str(e, "name", i.name);
        put_str(e, "ip_address", i.host);
        put_str(e, "status", i.status);
        put_str(e, "message", i.message);
        arr.arr.push_back(std::move(e));
    }
    o.obj["results"] = std::move(arr);
    return finish(o, pretty_);
}

std::string JSONWriter::write(const DiscoveryStatus& s) const {
    CanonVal o{CanonVal::T_OBJ};
    put_time(o, "last_discovery", s.last_discovery);
    put_num(o, "discovery_count", static_cast<long long>(s.discovery_count));
    put_bool(o, "auto_discovery_enabled", s.auto_discovery_enabled);
    put_bool(o, "background_discovery_running", s.background_running);
    put_num(o, "interval_seconds", static_cast<long long>(s.interval.count() / 1000));
    put_num(o, "device_count", static_cast<long long>(s.device_count));
    return finish(o, pretty_);
}

std::string JSONWriter::write(const NetworkDiagnostics& d) const {
    CanonVal o{CanonVal::T_OBJ};
    CanonVal local{CanonVal::T_ARR};
    for (const auto& a : d.local_addresses) local.arr.push_back(str_val(a));
    o.obj["local_addresses"] = std::move(local);
    CanonVal cands{CanonVal::T_ARR};
    for (const auto& c : d.candidates) {
        CanonVal e{CanonVal::T_OBJ};
        put_str(e, "cidr", c.range.cidr());
        put_str(e, "evidence", evidence_name(c.evidence));
        put_str(e, "detail", c.detail);
        cands.arr.push_back(std::move(e));
    }
    o.obj["candidates"] = std::move(cands);
    o.obj["selected"] = range_val(d.selected);
    CanonVal probes{CanonVal::T_ARR};
    for (const auto& p : d.device_probes) {
        CanonVal e{CanonVal::T_OBJ};
        put_str(e, "udn", p.udn);
        put_str(e, "name", p.name);
        put_str(e, "ip_address", p.host);
        put_num(e, "port", p.port);
        put_str(e, "result", connect_result_name(p.result));
        put_bool(e, "port_open", p.result == ConnectResult::Connected);
        probes.arr.push_back(std::move(e));
    }
    o.obj["device_probes"] = std::move(probes);
    return finish(o, pretty_);
}

std::string JSONWriter::write_pass(const std::optional<DiscoverySummary>& discovery, const std::vector<Device>& devices, const StatusReport& status) const {
    CanonVal root{CanonVal::T_OBJ};
    if (discovery) root.obj["discovery"] = summary_val(*discovery); else put_null(root, "discovery");
    root.obj["devices"] = devices_val(devices);
    root.obj["status"] = status_val(status);
    return finish(root, pretty_);
}

}
