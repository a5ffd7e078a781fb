#pragma once
#include "DeviceService.h"
#include <optional>
#include <string>
#include <vector>

namespace plug_scan {

// Renders service results as JSON. Keys are emitted sorted; pretty output is indented by two spaces.
class JSONWriter {
public:
    explicit JSONWriter(bool pretty = false) : pretty_(pretty) {}

    std::string write(const RangeValidation& v, const std::string& input) const;
    std::string write(const ScanStart& s) const;
    std::string write(const ScanProgress& p) const;
    std::string write(CancelResult r) const;
    std::string write(const DiscoverySummary& s) const;
    std::string write(const AddressDiscoveryResult& r) const;
    std::string write(const RefreshResult& r) const;
    std::string write(const std::vector<Device>& devices) const;
    std::string write(const StatusReport& r) const;
    std::string write(const ForgetResult& r) const;
    std::string write(const AliasResult& r) const;
    std::string write(const CommandResult& r) const;
    std::string write(const BulkPowerResult& r) const;
    std::string write(const DiscoveryStatus& s) const;
    std::string write(const NetworkDiagnostics& d) const;
    // One CLI pass: {"discovery": ..., "devices": [...], "status": {...}}
    std::string write_pass(const std::optional<DiscoverySummary>& discovery, const std::vector<Device>& devices, const StatusReport& status) const;
private:
    bool pretty_;
};

}
