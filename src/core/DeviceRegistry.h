#pragma once
#include "Device.h"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace plug_scan {

class AliasStore;

enum class MergeOutcome { Added, AlreadyKnown };

// Authoritative device set keyed by identity. Every mutation is serialized; readers get copies
// with the current alias filled in.
class DeviceRegistry {
public:
    explicit DeviceRegistry(AliasStore& aliases) : aliases_(aliases) {}

    // Known identity: address, port and reported fields are refreshed in place, alias untouched.
    MergeOutcome merge(const DeviceInfo& info);
    std::vector<Device> snapshot() const;
    std::optional<Device> find(const std::string& udn) const;
    size_t size() const;

    // The alias survives forgetting a single device.
    std::optional<Device> forget(const std::string& udn);
    // Also removes the aliases of every forgotten device.
    std::vector<Device> forget_all();

    // nullopt if the identity is unknown. An empty or blank alias clears it.
    std::optional<Device> set_alias(const std::string& udn, const std::string& alias);
    std::optional<Device> clear_alias(const std::string& udn);
private:
    Device with_alias(Device d) const;
    mutable std::mutex mutex_;
    std::vector<Device> devices_; // discovery order
    AliasStore& aliases_;
};

}
