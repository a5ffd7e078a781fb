#include "DeviceRegistry.h"
#include "AliasStore.h"
#include "Logging.h"
#include "../net/HttpClient.h"
#include <algorithm>

namespace plug_scan {

Device DeviceRegistry::with_alias(Device d) const {
    d.alias = aliases_.get(d.udn);
    return d;
}

MergeOutcome DeviceRegistry::merge(const DeviceInfo& info){
    auto now = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(devices_.begin(), devices_.end(), [&](const Device& d){ return d.udn == info.udn; });
    if(it != devices_.end()){
        if(it->host != info.host)
            Logger::instance().info("Device " + info.udn + " moved " + it->host + " -> " + info.host);
        it->host = info.host;
        it->port = info.port;
        if(!info.name.empty()) it->name = info.name;
        if(!info.model.empty()) it->model = info.model;
        if(!info.serial.empty()) it->serial = info.serial;
        it->last_seen = now;
        return MergeOutcome::AlreadyKnown;
    }
    Device d;
    d.udn = info.udn; d.name = info.name; d.model = info.model; d.serial = info.serial;
    d.host = info.host; d.port = info.port;
    d.first_seen = now; d.last_seen = now;
    devices_.push_back(std::move(d));
    Logger::instance().info("Added device " + info.name + " (" + info.udn + ") at " + info.host);
    return MergeOutcome::Added;
}

std::vector<Device> DeviceRegistry::snapshot() const {
    std::vector<Device> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out = devices_;
    }
    for(auto& d : out) d.alias = aliases_.get(d.udn);
    return out;
}

std::optional<Device> DeviceRegistry::find(const std::string& udn) const {
    std::optional<Device> found;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for(const auto& d : devices_) if(d.udn == udn){ found = d; break; }
    }
    if(found) return with_alias(*found);
    return found;
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

std::optional<Device> DeviceRegistry::forget(const std::string& udn){
    std::optional<Device> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(devices_.begin(), devices_.end(), [&](const Device& d){ return d.udn == udn; });
        if(it == devices_.end()) return std::nullopt;
        removed = *it;
        devices_.erase(it);
    }
    Logger::instance().info("Forgot device " + removed->name + " (" + udn + ")");
    return with_alias(*removed);
}

std::vector<Device> DeviceRegistry::forget_all(){
    std::vector<Device> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed.swap(devices_);
    }
    std::vector<std::string> udns;
    for(auto& d : removed){ d.alias = aliases_.get(d.udn); udns.push_back(d.udn); }
    size_t n = aliases_.remove_all(udns);
    Logger::instance().info("Forgot " + std::to_string(removed.size()) + " devices and " + std::to_string(n) + " aliases");
    return removed;
}

std::optional<Device> DeviceRegistry::set_alias(const std::string& udn, const std::string& alias){
    std::string value = trim(alias);
    if(value.empty()) return clear_alias(udn);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(devices_.begin(), devices_.end(), [&](const Device& d){ return d.udn == udn; });
        if(it == devices_.end()) return std::nullopt;
    }
    aliases_.set(udn, value);
    return find(udn);
}

std::optional<Device> DeviceRegistry::clear_alias(const std::string& udn){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(devices_.begin(), devices_.end(), [&](const Device& d){ return d.udn == udn; });
        if(it == devices_.end()) return std::nullopt;
    }
    aliases_.remove(udn);
    return find(udn);
}

}
