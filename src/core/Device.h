#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace plug_scan {

enum class PowerState { On, Off, Unknown };
enum class Connectivity { Online, Offline, Unknown };
const char* power_state_name(PowerState s);
const char* connectivity_name(Connectivity c);

// What a device reports about itself when identified at an address.
struct DeviceInfo {
    std::string udn; // stable identity, never derived from the address
    std::string name; // protocol-reported friendly name
    std::string model;
    std::string serial;
    std::string host;
    uint16_t port = 0;
};

struct Device {
    std::string udn;
    std::string name;
    std::string model;
    std::string serial;
    std::string host;
    uint16_t port = 0;
    std::optional<std::string> alias;
    std::chrono::system_clock::time_point first_seen{};
    std::chrono::system_clock::time_point last_seen{};

    const std::string& display_name() const { return alias ? *alias : name; }
};

// Protocol or transport failure talking to a device.
class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& what) : std::runtime_error(what) {}
};

struct CommandResult {
    std::string command;
    std::optional<PowerState> state;
    std::string message;
};

// Device control protocol as consumed by discovery and status checks.
class DeviceControl {
public:
    virtual ~DeviceControl() = default;
    // nullopt when nothing at the address identifies as a device; DeviceError on transport failure.
    virtual std::optional<DeviceInfo> identify(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) = 0;
    virtual PowerState query_state(const Device& device, std::chrono::milliseconds timeout) = 0;
    // Closed command set: on, off, toggle, get_state. Throws DeviceError.
    virtual CommandResult invoke(const Device& device, const std::string& command, const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout) = 0;
};

const std::vector<std::string>& supported_commands();

}
