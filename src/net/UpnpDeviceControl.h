#pragma once
#include "../core/Device.h"
#include <optional>
#include <string>

namespace plug_scan {

// Text of the first <tag> (any namespace prefix); nullopt when absent or the document is malformed.
std::optional<std::string> xml_tag_value(const std::string& xml, const std::string& tag);
// Device description (setup.xml); nullopt without a UDN.
std::optional<DeviceInfo> parse_setup_xml(const std::string& xml);
// BinaryState "0" = off, "1" or "1|..." = on (also "8" for on-standby), else unknown.
PowerState parse_binary_state(const std::string& soap_body);
std::string soap_envelope(const std::string& action, const std::string& args_xml);

// Device control over the UPnP basicevent service.
class UpnpDeviceControl : public DeviceControl {
public:
    std::optional<DeviceInfo> identify(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) override;
    PowerState query_state(const Device& device, std::chrono::milliseconds timeout) override;
    CommandResult invoke(const Device& device, const std::string& command, const std::vector<std::string>& args,
                         std::chrono::milliseconds timeout) override;
private:
    std::string call(const Device& device, const std::string& action, const std::string& args_xml, std::chrono::milliseconds timeout);
    void set_state(const Device& device, bool on, std::chrono::milliseconds timeout);
};

}
