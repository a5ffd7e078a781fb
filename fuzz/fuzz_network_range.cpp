#include "core/NetworkRange.h"
#include "net/HttpClient.h"
#include "net/SsdpClient.h"
#include "net/UpnpDeviceControl.h"
#include <cstdint>
#include <string>

// First byte selects the parser; the rest is its input.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size == 0) return 0;
    std::string input(reinterpret_cast<const char*>(data) + 1, size - 1);
    switch (data[0] % 4) {
        case 0: {
            plug_scan::RangeValidation v = plug_scan::validate_network(input);
            if (v.ok()) {
                // canonical output must validate to the same range
                plug_scan::RangeValidation again = plug_scan::validate_network(v.range->cidr());
                if (!again.ok() || *again.range != *v.range) __builtin_trap();
            }
            break;
        }
        case 1:
            try { plug_scan::parse_http_response(input); } catch (const plug_scan::HttpError&) {}
            break;
        case 2:
            plug_scan::parse_ssdp_response(input);
            break;
        case 3:
            plug_scan::parse_setup_xml(input);
            plug_scan::parse_binary_state(input);
            break;
    }
    return 0;
}
