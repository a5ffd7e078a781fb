#pragma once
#include "Config.h"
#include <string>

namespace plug_scan {

// Range and consistency checks on a parsed Config. Problems are reported to stderr.
class ConfigValidator {
public:
    bool validate(Config& cfg);
    bool validate_log_level(const std::string& level);
private:
    bool check_range(int value, int min, int max, const std::string& flag_name);
};

}
