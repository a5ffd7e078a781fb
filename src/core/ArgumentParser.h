#pragma once
#include "Config.h"
#include <string>
#include <vector>
#include <functional>

namespace plug_scan {

class ArgumentParser {
public:
    // Returns false on --help, --version or any parse error; early_exit() tells which.
    bool parse(int argc, char** argv, Config& cfg);
    bool early_exit() const { return early_exit_; }
    void print_help() const;
    void print_version() const;

    static std::vector<std::string> split_csv(const std::string& s);
private:
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec { const char* name; ArgKind kind; const char* help; std::function<bool(const std::string&)> apply; };
    static std::vector<FlagSpec> build_specs(Config& cfg);
    bool early_exit_ = false;
};

}
