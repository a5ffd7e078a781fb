#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace plug_scan {

// Persistent identity -> alias map (JSON object on disk). An empty path keeps it in memory.
class AliasStore {
public:
    explicit AliasStore(std::string path = "");
    // Missing file is an empty store; unreadable or malformed content is logged and ignored.
    bool load();
    std::optional<std::string> get(const std::string& udn) const;
    void set(const std::string& udn, const std::string& alias);
    bool remove(const std::string& udn);
    size_t remove_all(const std::vector<std::string>& udns);
    size_t size() const;
    const std::string& path() const { return path_; }
private:
    bool save_locked() const;
    std::string path_;
    std::map<std::string, std::string> aliases_;
    mutable std::mutex mutex_;
};

}
