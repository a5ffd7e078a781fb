#include "AliasStore.h"
#include "Logging.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace plug_scan {

AliasStore::AliasStore(std::string path) : path_(std::move(path)) {}

bool AliasStore::load(){
    std::lock_guard<std::mutex> lock(mutex_);
    aliases_.clear();
    if(path_.empty()) return true;
    std::error_code ec;
    if(!fs::exists(path_, ec)){
        Logger::instance().info("Alias store " + path_ + " not found; starting empty");
        return true;
    }
    std::ifstream in(path_);
    if(!in){
        Logger::instance().error("Failed to open alias store: " + path_);
        return false;
    }
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        if(!j.is_object()) throw std::runtime_error("top-level value is not an object");
        for(auto it = j.begin(); it != j.end(); ++it){
            if(it.value().is_string() && !it.value().get<std::string>().empty()) aliases_[it.key()] = it.value().get<std::string>();
        }
    } catch(const std::exception& ex) {
        Logger::instance().error("Failed to load alias store " + path_ + ": " + ex.what());
        aliases_.clear();
        return false;
    }
    Logger::instance().info("Loaded " + std::to_string(aliases_.size()) + " device aliases");
    return true;
}

std::optional<std::string> AliasStore::get(const std::string& udn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aliases_.find(udn);
    if(it == aliases_.end()) return std::nullopt;
    return it->second;
}

void AliasStore::set(const std::string& udn, const std::string& alias){
    std::lock_guard<std::mutex> lock(mutex_);
    aliases_[udn] = alias;
    save_locked();
}

bool AliasStore::remove(const std::string& udn){
    std::lock_guard<std::mutex> lock(mutex_);
    if(aliases_.erase(udn) == 0) return false;
    save_locked();
    return true;
}

size_t AliasStore::remove_all(const std::vector<std::string>& udns){
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for(const auto& u : udns) n += aliases_.erase(u);
    if(n > 0) save_locked();
    return n;
}

size_t AliasStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aliases_.size();
}

// Write to a sibling temp file then rename so readers never see a partial file.
bool AliasStore::save_locked() const {
    if(path_.empty()) return true;
    try {
        fs::path p(path_);
        if(p.has_parent_path()) fs::create_directories(p.parent_path());
        nlohmann::json j = nlohmann::json::object();
        for(const auto& kv : aliases_) j[kv.first] = kv.second;
        std::string tmp = path_ + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if(!out) throw std::runtime_error("cannot write " + tmp);
            out << j.dump(2) << "\n";
            if(!out) throw std::runtime_error("write failed for " + tmp);
        }
        fs::rename(tmp, p);
    } catch(const std::exception& ex) {
        Logger::instance().error("Failed to save alias store: " + std::string(ex.what()));
        return false;
    }
    Logger::instance().debug("Saved " + std::to_string(aliases_.size()) + " device aliases");
    return true;
}

}
