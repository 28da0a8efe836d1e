// src/liftscope/utils/config.cpp
#include "liftscope/utils/config.hpp"
#include <fstream>

namespace liftscope {
namespace utils {

std::shared_ptr<Config> Config::instance_ = nullptr;
std::mutex Config::instance_mutex_;

namespace {

void trim(std::string& text) {
    text.erase(0, text.find_first_not_of(" \t\r"));
    text.erase(text.find_last_not_of(" \t\r") + 1);
}

} // namespace

std::shared_ptr<Config> Config::instance() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        instance_ = std::make_shared<Config>();
    }
    return instance_;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    load_from_stream(file);
    return true;
}

void Config::load_from_stream(std::istream& in) {
    std::unordered_map<std::string, std::string> parsed;
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        trim(key);
        trim(value);
        if (!key.empty()) {
            parsed[key] = value;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    values_ = std::move(parsed);
}

bool Config::has(const std::string& key) const {
    return get_optional(key).has_value();
}

std::optional<std::string> Config::get_optional(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Config::get(const std::string& key, const std::string& default_value) const {
    auto value = get_optional(key);
    return value ? *value : default_value;
}

} // namespace utils
} // namespace liftscope
