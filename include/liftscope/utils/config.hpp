// include/liftscope/utils/config.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <mutex>
#include <memory>
#include <optional>
#include <istream>
#include <sstream>

namespace liftscope {
namespace utils {

// Flat key=value settings. Lines starting with '#' are comments; keys and
// values are trimmed. A key with an empty value counts as unset.
class Config {
private:
    std::unordered_map<std::string, std::string> values_;
    mutable std::mutex mutex_;
    static std::shared_ptr<Config> instance_;
    static std::mutex instance_mutex_;

public:
    Config() = default;

    static std::shared_ptr<Config> instance();

    bool load_from_file(const std::string& filename);
    void load_from_stream(std::istream& in);

    bool has(const std::string& key) const;

    // Value for key, or nullopt when missing or blank.
    std::optional<std::string> get_optional(const std::string& key) const;

    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end() || it->second.empty()) {
            return default_value;
        }

        std::istringstream iss(it->second);
        T value;
        if (!(iss >> value)) {
            return default_value;
        }

        return value;
    }

    // Whole value, spaces included
    std::string get(const std::string& key, const std::string& default_value) const;
    std::string get(const std::string& key, const char* default_value) const {
        return get(key, std::string(default_value));
    }

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << value;
        values_[key] = oss.str();
    }
};

} // namespace utils
} // namespace liftscope
