// include/meridian/utils/config.hpp
#pragma once
#include <meridian/core/errors.hpp>
#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <memory>
#include <sstream>

namespace meridian {
namespace utils {

// key = value store loaded from a file or string. Lines starting with '#'
// and blank lines are ignored; later keys overwrite earlier ones.
class Config {
private:
    std::unordered_map<std::string, std::string> values_;
    mutable std::mutex mutex_;
    static std::shared_ptr<Config> instance_;
    static std::mutex instance_mutex_;

    void parse(std::istream& in, const std::string& source);

public:
    Config() = default;

    // Process-wide instance used by the application entry point
    static std::shared_ptr<Config> instance() {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        if (!instance_) {
            instance_ = std::make_shared<Config>();
        }
        return instance_;
    }

    // Returns false if the file cannot be opened. Malformed lines throw ConfigError.
    bool load_from_file(const std::string& filename);
    void load_from_string(const std::string& text);

    bool has(const std::string& key) const;

    // Missing key -> default_value. Present but unparseable -> ConfigError.
    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        std::string raw;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = values_.find(key);
            if (it == values_.end()) {
                return default_value;
            }
            raw = it->second;
        }

        std::istringstream iss(raw);
        T value;
        if (!(iss >> value) || !(iss >> std::ws).eof()) {
            throw core::ConfigError("invalid value for '" + key + "': '" + raw + "'");
        }
        return value;
    }

    std::string get(const std::string& key, const std::string& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_value;
    }

    std::string get(const std::string& key, const char* default_value) const {
        return get(key, std::string(default_value));
    }

    bool get_bool(const std::string& key, bool default_value) const;

    // Comma-separated list, entries trimmed, empty entries dropped
    std::vector<std::string> get_list(const std::string& key) const;

    // All keys starting with prefix, returned with the prefix stripped
    std::unordered_map<std::string, std::string> with_prefix(const std::string& prefix) const;

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::ostringstream oss;
        oss << value;
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = oss.str();
    }

    void clear();
};

} // namespace utils
} // namespace meridian
