// src/meridian/utils/config.cpp
#include "meridian/utils/config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace meridian {
namespace utils {

std::shared_ptr<Config> Config::instance_ = nullptr;
std::mutex Config::instance_mutex_;

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

void Config::parse(std::istream& in, const std::string& source) {
    std::unordered_map<std::string, std::string> parsed;
    std::string line;
    int line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }

        size_t pos = stripped.find('=');
        if (pos == std::string::npos) {
            throw core::ConfigError(source + ":" + std::to_string(line_number) +
                                    ": expected key = value, got '" + stripped + "'");
        }

        std::string key = trim(stripped.substr(0, pos));
        std::string value = trim(stripped.substr(pos + 1));
        if (key.empty()) {
            throw core::ConfigError(source + ":" + std::to_string(line_number) + ": empty key");
        }
        parsed[key] = value;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, value] : parsed) {
        values_[key] = std::move(value);
    }
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    parse(file, filename);
    return true;
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    parse(in, "<string>");
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.count(key) > 0;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    std::string raw = get(key, std::string());
    if (raw.empty()) {
        return default_value;
    }
    std::transform(raw.begin(), raw.end(), raw.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (raw == "true" || raw == "yes" || raw == "on" || raw == "1") return true;
    if (raw == "false" || raw == "no" || raw == "off" || raw == "0") return false;
    throw core::ConfigError("invalid boolean for '" + key + "': '" + raw + "'");
}

std::vector<std::string> Config::get_list(const std::string& key) const {
    std::vector<std::string> items;
    std::istringstream iss(get(key, std::string()));
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::unordered_map<std::string, std::string> Config::with_prefix(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_map<std::string, std::string> result;
    for (const auto& [key, value] : values_) {
        if (key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0) {
            result[key.substr(prefix.size())] = value;
        }
    }
    return result;
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

} // namespace utils
} // namespace meridian
