//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// config/config_file.hpp
//
// Flat key/value view of a configuration file, and the INI-style loader
//===----------------------------------------------------------------------===//

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace sandbox_server {

// Every loader produces this: INI files keyed by bare key, YAML files by
// dot-separated path ("sessions.max"). Typed getters fail on malformed
// values instead of substituting a default.
class ConfigValues {
public:
    void Set(const std::string& key, std::string value) { values_[key] = std::move(value); }

    bool Has(const std::string& key) const { return values_.count(key) != 0; }
    size_t Size() const { return values_.size(); }

    std::string GetString(const std::string& key) const {
        auto it = values_.find(key);
        return it == values_.end() ? std::string() : it->second;
    }

    // Decimal integer, nothing trailing
    bool GetInt64(const std::string& key, int64_t& out) const {
        auto it = values_.find(key);
        if (it == values_.end() || it->second.empty()) {
            return false;
        }
        size_t used = 0;
        try {
            out = std::stoll(it->second, &used, 10);
        } catch (const std::exception&) {
            return false;
        }
        return used == it->second.size();
    }

    // true/false, yes/no, on/off, 1/0 in any case
    bool GetBool(const std::string& key, bool& out) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return false;
        }
        std::string value = it->second;
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (value == "true" || value == "yes" || value == "on" || value == "1") {
            out = true;
        } else if (value == "false" || value == "no" || value == "off" || value == "0") {
            out = false;
        } else {
            return false;
        }
        return true;
    }

private:
    std::unordered_map<std::string, std::string> values_;
};

namespace detail {

inline std::string Trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return std::string();
    }
    auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

inline std::string Unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

} // namespace detail

// key = value lines. '#' and ';' start comments; [section] lines are
// accepted for readability and do not prefix keys.
inline bool LoadIniFile(const std::string& path, ConfigValues& values, std::string& error) {
    std::ifstream file(path);
    if (!file) {
        error = "Cannot open config file: " + path;
        return false;
    }

    std::string raw;
    for (int line_num = 1; std::getline(file, raw); line_num++) {
        std::string line = detail::Trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
            continue;
        }

        auto eq = line.find('=');
        std::string key = eq == std::string::npos ? std::string() : detail::Trim(line.substr(0, eq));
        if (key.empty()) {
            error = "Invalid syntax at line " + std::to_string(line_num) + " of " + path;
            return false;
        }
        values.Set(key, detail::Unquote(detail::Trim(line.substr(eq + 1))));
    }
    return true;
}

} // namespace sandbox_server
