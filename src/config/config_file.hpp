//===----------------------------------------------------------------------===//
//                         runnerd
//
// config/config_file.hpp
//
// Flat key=value configuration file
//===----------------------------------------------------------------------===//

#pragma once

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <string>
#include <unordered_map>

namespace runnerd {

class ConfigFile {
public:
    bool Load(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            error_ = "Cannot open config file: " + path;
            return false;
        }

        std::string line;
        int line_num = 0;
        while (std::getline(file, line)) {
            line_num++;
            line.erase(0, line.find_first_not_of(" \t\r"));
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            auto eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                error_ = "Invalid syntax at line " + std::to_string(line_num);
                return false;
            }

            std::string key = line.substr(0, eq_pos);
            std::string value = line.substr(eq_pos + 1);

            key.erase(key.find_last_not_of(" \t") + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r") + 1);

            if (key.empty()) {
                error_ = "Missing key at line " + std::to_string(line_num);
                return false;
            }

            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            values_[key] = value;
        }

        return true;
    }

    bool Has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    // Each Read* leaves `out` untouched when the key is absent and returns
    // false with an error message when the value does not parse.
    bool ReadString(const std::string& key, std::string& out) const {
        auto it = values_.find(key);
        if (it != values_.end()) {
            out = it->second;
        }
        return true;
    }

    template<typename T>
    bool ReadUnsigned(const std::string& key, T& out) {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return true;
        }

        const std::string& text = it->second;
        char* end = nullptr;
        errno = 0;
        unsigned long long value = std::strtoull(text.c_str(), &end, 10);
        if (text.empty() || text[0] == '-' || errno != 0 || *end != '\0' ||
            value > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            error_ = "Invalid value for " + key + ": '" + text + "'";
            return false;
        }
        out = static_cast<T>(value);
        return true;
    }

    bool ReadBool(const std::string& key, bool& out) {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return true;
        }

        std::string val = it->second;
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "yes" || val == "1" || val == "on") {
            out = true;
        } else if (val == "false" || val == "no" || val == "0" || val == "off") {
            out = false;
        } else {
            error_ = "Invalid value for " + key + ": '" + it->second + "'";
            return false;
        }
        return true;
    }

    const std::string& GetError() const { return error_; }

private:
    std::unordered_map<std::string, std::string> values_;
    std::string error_;
};

} // namespace runnerd
