//===----------------------------------------------------------------------===//
//                         runnerd
//
// config/yaml_config.hpp
//
// YAML configuration file addressed by dotted paths
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

namespace runnerd {

class YamlConfig {
public:
    bool Load(const std::string& path) {
        try {
            root_ = YAML::LoadFile(path);
            return true;
        } catch (const YAML::BadFile&) {
            error_ = "Cannot open config file: " + path;
            return false;
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error: " + std::string(e.what());
            return false;
        }
    }

    bool Has(const std::string& path) const {
        YAML::Node node = GetNode(path);
        return node && !node.IsNull();
    }

    // Leaves `out` untouched when the path is absent. Returns false with an
    // error message when the value has the wrong type.
    template<typename T>
    bool Read(const std::string& path, T& out) {
        YAML::Node node = GetNode(path);
        if (!node || node.IsNull()) {
            return true;
        }
        try {
            out = node.as<T>();
            return true;
        } catch (const YAML::Exception& e) {
            error_ = "Invalid value for " + path + ": " + e.what();
            return false;
        }
    }

    const std::string& GetError() const { return error_; }

private:
    // "server.port" -> root_["server"]["port"]
    YAML::Node GetNode(const std::string& path) const {
        // Node assignment copies values in yaml-cpp; walk with reset()
        YAML::Node current;
        current.reset(root_);

        size_t start = 0;
        while (true) {
            size_t end = path.find('.', start);
            std::string key = path.substr(start, end == std::string::npos ? std::string::npos : end - start);

            if (!current.IsMap()) {
                return YAML::Node();
            }
            const YAML::Node& view = current;
            YAML::Node next = view[key];
            if (!next) {
                return YAML::Node();
            }
            current.reset(next);

            if (end == std::string::npos) {
                return current;
            }
            start = end + 1;
        }
    }

    YAML::Node root_;
    std::string error_;
};

} // namespace runnerd
