//===----------------------------------------------------------------------===//
//                         SandboxD Server
//
// config/yaml_config.hpp
//
// YAML loader: nested maps flattened to dot-separated keys
//===----------------------------------------------------------------------===//

#pragma once

#include "config/config_file.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

namespace sandbox_server {

namespace detail {

// Scalars are stored under their path; null values are skipped
inline bool FlattenYaml(const YAML::Node& node, const std::string& prefix,
                        ConfigValues& values, std::string& error) {
    switch (node.Type()) {
        case YAML::NodeType::Map:
            for (const auto& entry : node) {
                std::string key = entry.first.as<std::string>();
                std::string path = prefix.empty() ? key : prefix + "." + key;
                if (!FlattenYaml(entry.second, path, values, error)) {
                    return false;
                }
            }
            return true;
        case YAML::NodeType::Scalar:
            values.Set(prefix, node.Scalar());
            return true;
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return true;
        default:
            error = "Expected a single value for '" + prefix + "'";
            return false;
    }
}

} // namespace detail

inline bool LoadYamlFile(const std::string& path, ConfigValues& values, std::string& error) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        error = "Cannot open config file: " + path;
        return false;
    } catch (const YAML::Exception& e) {
        error = std::string("YAML parse error: ") + e.what();
        return false;
    }

    if (!root.IsMap() && !root.IsNull()) {
        error = "YAML config must be a mapping: " + path;
        return false;
    }
    try {
        return detail::FlattenYaml(root, "", values, error);
    } catch (const YAML::Exception& e) {
        error = std::string("YAML error: ") + e.what();
        return false;
    }
}

} // namespace sandbox_server
