#include "config_utils.hpp"
#include "path_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (node.IsMap()) {
                for (auto sub = node.begin(); sub != node.end(); ++sub) {
                    if (!sub->first.IsScalar())
                        continue;
                    std::string s;
                    if (to_string_value(sub->second, s))
                        opts["--" + sub->first.as<std::string>()] = s;
                }
            } else {
                std::string s;
                if (to_string_value(node, s))
                    opts["--" + key_name] = s;
            }
        }
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            if (val.is_object()) {
                for (auto sub = val.begin(); sub != val.end(); ++sub) {
                    std::string s;
                    if (to_string_value(sub.value(), s))
                        opts["--" + sub.key()] = s;
                }
            } else {
                std::string s;
                if (to_string_value(val, s))
                    opts["--" + it.key()] = s;
            }
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_config_file(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error) {
    if (fs::path(path).extension() == ".json")
        return load_json_config(path, opts, error);
    return load_yaml_config(path, opts, error);
}

fs::path default_config_file() {
    fs::path dir = config_dir();
    if (dir.empty())
        return {};
    std::error_code ec;
    fs::path yaml = dir / "hazelnut" / "daemon.yaml";
    if (fs::exists(yaml, ec))
        return yaml;
    fs::path json = dir / "hazelnut" / "daemon.json";
    if (fs::exists(json, ec))
        return json;
    return {};
}
