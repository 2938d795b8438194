#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <string>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    if (node.IsSequence()) {
        std::string joined;
        for (const auto& item : node) {
            if (!item.IsScalar())
                return false;
            if (!joined.empty())
                joined += ',';
            joined += item.Scalar();
        }
        out = joined;
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
    if (v.is_array()) {
        std::string joined;
        for (const auto& item : v) {
            std::string s;
            if (item.is_array() || item.is_object() || !to_string_value(item, s))
                return false;
            if (!joined.empty())
                joined += ',';
            joined += s;
        }
        out = joined;
        return true;
    }
    return false;
}

static void collect_yaml(const YAML::Node& map, std::map<std::string, std::string>& opts) {
    for (auto it = map.begin(); it != map.end(); ++it) {
        if (!it->first.IsScalar())
            continue;
        const YAML::Node& val = it->second;
        if (val.IsMap()) {
            collect_yaml(val, opts);
            continue;
        }
        std::string s;
        if (to_string_value(val, s))
            opts["--" + it->first.as<std::string>()] = s;
    }
}

static void collect_json(const nlohmann::json& obj, std::map<std::string, std::string>& opts) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (it.value().is_object()) {
            collect_json(it.value(), opts);
            continue;
        }
        std::string s;
        if (to_string_value(it.value(), s))
            opts["--" + it.key()] = s;
    }
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
        collect_yaml(root, opts);
        return true;
    } catch (const std::exception& e) {
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
        collect_json(root, opts);
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

const std::vector<std::string>& auto_config_names() {
    static const std::vector<std::string> names{".stalebranch.yaml", ".stalebranch.json"};
    return names;
}

std::optional<std::filesystem::path>
find_auto_config(const std::vector<std::filesystem::path>& dirs) {
    for (const auto& dir : dirs) {
        if (dir.empty())
            continue;
        for (const auto& name : auto_config_names()) {
            std::error_code ec;
            auto candidate = dir / name;
            if (std::filesystem::is_regular_file(candidate, ec))
                return candidate;
        }
    }
    return std::nullopt;
}
