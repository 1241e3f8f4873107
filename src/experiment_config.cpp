#include "experiment_config.hpp"

namespace PrimeLab {

Json::Value to_json(i64 v) { return Json::Value((Json::Int64)v); }
Json::Value to_json(int v) { return Json::Value(v); }
Json::Value to_json(double v) { return Json::Value(v); }
Json::Value to_json(bool v) { return Json::Value(v); }
Json::Value to_json(const std::string &v) { return Json::Value(v); }

Json::Value to_json(const std::vector<i64> &v) {
    Json::Value arr(Json::arrayValue);
    for (i64 x : v) arr.append(Json::Value((Json::Int64)x));
    return arr;
}

void require_at_least(const std::string &key, i64 value, i64 min) {
    if (value < min) {
        throw ConfigError("parameter '" + key + "' must be >= " + std::to_string(min) +
                          " (got " + std::to_string(value) + ")");
    }
}

void ExperimentConfig::load_file(const std::string &path, const std::string &experiment_id) {
    LOG_INFO("Loading configuration from file: {}", path);
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception &e) {
        LOG_ERROR("YAML exception while loading configuration: {}", e.what());
        throw ConfigError("cannot load configuration '" + path + "': " + e.what());
    }
    if (root.IsNull()) return;
    if (!root.IsMap()) {
        throw ConfigError("configuration '" + path + "' must be a YAML map");
    }
    const YAML::Node &croot = root;
    if (croot[experiment_id] && croot[experiment_id].IsMap()) {
        LOG_DEBUG("Using section '{}' of {}", experiment_id, path);
        load(croot[experiment_id], "");
    } else {
        load(croot, "");
    }
}

void ExperimentConfig::load(const YAML::Node &node, const std::string &prefix) {
    for (const auto &it : node) {
        std::string key = prefix.empty() ? it.first.as<std::string>()
                                         : prefix + "." + it.first.as<std::string>();
        if (it.second.IsMap()) {
            load(it.second, key);
        } else {
            values_[key] = it.second;
        }
    }
}

void ExperimentConfig::set(const std::string &key, const std::string &value) {
    try {
        values_[key] = YAML::Load(value);
    } catch (const YAML::Exception &e) {
        throw ConfigError("cannot parse value for '" + key + "': " + e.what());
    }
}

bool ExperimentConfig::contains(const std::string &key) const {
    return values_.count(key) != 0;
}

std::vector<std::string> ExperimentConfig::unused_keys() const {
    std::vector<std::string> out;
    for (const auto &kv : values_) {
        if (!used_.count(kv.first)) out.push_back(kv.first);
    }
    return out;
}

} // namespace PrimeLab
