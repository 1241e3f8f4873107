#pragma once
#include "types.hpp"
#include "logger.hpp"
#include <json/json.h>
#include <yaml-cpp/yaml.h>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace PrimeLab {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// JSON encodings of the parameter types experiments use
Json::Value to_json(i64 v);
Json::Value to_json(int v);
Json::Value to_json(double v);
Json::Value to_json(bool v);
Json::Value to_json(const std::string &v);
Json::Value to_json(const std::vector<i64> &v);

// Throws ConfigError naming `key` when value < min
void require_at_least(const std::string &key, i64 value, i64 min);

// Experiment parameters from YAML; every value read through get(key, default) is recorded
class ExperimentConfig {
public:
    ExperimentConfig() = default;

    // Uses the map under `experiment_id` when present, else the root map
    void load_file(const std::string &path, const std::string &experiment_id);
    // value is parsed as YAML ("5", "[2, 3]", "true")
    void set(const std::string &key, const std::string &value);

    bool contains(const std::string &key) const;

    template <typename T>
    std::optional<T> get(const std::string &key) const;

    template <typename T>
    T get(const std::string &key, T default_value);

    std::string get(const std::string &key, const char *default_value) {
        return get<std::string>(key, std::string(default_value));
    }

    // Effective parameters read so far
    const Json::Value &params() const { return params_; }
    std::vector<std::string> unused_keys() const;

private:
    std::map<std::string, YAML::Node> values_;
    mutable std::set<std::string> used_;
    Json::Value params_ = Json::Value(Json::objectValue);

    void load(const YAML::Node &node, const std::string &prefix);
};

template <typename T>
std::optional<T> ExperimentConfig::get(const std::string &key) const {
    const auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    used_.insert(key);
    try {
        return it->second.as<T>();
    } catch (const YAML::Exception &e) {
        LOG_ERROR("YAML conversion failed for key '{}': {}", key, e.what());
        throw ConfigError("invalid value for parameter '" + key + "'");
    }
}

template <typename T>
T ExperimentConfig::get(const std::string &key, T default_value) {
    auto value = get<T>(key);
    T result = value ? *value : default_value;
    params_[key] = to_json(result);
    return result;
}

} // namespace PrimeLab
