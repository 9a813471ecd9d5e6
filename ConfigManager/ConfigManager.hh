#pragma once
#include "Logger.hh"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <map>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

using json = nlohmann::json;

// ===== ConfigValue =====
using ConfigValue = std::variant<bool, long long, double, std::string>;

template <typename T>
inline constexpr bool is_config_value_v =
    std::disjunction_v<std::is_same<T, ConfigValue>, std::is_same<T, bool>, std::is_same<T, long long>, std::is_same<T, double>, std::is_same<T, std::string>>;

template <typename T> inline std::string TypeName()
{
    if constexpr (std::is_same_v<T, std::string>)
        return "string";
    else if constexpr (std::is_same_v<T, bool>)
        return "bool";
    else if constexpr (std::is_same_v<T, long long>)
        return "long long";
    else if constexpr (std::is_same_v<T, double>)
        return "double";
    else
        return "unknown";
}

class ConfigManager
{
  private:
    // ordered so dumps are stable
    std::map<std::string, ConfigValue> rawValues_;
    std::map<std::string, std::string> descriptions_;

    ConfigValue ConvertFromText(const std::string &key, const std::string &text) const;
    ConfigValue ConvertFromJSON(const std::string &key, const json &val) const;
    json ToJSONInternal() const;
    YAML::Node ToYAMLInternal() const;
    void FlattenYAML(const YAML::Node &node, const std::string &prefix);
    void FlattenJSON(const json &node, const std::string &prefix);

    template <typename T> void UpdateExisting(const std::string &key, const T &value)
    {
        static_assert(is_config_value_v<T>, "[ConfigManager] Unsupported type.");
        auto it = rawValues_.find(key);
        if (it == rawValues_.end()) throw std::runtime_error("ConfigManager: key '" + key + "' is not registered.");
        ConfigValue next = value;
        if (next.index() != it->second.index())
            throw std::runtime_error("ConfigManager: key '" + key + "' expects " + TypeNameOf(it->second) + ", got " + TypeNameOf(next));
        it->second = std::move(next);
    }

  public:
    ConfigManager();

    // ===== Registration & access =====
    template <typename T> void Register(const std::string &key, const T &value, const std::string &desc = "")
    {
        static_assert(is_config_value_v<T>, "[ConfigManager] Unsupported type.");
        if (rawValues_.count(key)) throw std::runtime_error("ConfigManager: key already registered: " + key);
        rawValues_[key] = value;
        if (!desc.empty()) descriptions_[key] = desc;
    }

    void Register(const std::string &key, const char *value, const std::string &desc = "") { Register(key, std::string(value), desc); }

    template <typename T> void Set(const std::string &key, const T &value) { UpdateExisting(key, value); }
    void Set(const std::string &key, const char *value) { UpdateExisting(key, std::string(value)); }

    // Converts text to the registered type of the key.
    void SetFromString(const std::string &key, const std::string &text) { rawValues_.at(CheckedKey(key)) = ConvertFromText(key, text); }

    template <typename T> T Get(const std::string &key) const
    {
        static_assert(is_config_value_v<T>, "[ConfigManager] Requested type not in ConfigValue.");
        auto it = rawValues_.find(key);
        if (it == rawValues_.end()) throw std::runtime_error("ConfigManager: key not found: " + key);
        if constexpr (std::is_same_v<T, ConfigValue>)
            return it->second;
        else
            return std::get<T>(it->second);
    }

    bool Has(const std::string &key) const { return rawValues_.count(key) > 0; }
    std::vector<std::string> Keys() const;

    // ===== I/O =====
    void LoadYAMLFile(const std::string &path);
    void SaveYAMLFile(const std::string &path) const;
    void LoadJSONFile(const std::string &path);
    void SaveJSONFile(const std::string &path) const;
    void LoadEnvironment(const std::string &prefix = "HARVEST_");

    std::string DumpYAML(int indent = 2) const;
    std::string DumpJSON(int indent = 2) const;

    void SetParamsFromYAML(const YAML::Node &node);
    void RegisterCommon();

    // Pushes log_level / log_file to the logger; an empty log_file closes any open file.
    void ApplyLogging() const;

    static std::string TypeNameOf(const ConfigValue &v);
    static std::string EnvName(const std::string &prefix, const std::string &key);

    const auto &Descriptions() const { return descriptions_; }

  private:
    const std::string &CheckedKey(const std::string &key) const
    {
        if (!Has(key)) throw std::runtime_error("ConfigManager: key '" + key + "' is not registered.");
        return key;
    }
};
