#include "ConfigManager.hh"
#include "Version.hh"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

ConfigManager::ConfigManager() { RegisterCommon(); }

std::string ConfigManager::TypeNameOf(const ConfigValue &v)
{
    return std::visit([](auto &&x) { return TypeName<std::decay_t<decltype(x)>>(); }, v);
}

std::string ConfigManager::EnvName(const std::string &prefix, const std::string &key)
{
    std::string name = prefix + key;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_'; });
    return name;
}

std::vector<std::string> ConfigManager::Keys() const
{
    std::vector<std::string> keys;
    for (const auto &kv : rawValues_)
        keys.push_back(kv.first);
    return keys;
}

// ================= text -> ConfigValue =================
ConfigValue ConfigManager::ConvertFromText(const std::string &key, const std::string &text) const
{
    const ConfigValue &like = rawValues_.at(key);
    return std::visit(
        [&](auto &&current) -> ConfigValue
        {
            using T = std::decay_t<decltype(current)>;
            if constexpr (std::is_same_v<T, bool>)
            {
                std::string lower = text;
                std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
                if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") return true;
                if (lower == "false" || lower == "no" || lower == "off" || lower == "0") return false;
                throw std::runtime_error("ConfigManager: key '" + key + "' expects bool, got '" + text + "'");
            }
            else if constexpr (std::is_same_v<T, long long>)
            {
                try
                {
                    std::size_t used = 0;
                    long long v = std::stoll(text, &used);
                    if (used == text.size()) return v;
                }
                catch (const std::logic_error &)
                {
                }
                throw std::runtime_error("ConfigManager: key '" + key + "' expects long long, got '" + text + "'");
            }
            else if constexpr (std::is_same_v<T, double>)
            {
                try
                {
                    std::size_t used = 0;
                    double v = std::stod(text, &used);
                    if (used == text.size()) return v;
                }
                catch (const std::logic_error &)
                {
                }
                throw std::runtime_error("ConfigManager: key '" + key + "' expects double, got '" + text + "'");
            }
            else
            {
                return text;
            }
        },
        like);
}

// ================= JSON -> ConfigValue =================
ConfigValue ConfigManager::ConvertFromJSON(const std::string &key, const json &val) const
{
    if (val.is_string()) return ConvertFromText(key, val.get<std::string>());
    if (val.is_boolean()) return ConvertFromText(key, val.get<bool>() ? "true" : "false");
    if (val.is_number_integer()) return ConvertFromText(key, std::to_string(val.get<long long>()));
    if (val.is_number_float())
    {
        if (std::holds_alternative<double>(rawValues_.at(key))) return val.get<double>();
        throw std::runtime_error("ConfigManager: key '" + key + "' does not accept a floating-point value");
    }
    throw std::runtime_error("ConfigManager: unsupported JSON value type for key: " + key);
}

// ============== Internal ==============
json ConfigManager::ToJSONInternal() const
{
    json j;
    for (const auto &[k, v] : rawValues_)
    {
        json entry;
        entry["description"] = descriptions_.count(k) ? descriptions_.at(k) : "";
        std::visit(
            [&](auto &&val)
            {
                using T = std::decay_t<decltype(val)>;
                entry["value"] = val;
                entry["type"] = TypeName<T>();
            },
            v);

        j[k] = std::move(entry);
    }
    return j;
}

YAML::Node ConfigManager::ToYAMLInternal() const
{
    YAML::Node node;
    for (const auto &[k, v] : rawValues_)
        std::visit([&](auto &&val) { node[k] = val; }, v);
    return node;
}

void ConfigManager::FlattenYAML(const YAML::Node &node, const std::string &prefix)
{
    for (const auto &it : node)
    {
        const std::string key = prefix.empty() ? it.first.as<std::string>() : prefix + "." + it.first.as<std::string>();
        if (it.second.IsMap())
        {
            FlattenYAML(it.second, key);
            continue;
        }
        if (!Has(key))
        {
            LOG_WARN("CONFIG", "Unknown key '" << key << "' is ignored.");
            continue;
        }
        if (!it.second.IsScalar()) throw std::runtime_error("ConfigManager: key '" + key + "' expects a scalar value.");
        rawValues_[key] = ConvertFromText(key, it.second.Scalar());
    }
}

void ConfigManager::FlattenJSON(const json &node, const std::string &prefix)
{
    for (auto it = node.begin(); it != node.end(); ++it)
    {
        const json &entry = it.value();
        const std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        if (entry.is_object() && !entry.contains("value"))
        {
            FlattenJSON(entry, key);
            continue;
        }
        if (!Has(key))
        {
            LOG_WARN("CONFIG", "Unknown key '" << key << "' is ignored.");
            continue;
        }
        const json &value = entry.is_object() ? entry.at("value") : entry;
        rawValues_[key] = ConvertFromJSON(key, value);
    }
}

// ============== Public I/O ==============
void ConfigManager::LoadYAMLFile(const std::string &path)
{
    YAML::Node node;
    try
    {
        node = YAML::LoadFile(path);
    }
    catch (const YAML::Exception &e)
    {
        throw std::runtime_error("ConfigManager: cannot load YAML file " + path + ": " + e.what());
    }
    SetParamsFromYAML(node);
    LOG_INFO("CONFIG", "Configuration " << path << " has been loaded.");
}

void ConfigManager::SaveYAMLFile(const std::string &path) const
{
    std::ofstream fout(path);
    if (!fout.is_open()) throw std::runtime_error("ConfigManager: cannot open YAML file: " + path);
    fout << DumpYAML(2);
}

void ConfigManager::LoadJSONFile(const std::string &path)
{
    std::ifstream fin(path);
    if (!fin.is_open()) throw std::runtime_error("ConfigManager: cannot open JSON file: " + path);
    json j;
    try
    {
        fin >> j;
    }
    catch (const json::parse_error &e)
    {
        throw std::runtime_error("ConfigManager: cannot parse JSON file " + path + ": " + e.what());
    }
    if (!j.is_object()) throw std::runtime_error("ConfigManager: JSON file " + path + " must hold an object.");
    FlattenJSON(j, "");
    LOG_INFO("CONFIG", "Configuration " << path << " has been loaded.");
}

void ConfigManager::SaveJSONFile(const std::string &path) const
{
    std::ofstream fout(path);
    if (!fout.is_open()) throw std::runtime_error("ConfigManager: cannot open JSON file: " + path);
    fout << ToJSONInternal().dump(2);
}

void ConfigManager::LoadEnvironment(const std::string &prefix)
{
    for (auto &[key, _] : rawValues_)
    {
        const std::string name = EnvName(prefix, key);
        const char *value = std::getenv(name.c_str());
        if (!value) continue;
        rawValues_[key] = ConvertFromText(key, value);
        LOG_DEBUG("CONFIG", key << " = " << value << " (from " << name << ")");
    }
}

std::string ConfigManager::DumpYAML(int indent) const
{
    YAML::Emitter out;
    out.SetIndent(indent);
    out.SetMapFormat(YAML::Block);
    out << ToYAMLInternal();
    return out.c_str();
}

std::string ConfigManager::DumpJSON(int indent) const { return ToJSONInternal().dump(indent); }

void ConfigManager::SetParamsFromYAML(const YAML::Node &node)
{
    if (!node || node.IsNull()) return;
    if (!node.IsMap()) throw std::runtime_error("ConfigManager: configuration root must be a map.");
    FlattenYAML(node, "");
}

void ConfigManager::ApplyLogging() const
{
    auto &log = logger::Logger::Get();
    log.SetLogLevel(logger::LogLevelFromString(Get<std::string>("log_level")));
    const std::string file = Get<std::string>("log_file");
    if (file.empty())
        log.CloseLogFile();
    else
        log.InitLogFile(file);
}

// ============== Common ==============
void ConfigManager::RegisterCommon()
{
    Register("storage_dir", ".", "directory holding modules.json and cached scripts");
    Register("log_level", "INFO", "DEBUG, INFO, WARN, ERROR or NONE");
    Register("log_file", "", "append log records to this file when set");
    Register("http.timeout", 0LL, "overall transfer limit in seconds, 0 for none");
    Register("http.connect_timeout", 30LL, "connection limit in seconds");
    Register("http.user_agent", std::string("harvest/") + HarvestVersionString(), "User-Agent header");
    Register("http.follow_redirects", true, "follow HTTP redirects");
    Register("http.fail_on_status", true, "treat HTTP status >= 400 as a fetch failure");
}
