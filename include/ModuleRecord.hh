#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

struct ModuleMetadata
{
    std::string SourceName;
    std::string ScriptURL;
    std::string Version;
    json Extra = json::object(); // remaining remote fields, written back verbatim
};

struct ModuleRecord
{
    std::string ID;
    ModuleMetadata Metadata;
    std::string LocalPath;
    std::string MetadataURL;
    bool IsActive = false;
    std::string ScriptSha256;
};

struct ModuleSummary
{
    std::string ID;
    std::string Name;
};

// ===== JSON codec =====
// Decoders throw RegistryError(ParseError). Known keys match case-insensitively, exact case first.
ModuleMetadata ParseMetadata(const std::string &body);
ModuleMetadata MetadataFromJSON(const json &j);
json MetadataToJSON(const ModuleMetadata &metadata);

ModuleRecord RecordFromJSON(const json &j);
json RecordToJSON(const ModuleRecord &record);

std::vector<ModuleRecord> RecordsFromJSON(const json &j);
json RecordsToJSON(const std::vector<ModuleRecord> &records);
