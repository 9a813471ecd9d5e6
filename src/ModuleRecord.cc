#include "ModuleRecord.hh"
#include "RegistryError.hh"
#include "Uuid.hh"

#include <algorithm>
#include <cctype>

namespace
{

std::string Lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool SameKey(const std::string &a, const std::string &b) { return Lower(a) == Lower(b); }

const json *FindField(const json &obj, const std::string &key)
{
    auto exact = obj.find(key);
    if (exact != obj.end()) return &*exact;
    for (auto it = obj.begin(); it != obj.end(); ++it)
    {
        if (SameKey(it.key(), key)) return &*it;
    }
    return nullptr;
}

std::string StringField(const json &obj, const std::string &key, const std::string &what)
{
    const json *v = FindField(obj, key);
    if (!v || v->is_null()) return "";
    if (!v->is_string()) throw RegistryError(ErrorCode::ParseError, what + ": field '" + key + "' is not a string");
    return v->get<std::string>();
}

bool BoolField(const json &obj, const std::string &key, const std::string &what)
{
    const json *v = FindField(obj, key);
    if (!v || v->is_null()) return false;
    if (!v->is_boolean()) throw RegistryError(ErrorCode::ParseError, what + ": field '" + key + "' is not a boolean");
    return v->get<bool>();
}

const std::vector<std::string> kMetadataKeys = {"sourceName", "scriptURL", "version"};

} // namespace

// ================= Metadata =================
ModuleMetadata ParseMetadata(const std::string &body)
{
    json j;
    try
    {
        j = json::parse(body);
    }
    catch (const json::parse_error &e)
    {
        throw RegistryError(ErrorCode::ParseError, std::string("metadata: ") + e.what());
    }
    return MetadataFromJSON(j);
}

ModuleMetadata MetadataFromJSON(const json &j)
{
    if (!j.is_object()) throw RegistryError(ErrorCode::ParseError, "metadata: expected a JSON object");

    ModuleMetadata m;
    m.SourceName = StringField(j, "sourceName", "metadata");
    m.ScriptURL = StringField(j, "scriptURL", "metadata");
    m.Version = StringField(j, "version", "metadata");

    for (auto it = j.begin(); it != j.end(); ++it)
    {
        bool known = std::any_of(kMetadataKeys.begin(), kMetadataKeys.end(), [&](const std::string &k) { return SameKey(k, it.key()); });
        if (!known) m.Extra[it.key()] = it.value();
    }
    return m;
}

json MetadataToJSON(const ModuleMetadata &metadata)
{
    json j = metadata.Extra.is_object() ? metadata.Extra : json::object();
    j["sourceName"] = metadata.SourceName;
    j["scriptURL"] = metadata.ScriptURL;
    j["version"] = metadata.Version;
    return j;
}

// ================= Record =================
ModuleRecord RecordFromJSON(const json &j)
{
    if (!j.is_object()) throw RegistryError(ErrorCode::ParseError, "record: expected a JSON object");

    ModuleRecord r;
    auto id = NormalizeUuid(StringField(j, "id", "record"));
    if (!id) throw RegistryError(ErrorCode::ParseError, "record: 'id' is not a UUID");
    r.ID = *id;

    const json *meta = FindField(j, "metadata");
    if (meta && !meta->is_null()) r.Metadata = MetadataFromJSON(*meta);

    r.LocalPath = StringField(j, "localPath", "record");
    r.MetadataURL = StringField(j, "metadataURL", "record");
    r.IsActive = BoolField(j, "isActive", "record");
    r.ScriptSha256 = StringField(j, "scriptSha256", "record");
    return r;
}

json RecordToJSON(const ModuleRecord &record)
{
    json j;
    j["id"] = record.ID;
    j["metadata"] = MetadataToJSON(record.Metadata);
    j["localPath"] = record.LocalPath;
    j["metadataURL"] = record.MetadataURL;
    j["isActive"] = record.IsActive;
    j["scriptSha256"] = record.ScriptSha256;
    return j;
}

std::vector<ModuleRecord> RecordsFromJSON(const json &j)
{
    // A literal null is read as an empty registry.
    if (j.is_null()) return {};
    if (!j.is_array()) throw RegistryError(ErrorCode::ParseError, "registry file: expected a JSON array");

    std::vector<ModuleRecord> records;
    records.reserve(j.size());
    for (const auto &entry : j)
        records.push_back(RecordFromJSON(entry));
    return records;
}

json RecordsToJSON(const std::vector<ModuleRecord> &records)
{
    json arr = json::array();
    for (const auto &r : records)
        arr.push_back(RecordToJSON(r));
    return arr;
}
