#include "ModuleRegistry.hh"
#include "Logger.hh"
#include "RegistryError.hh"
#include "Uuid.hh"
#include "sha256.hh"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace fs = std::filesystem;

namespace
{

void WriteScript(const fs::path &path, const std::string &body)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw RegistryError(ErrorCode::IOError, "Failed to open " + path.string() + " for writing");
    out.write(body.data(), static_cast<std::streamsize>(body.size()));
    out.close();
    if (out.fail()) throw RegistryError(ErrorCode::IOError, "Failed to write " + path.string());
}

std::string ReadScript(const fs::path &path)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) throw RegistryError(ErrorCode::IOError, "Cannot read " + path.string() + ": not a regular file");

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) throw RegistryError(ErrorCode::IOError, "Failed to open " + path.string());
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) throw RegistryError(ErrorCode::IOError, "Failed to read " + path.string());
    return oss.str();
}

} // namespace

ModuleRegistry::ModuleRegistry(const std::string &storageDir) : ModuleRegistry(storageDir, std::make_shared<CurlFetcher>()) {}

ModuleRegistry::ModuleRegistry(const std::string &storageDir, std::shared_ptr<IFetcher> fetcher)
    : fetcher_(std::move(fetcher)), storageDir_(storageDir), filePath_(fs::path(storageDir) / kRegistryFileName)
{
    if (!fetcher_) throw std::invalid_argument("ModuleRegistry: fetcher must not be null");
    Load();
}

// ================= Persistence =================
void ModuleRegistry::Load()
{
    std::lock_guard<std::mutex> lock(mutex_);
    LoadLocked();
}

void ModuleRegistry::Save()
{
    std::lock_guard<std::mutex> lock(mutex_);
    SaveLocked();
}

void ModuleRegistry::LoadLocked()
{
    std::error_code ec;
    if (!fs::exists(filePath_, ec))
    {
        if (ec) LOG_WARN("REGISTRY", "Failed to load modules from " << filePath_.string() << ": " << ec.message());
        return;
    }

    std::ifstream in(filePath_);
    if (!in.is_open())
    {
        LOG_WARN("REGISTRY", "Failed to load modules from " << filePath_.string());
        return;
    }

    std::vector<ModuleRecord> loaded;
    try
    {
        loaded = RecordsFromJSON(json::parse(in));
    }
    catch (const json::exception &e)
    {
        LOG_WARN("REGISTRY", "Failed to parse modules JSON " << filePath_.string() << ": " << e.what());
        return;
    }
    catch (const RegistryError &e)
    {
        LOG_WARN("REGISTRY", "Failed to parse modules JSON " << filePath_.string() << ": " << e.what());
        return;
    }

    std::unordered_map<std::string, ModuleRecord> records;
    std::vector<std::string> order;
    std::unordered_set<std::string> urls;
    for (auto &record : loaded)
    {
        if (records.count(record.ID) || urls.count(record.MetadataURL))
        {
            LOG_WARN("REGISTRY", "Skipping duplicate entry " << record.ID << " for " << record.MetadataURL);
            continue;
        }
        urls.insert(record.MetadataURL);
        order.push_back(record.ID);
        records.emplace(record.ID, std::move(record));
    }

    records_ = std::move(records);
    order_ = std::move(order);
    LOG_DEBUG("REGISTRY", "Loaded " << order_.size() << " modules from " << filePath_.string());
}

void ModuleRegistry::SaveLocked() const
{
    std::vector<ModuleRecord> ordered;
    ordered.reserve(order_.size());
    for (const auto &id : order_)
        ordered.push_back(records_.at(id));

    const std::string text = RecordsToJSON(ordered).dump(2, ' ', false, json::error_handler_t::replace);

    fs::path tmp = filePath_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open())
        {
            LOG_ERROR("REGISTRY", "Failed to save modules: cannot open " << tmp.string());
            return;
        }
        out << text << '\n';
        out.close();
        if (out.fail())
        {
            LOG_ERROR("REGISTRY", "Failed to save modules: write to " << tmp.string() << " failed");
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return;
        }
    }

    std::error_code ec;
    fs::rename(tmp, filePath_, ec);
    if (ec)
    {
        LOG_ERROR("REGISTRY", "Failed to save modules to " << filePath_.string() << ": " << ec.message());
        std::error_code ignored;
        fs::remove(tmp, ignored);
    }
}

const ModuleRecord *ModuleRegistry::FindLocked(const std::string &id) const
{
    auto key = NormalizeUuid(id);
    if (!key) return nullptr;
    auto it = records_.find(*key);
    return it == records_.end() ? nullptr : &it->second;
}

// ================= Operations =================
ModuleRecord ModuleRegistry::AddModule(const std::string &metadataURL, const std::string &storageDir)
{
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto &id : order_)
    {
        if (records_.at(id).MetadataURL == metadataURL) throw RegistryError(ErrorCode::AlreadyExists, "Module already exists for " + metadataURL);
    }

    ModuleMetadata metadata = ParseMetadata(fetcher_->Get(metadataURL));
    const std::string script = fetcher_->Get(metadata.ScriptURL);

    const std::string fileName = GenerateUuid() + kScriptSuffix;
    WriteScript(fs::path(storageDir) / fileName, script);

    ModuleRecord record;
    do
        record.ID = GenerateUuid();
    while (records_.count(record.ID));
    record.Metadata = std::move(metadata);
    record.LocalPath = fileName;
    record.MetadataURL = metadataURL;
    record.IsActive = false;
    record.ScriptSha256 = sha256(script);

    records_.emplace(record.ID, record);
    order_.push_back(record.ID);
    SaveLocked();

    LOG_INFO("REGISTRY", "Added module " << record.Metadata.SourceName << " as " << fileName);
    return record;
}

void ModuleRegistry::DeleteModule(const std::string &id, const std::string &storageDir)
{
    std::lock_guard<std::mutex> lock(mutex_);

    const ModuleRecord *found = FindLocked(id);
    if (!found) throw RegistryError(ErrorCode::NotFound, "Module " + id + " not found");

    const std::string key = found->ID;
    const std::string source = found->Metadata.SourceName;
    const fs::path scriptPath = fs::path(storageDir) / found->LocalPath;

    // remove() reports a missing file as false, not as an error
    std::error_code ec;
    fs::remove(scriptPath, ec);
    if (ec) LOG_WARN("REGISTRY", "Failed to delete module script " << scriptPath.string() << ": " << ec.message());

    records_.erase(key);
    order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
    SaveLocked();

    LOG_INFO("REGISTRY", "Deleted module " << source);
}

std::vector<ModuleSummary> ModuleRegistry::ListModules() const
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<ModuleSummary> summaries;
    summaries.reserve(order_.size());
    for (const auto &id : order_)
        summaries.push_back({id, records_.at(id).Metadata.SourceName});
    return summaries;
}

std::string ModuleRegistry::GetModuleContent(const std::string &id, const std::string &storageDir) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    const ModuleRecord *found = FindLocked(id);
    if (!found) throw RegistryError(ErrorCode::NotFound, "Module " + id + " not found");

    std::string content = ReadScript(fs::path(storageDir) / found->LocalPath);
    if (!found->ScriptSha256.empty() && sha256(content) != found->ScriptSha256)
        LOG_WARN("REGISTRY", "Checksum mismatch for " << found->LocalPath << " of module " << found->Metadata.SourceName);
    return content;
}

RefreshReport ModuleRegistry::RefreshModules(const std::string &storageDir)
{
    std::lock_guard<std::mutex> lock(mutex_);

    RefreshReport report;
    for (const auto &id : order_)
    {
        ModuleRecord &record = records_.at(id);
        const std::string &source = record.Metadata.SourceName;
        ++report.Checked;

        ModuleMetadata fresh;
        try
        {
            fresh = ParseMetadata(fetcher_->Get(record.MetadataURL));
        }
        catch (const RegistryError &e)
        {
            LOG_WARN("REGISTRY", "Failed to refresh module " << source << ": " << e.what());
            ++report.Failed;
            continue;
        }

        if (fresh.Version == record.Metadata.Version)
        {
            ++report.Unchanged;
            continue;
        }

        std::string script;
        try
        {
            script = fetcher_->Get(fresh.ScriptURL);
        }
        catch (const RegistryError &e)
        {
            LOG_WARN("REGISTRY", "Failed to fetch updated script of " << source << ": " << e.what());
            ++report.Failed;
            continue;
        }

        try
        {
            WriteScript(fs::path(storageDir) / record.LocalPath, script);
        }
        catch (const RegistryError &e)
        {
            LOG_WARN("REGISTRY", "Failed to save updated script of " << source << ": " << e.what());
            ++report.Failed;
            continue;
        }

        record.Metadata = std::move(fresh);
        record.ScriptSha256 = sha256(script);
        ++report.Updated;
        LOG_INFO("REGISTRY", "Updated module " << record.Metadata.SourceName << ", version = " << record.Metadata.Version);
    }

    SaveLocked();
    LOG_INFO("REGISTRY", "Refresh finished: checked = " << report.Checked << ", updated = " << report.Updated << ", failed = " << report.Failed);
    return report;
}
