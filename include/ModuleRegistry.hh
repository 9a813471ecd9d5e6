#pragma once
#include "Fetcher.hh"
#include "ModuleRecord.hh"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct RefreshReport
{
    std::size_t Checked = 0;
    std::size_t Updated = 0;
    std::size_t Unchanged = 0;
    std::size_t Failed = 0;
};

// Catalog of downloaded script modules, persisted as <storageDir>/modules.json.
// Every public call holds one exclusive lock for its whole duration, network I/O included.
class ModuleRegistry
{
  public:
    static constexpr const char *kRegistryFileName = "modules.json";
    static constexpr const char *kScriptSuffix = ".js";

    explicit ModuleRegistry(const std::string &storageDir);
    ModuleRegistry(const std::string &storageDir, std::shared_ptr<IFetcher> fetcher);

    ModuleRegistry(const ModuleRegistry &) = delete;
    ModuleRegistry &operator=(const ModuleRegistry &) = delete;

    // Best-effort: failures are logged, never thrown.
    void Load();
    void Save();

    // Throw RegistryError.
    ModuleRecord AddModule(const std::string &metadataURL, const std::string &storageDir);
    void DeleteModule(const std::string &id, const std::string &storageDir);
    std::string GetModuleContent(const std::string &id, const std::string &storageDir) const;

    std::vector<ModuleSummary> ListModules() const;

    // Per-module failures are logged and skipped; the list is saved once at the end.
    RefreshReport RefreshModules(const std::string &storageDir);

    // Same operations against the directory given at construction.
    ModuleRecord AddModule(const std::string &metadataURL) { return AddModule(metadataURL, storageDir_); }
    void DeleteModule(const std::string &id) { DeleteModule(id, storageDir_); }
    std::string GetModuleContent(const std::string &id) const { return GetModuleContent(id, storageDir_); }
    RefreshReport RefreshModules() { return RefreshModules(storageDir_); }

    const std::string &StorageDir() const { return storageDir_; }
    std::string FilePath() const { return filePath_.string(); }

  private:
    void LoadLocked();
    void SaveLocked() const;
    const ModuleRecord *FindLocked(const std::string &id) const;

    std::unordered_map<std::string, ModuleRecord> records_;
    std::vector<std::string> order_;

    std::shared_ptr<IFetcher> fetcher_;
    std::string storageDir_;
    std::filesystem::path filePath_;
    mutable std::mutex mutex_;
};
