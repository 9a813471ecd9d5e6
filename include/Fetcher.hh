#pragma once
#include <memory>
#include <string>

class ConfigManager;

struct FetchOptions
{
    long TimeoutSec = 0; // 0 = no overall limit
    long ConnectTimeoutSec = 30;
    std::string UserAgent;
    bool FollowRedirects = true;
    bool FailOnStatus = true; // treat HTTP status >= 400 as a fetch failure

    static FetchOptions FromConfig(const ConfigManager &config);
};

// Retrieves a remote body. Implementations throw RegistryError(FetchError).
class IFetcher
{
  public:
    virtual ~IFetcher() = default;
    virtual std::string Get(const std::string &url) = 0;
};

class CurlFetcher : public IFetcher
{
  public:
    CurlFetcher();
    explicit CurlFetcher(FetchOptions options);

    std::string Get(const std::string &url) override;
    const FetchOptions &Options() const { return options_; }

  private:
    FetchOptions options_;
};
