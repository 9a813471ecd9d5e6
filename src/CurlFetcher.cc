#include "ConfigManager.hh"
#include "Fetcher.hh"
#include "Logger.hh"
#include "RegistryError.hh"
#include "Version.hh"

#include <curl/curl.h>
#include <mutex>

namespace
{

size_t curl_write_str(void *ptr, size_t sz, size_t nm, void *userdata)
{
    auto *out = static_cast<std::string *>(userdata);
    out->append(static_cast<const char *>(ptr), sz * nm);
    return sz * nm;
}

void EnsureCurlGlobalInit()
{
    static std::once_flag once;
    std::call_once(once,
                   []()
                   {
                       CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
                       if (rc != CURLE_OK) throw RegistryError(ErrorCode::FetchError, std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
                   });
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

} // namespace

FetchOptions FetchOptions::FromConfig(const ConfigManager &config)
{
    FetchOptions opt;
    opt.TimeoutSec = static_cast<long>(config.Get<long long>("http.timeout"));
    opt.ConnectTimeoutSec = static_cast<long>(config.Get<long long>("http.connect_timeout"));
    opt.UserAgent = config.Get<std::string>("http.user_agent");
    opt.FollowRedirects = config.Get<bool>("http.follow_redirects");
    opt.FailOnStatus = config.Get<bool>("http.fail_on_status");
    return opt;
}

CurlFetcher::CurlFetcher() : CurlFetcher(FetchOptions{}) {}

CurlFetcher::CurlFetcher(FetchOptions options) : options_(std::move(options))
{
    if (options_.UserAgent.empty()) options_.UserAgent = std::string("harvest/") + HarvestVersionString();
    EnsureCurlGlobalInit();
}

std::string CurlFetcher::Get(const std::string &url)
{
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) throw RegistryError(ErrorCode::FetchError, "curl_easy_init failed for " + url);

    std::string body;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, options_.FollowRedirects ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.UserAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, ""); // gzip/deflate are decoded by curl
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &curl_write_str);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.ConnectTimeoutSec);
    if (options_.TimeoutSec > 0) curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.TimeoutSec);

    LOG_DEBUG("FETCH", "GET " << url);
    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK)
    {
        std::string reason = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc));
        throw RegistryError(ErrorCode::FetchError, "GET " + url + " failed: " + reason);
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    LOG_DEBUG("FETCH", "status = " << http_code << ", bytes = " << body.size());

    if (options_.FailOnStatus && http_code >= 400)
        throw RegistryError(ErrorCode::FetchError, "GET " + url + " returned HTTP status " + std::to_string(http_code));

    return body;
}
