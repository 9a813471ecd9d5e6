#include "ConfigManager.hh"
#include "Fetcher.hh"
#include "TestSupport.hh"
#include "Version.hh"

#include <cstdlib>
#include <stdexcept>

namespace
{
using namespace testsupport;
using logger::LogLevel;

bool ThrowsRuntimeError(const std::function<void()> &fn)
{
    try
    {
        fn();
    }
    catch (const std::runtime_error &)
    {
        return true;
    }
    return false;
}

bool DefaultsAreRegistered()
{
    ConfigManager config;
    bool ok = ExpectEqual(config.Get<std::string>("storage_dir"), std::string("."), "storage dir default");
    ok &= ExpectEqual(config.Get<std::string>("log_level"), std::string("INFO"), "log level default");
    ok &= ExpectEqual(config.Get<long long>("http.timeout"), 0LL, "no overall timeout by default");
    ok &= ExpectEqual(config.Get<long long>("http.connect_timeout"), 30LL, "connect timeout default");
    ok &= ExpectEqual(config.Get<std::string>("http.user_agent"), std::string("harvest/") + HarvestVersionString(), "user agent carries the version");
    ok &= ExpectTrue(config.Get<bool>("http.follow_redirects"), "redirects followed");
    ok &= ExpectTrue(config.Get<bool>("http.fail_on_status"), "error statuses fail");
    ok &= ExpectTrue(!config.Descriptions().at("storage_dir").empty(), "keys are described");
    const std::string components = std::to_string(HarvestVersionMajor()) + "." + std::to_string(HarvestVersionMinor()) + "." + std::to_string(HarvestVersionPatch());
    ok &= ExpectEqual(std::string(HarvestVersionString()), components, "version string matches its components");
    return ok;
}

bool LoadsNestedAndDottedYAML()
{
    TempDir dir;
    LogCapture logs;
    const auto path = dir.Path() / "harvest.yaml";
    WriteFile(path, "storage_dir: /var/lib/harvest\n"
                    "log_level: debug\n"
                    "http:\n"
                    "  timeout: 45\n"
                    "  follow_redirects: false\n"
                    "http.user_agent: scraper-bot/2\n");

    ConfigManager config;
    config.LoadYAMLFile(path.string());

    bool ok = ExpectEqual(config.Get<std::string>("storage_dir"), std::string("/var/lib/harvest"), "top-level string");
    ok &= ExpectEqual(config.Get<std::string>("log_level"), std::string("debug"), "log level kept as text");
    ok &= ExpectEqual(config.Get<long long>("http.timeout"), 45LL, "nested integer");
    ok &= ExpectTrue(!config.Get<bool>("http.follow_redirects"), "nested bool");
    ok &= ExpectEqual(config.Get<std::string>("http.user_agent"), std::string("scraper-bot/2"), "dotted key");
    ok &= ExpectEqual(config.Get<long long>("http.connect_timeout"), 30LL, "untouched key keeps its default");
    return ok;
}

bool UnknownKeysAreIgnoredWithWarning()
{
    TempDir dir;
    LogCapture logs;
    const auto path = dir.Path() / "harvest.yaml";
    WriteFile(path, "refresh_interval: 60\nhttp:\n  proxy: none\n");

    ConfigManager config;
    config.LoadYAMLFile(path.string());
    bool ok = ExpectTrue(logs.Contains(LogLevel::WARN, "refresh_interval"), "unknown top-level key reported");
    ok &= ExpectTrue(logs.Contains(LogLevel::WARN, "http.proxy"), "unknown nested key reported");
    ok &= ExpectTrue(!config.Has("refresh_interval"), "unknown key not registered");
    return ok;
}

bool TypeMismatchesAreRejected()
{
    TempDir dir;
    const auto path = dir.Path() / "bad.yaml";
    WriteFile(path, "http:\n  timeout: soon\n");

    ConfigManager config;
    bool ok = ExpectTrue(ThrowsRuntimeError([&]() { config.LoadYAMLFile(path.string()); }), "non-numeric timeout rejected");
    ok &= ExpectTrue(ThrowsRuntimeError([&]() { config.Set("http.timeout", std::string("10")); }), "string set on an integer key rejected");
    ok &= ExpectTrue(ThrowsRuntimeError([&]() { config.SetFromString("http.follow_redirects", "maybe"); }), "bad bool text rejected");
    ok &= ExpectTrue(ThrowsRuntimeError([&]() { config.Set("no.such.key", true); }), "unregistered key rejected");
    ok &= ExpectTrue(ThrowsRuntimeError([&]() { config.Register("storage_dir", "again"); }), "double registration rejected");
    ok &= ExpectTrue(ThrowsRuntimeError([&]() { config.LoadYAMLFile((dir.Path() / "missing.yaml").string()); }), "missing file rejected");

    config.SetFromString("http.follow_redirects", "off");
    ok &= ExpectTrue(!config.Get<bool>("http.follow_redirects"), "bool from text");
    return ok;
}

bool JSONFileRoundTrip()
{
    TempDir dir;
    LogCapture logs;
    const auto path = dir.Path() / "harvest.json";

    ConfigManager original;
    original.Set("storage_dir", "/srv/modules");
    original.Set("http.timeout", 90LL);
    original.Set("http.fail_on_status", false);
    original.SaveJSONFile(path.string());

    ConfigManager loaded;
    loaded.LoadJSONFile(path.string());
    bool ok = ExpectEqual(loaded.DumpJSON(), original.DumpJSON(), "same values after reload");

    // plain nested objects are accepted as well
    WriteFile(path, "{\"http\": {\"connect_timeout\": 5}, \"log_level\": \"WARN\"}");
    ConfigManager plain;
    plain.LoadJSONFile(path.string());
    ok &= ExpectEqual(plain.Get<long long>("http.connect_timeout"), 5LL, "nested JSON integer");
    ok &= ExpectEqual(plain.Get<std::string>("log_level"), std::string("WARN"), "JSON string");
    return ok;
}

bool YAMLDumpReloads()
{
    TempDir dir;
    LogCapture logs;
    const auto path = dir.Path() / "dump.yaml";

    ConfigManager original;
    original.Set("http.connect_timeout", 12LL);
    original.Set("log_file", "/tmp/harvest.log");
    original.SaveYAMLFile(path.string());

    ConfigManager loaded;
    loaded.LoadYAMLFile(path.string());
    bool ok = ExpectEqual(loaded.Get<long long>("http.connect_timeout"), 12LL, "integer survives");
    ok &= ExpectEqual(loaded.Get<std::string>("log_file"), std::string("/tmp/harvest.log"), "string survives");
    ok &= ExpectEqual(logs.Count(LogLevel::WARN), std::size_t(0), "dump only holds known keys");
    return ok;
}

bool EnvironmentOverrides()
{
    bool ok = ExpectEqual(ConfigManager::EnvName("HARVEST_", "http.connect_timeout"), std::string("HARVEST_HTTP_CONNECT_TIMEOUT"), "env name mapping");

    setenv("HARVEST_TEST_HTTP_TIMEOUT", "12", 1);
    setenv("HARVEST_TEST_STORAGE_DIR", "/data/modules", 1);
    ConfigManager config;
    config.LoadEnvironment("HARVEST_TEST_");
    unsetenv("HARVEST_TEST_HTTP_TIMEOUT");
    unsetenv("HARVEST_TEST_STORAGE_DIR");

    ok &= ExpectEqual(config.Get<long long>("http.timeout"), 12LL, "integer from environment");
    ok &= ExpectEqual(config.Get<std::string>("storage_dir"), std::string("/data/modules"), "string from environment");
    return ok;
}

bool FetchOptionsFollowConfig()
{
    ConfigManager config;
    config.Set("http.timeout", 20LL);
    config.Set("http.connect_timeout", 4LL);
    config.Set("http.user_agent", "custom/1");
    config.Set("http.follow_redirects", false);
    config.Set("http.fail_on_status", false);

    FetchOptions opt = FetchOptions::FromConfig(config);
    bool ok = ExpectEqual(opt.TimeoutSec, 20L, "timeout");
    ok &= ExpectEqual(opt.ConnectTimeoutSec, 4L, "connect timeout");
    ok &= ExpectEqual(opt.UserAgent, std::string("custom/1"), "user agent");
    ok &= ExpectTrue(!opt.FollowRedirects, "redirects");
    ok &= ExpectTrue(!opt.FailOnStatus, "status handling");
    return ok;
}

bool ApplyLoggingSetsLevel()
{
    auto &log = logger::Logger::Get();
    const LogLevel previous = log.GetLogLevel();

    ConfigManager config;
    config.Set("log_level", "warn");
    config.ApplyLogging();
    bool ok = ExpectTrue(log.GetLogLevel() == LogLevel::WARN, "level applied");

    {
        LogCapture logs;
        LOG_INFO("CONFIG", "filtered out");
        LOG_WARN("CONFIG", "kept");
        ok &= ExpectTrue(!logs.Contains(LogLevel::INFO, "filtered out"), "records below the level are dropped");
        ok &= ExpectTrue(logs.Contains(LogLevel::WARN, "kept"), "records at the level pass");
    }

    config.Set("log_level", "loud");
    ok &= ExpectTrue(ThrowsRuntimeError([&]() { config.ApplyLogging(); }), "unknown level rejected");
    log.SetLogLevel(previous);
    return ok;
}

bool DefaultFetcherOptions()
{
    CurlFetcher plain;
    bool ok = ExpectEqual(plain.Options().UserAgent, std::string("harvest/") + HarvestVersionString(), "empty user agent gets the default");
    ok &= ExpectEqual(plain.Options().ConnectTimeoutSec, 30L, "connect timeout default");
    ok &= ExpectTrue(plain.Options().FailOnStatus, "error statuses fail by default");

    ConfigManager config;
    config.Set("http.user_agent", "custom/1");
    CurlFetcher configured(FetchOptions::FromConfig(config));
    ok &= ExpectEqual(configured.Options().UserAgent, std::string("custom/1"), "configured user agent kept");
    return ok;
}

bool ApplyLoggingOpensAndClosesLogFile()
{
    TempDir dir;
    LogCapture logs;
    auto &log = logger::Logger::Get();
    const LogLevel previous = log.GetLogLevel();
    const auto path = dir.Path() / "harvest.log";

    ConfigManager config;
    config.Set("log_file", path.string());
    config.ApplyLogging();
    LOG_INFO("CONFIG", "written to file");

    config.Set("log_file", "");
    config.ApplyLogging();
    LOG_INFO("CONFIG", "after close");
    log.SetLogLevel(previous);

    const std::string text = ReadFile(path);
    bool ok = ExpectTrue(text.find("written to file") != std::string::npos, "record appended while the file is open");
    ok &= ExpectTrue(text.find("after close") == std::string::npos, "empty log_file closes the file");
    return ok;
}

} // namespace

int main()
{
    std::vector<TestCase> tests{
        {"DefaultsAreRegistered", DefaultsAreRegistered},
        {"LoadsNestedAndDottedYAML", LoadsNestedAndDottedYAML},
        {"UnknownKeysAreIgnoredWithWarning", UnknownKeysAreIgnoredWithWarning},
        {"TypeMismatchesAreRejected", TypeMismatchesAreRejected},
        {"JSONFileRoundTrip", JSONFileRoundTrip},
        {"YAMLDumpReloads", YAMLDumpReloads},
        {"EnvironmentOverrides", EnvironmentOverrides},
        {"FetchOptionsFollowConfig", FetchOptionsFollowConfig},
        {"ApplyLoggingSetsLevel", ApplyLoggingSetsLevel},
        {"DefaultFetcherOptions", DefaultFetcherOptions},
        {"ApplyLoggingOpensAndClosesLogFile", ApplyLoggingOpensAndClosesLogFile},
    };
    return testsupport::RunTests(tests);
}
