#include "Logger.hh"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace logger
{

LogLevel LogLevelFromString(const std::string &name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "NONE") return LogLevel::NONE;
    throw std::runtime_error("Unknown log level: " + name);
}

Logger &Logger::Get()
{
    static Logger instance;
    return instance;
}

Logger::Logger() {}

void Logger::SetLogLevel(LogLevel level)
{
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    g_level = level;
}

LogLevel Logger::GetLogLevel()
{
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    return g_level;
}

void Logger::InitLogFile(const std::string &path)
{
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    log_file_out = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!log_file_out->is_open()) throw std::runtime_error("Failed to open log file: " + path);
}

void Logger::CloseLogFile()
{
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    log_file_out.reset();
}

void Logger::SetSink(Sink sink)
{
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    sink_ = std::move(sink);
}

void Logger::SetQuiet(bool quiet)
{
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    quiet_ = quiet;
}

std::string Logger::ToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARNING";
    case LogLevel::ERROR:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

std::string Logger::LevelToColor(LogLevel level)
{
    switch (level)
    {
    case LogLevel::DEBUG:
        return "magenta";
    case LogLevel::INFO:
        return "cyan";
    case LogLevel::WARN:
        return "yellow";
    case LogLevel::ERROR:
        return "red";
    default:
        return "white";
    }
}

std::string Logger::colored(const std::string &text, const std::string &color, const std::string &style)
{
    std::string header, styleCode;
    if (color == "red")
        header = "31";
    else if (color == "green")
        header = "32";
    else if (color == "yellow")
        header = "33";
    else if (color == "blue")
        header = "34";
    else if (color == "magenta")
        header = "35";
    else if (color == "cyan")
        header = "36";
    else if (color == "white")
        header = "37";
    else
        header = "39";

    if (style == "bold")
        styleCode = "1;";
    else if (style == "underline")
        styleCode = "4;";
    else if (style == "dim")
        styleCode = "2;";
    else
        styleCode = "";

    return "\x1B[" + styleCode + header + "m" + text + "\x1B[0m";
}

std::string Logger::ReplaceRegex(const std::string &input, const std::regex &pattern, std::function<std::string(const std::smatch &)> replacer)
{
    std::string output;
    std::sregex_iterator begin(input.begin(), input.end(), pattern), end;
    std::size_t last_pos = 0;
    for (auto it = begin; it != end; ++it)
    {
        output += input.substr(last_pos, it->position() - last_pos);
        output += replacer(*it);
        last_pos = it->position() + it->length();
    }
    output += input.substr(last_pos);
    return output;
}

std::string Logger::HighlightFileNames(std::string msg)
{
    std::regex file_pattern(R"((\b[\w\-/\.]+\.(js|json|yaml|yml)\b))");
    return ReplaceRegex(msg, file_pattern, [&](const std::smatch &m) { return colored(m.str(), "green", "bold"); });
}

std::string Logger::HighlightParams(std::string msg)
{
    std::regex kv_pattern(R"((\b\w+\b)\s*=\s*([\w\.\-]+))");
    return ReplaceRegex(msg, kv_pattern, [&](const std::smatch &m) { return colored(m[1].str(), "magenta", "bold") + " = " + colored(m[2].str(), "white"); });
}

// Remote locations are underlined, module ids dimmed.
std::string Logger::HighlightUrls(std::string msg)
{
    std::regex url_pattern(R"(\bhttps?://[^\s'"]+)");
    return ReplaceRegex(msg, url_pattern, [&](const std::smatch &m) { return colored(m.str(), "blue", "underline"); });
}

std::string Logger::HighlightIds(std::string msg)
{
    std::regex id_pattern(R"(\b[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}\b)");
    return ReplaceRegex(msg, id_pattern, [&](const std::smatch &m) { return colored(m.str(), "white", "dim"); });
}

std::string Logger::HighlightWarnings(std::string msg)
{
    const std::vector<std::string> keywords = {"Failed to", "Cannot", "already exists", "not found", "mismatch", "Skipping"};
    for (const auto &k : keywords)
    {
        auto pos = msg.find(k);
        if (pos != std::string::npos) msg.replace(pos, k.size(), colored(k, "red", "bold"));
    }
    return msg;
}

std::string Logger::HighlightMsg(const std::string &msg)
{
    std::string m = msg;
    m = HighlightUrls(m);
    if (m == msg) m = HighlightFileNames(m);
    m = HighlightIds(m);
    m = HighlightParams(m);
    m = HighlightWarnings(m);
    return m;
}

std::string Logger::ApplyColor(LogLevel level, const std::string &module, const std::string &msg)
{
    std::string level_str = colored("[" + ToString(level) + "]", LevelToColor(level));
    std::string mod_str;

    if (module == "REGISTRY")
        mod_str = colored(module, "blue", "bold");
    else if (module == "FETCH")
        mod_str = colored(module, "blue");
    else if (module == "CONFIG")
        mod_str = colored(module, "green");
    else
        mod_str = colored(module, "magenta");

    return level_str + " [" + mod_str + "] " + HighlightMsg(msg);
}

void Logger::Log(LogLevel level, const std::string &module, const std::string &msg)
{
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    if (level < g_level) return;

    std::string raw = "[" + ToString(level) + "] [" + module + "] " + msg;

    // stdout
    if (!quiet_)
    {
        if (is_terminal)
            std::cout << ApplyColor(level, module, msg) << std::endl;
        else
            std::cout << raw << std::endl;
    }

    // file
    if (log_file_out && log_file_out->is_open())
    {
        *log_file_out << "[" << GetCurrentTime() << "] " << raw << std::endl;
    }

    if (sink_) sink_(level, module, msg);
}

std::string Logger::GetCurrentTime()
{
    std::lock_guard<std::recursive_mutex> lock(log_mutex);
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&now_c), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace logger
