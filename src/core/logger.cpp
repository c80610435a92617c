#include <roomassign/logger.hpp>

#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace roomassign
{

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::add_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks()
{
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    if (!is_enabled(level))
        return;

    const LogEntry entry{std::chrono::system_clock::now(),
                         level,
                         std::string(category),
                         std::string(message)};

    // Sinks run under the lock so lines from different threads never interleave.
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink : sinks_)
        sink(entry);
}

std::string Logger::substitute(std::string_view pattern, const std::vector<std::string>& args)
{
    std::string out;
    out.reserve(pattern.size() + 16 * args.size());

    size_t next = 0;
    size_t pos  = 0;
    while (pos < pattern.size())
    {
        if (next < args.size() && pattern.compare(pos, 2, "{}") == 0)
        {
            out += args[next++];
            pos += 2;
        }
        else
        {
            out += pattern[pos++];
        }
    }
    return out;
}

std::string Logger::level_to_string(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Critical:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> Logger::level_from_string(std::string_view name)
{
    std::string lower(name);
    for (auto& c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warning;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "critical")
        return LogLevel::Critical;
    return std::nullopt;
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    const auto time_t = std::chrono::system_clock::to_time_t(tp);
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream os;
    os << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << ms;
    return os.str();
}

namespace sinks
{

namespace
{

// "2024-03-05 14:07:09.123 WARN  [pipeline] message"
void write_line(std::ostream& os, const Logger::LogEntry& entry)
{
    os << Logger::timestamp_to_string(entry.timestamp) << ' ' << std::left << std::setw(5)
       << Logger::level_to_string(entry.level) << std::right << " [" << entry.category << "] "
       << entry.message;
}

// ANSI foreground colour; the bright variants read better on dark terminals.
const char* color_for(LogLevel level, bool bright)
{
    switch (level)
    {
        case LogLevel::Trace:
            return bright ? "\033[97m" : "\033[90m";
        case LogLevel::Debug:
            return bright ? "\033[96m" : "\033[36m";
        case LogLevel::Info:
            return bright ? "\033[92m" : "\033[32m";
        case LogLevel::Warning:
            return bright ? "\033[93m" : "\033[33m";
        case LogLevel::Error:
            return bright ? "\033[91m" : "\033[31m";
        case LogLevel::Critical:
            return bright ? "\033[1;95m" : "\033[1;35m";
    }
    return "";
}

}   // namespace

Logger::LogSink console_sink(bool colored, bool bright)
{
    return [colored, bright](const Logger::LogEntry& entry)
    {
        if (colored)
            std::clog << color_for(entry.level, bright);
        write_line(std::clog, entry);
        if (colored)
            std::clog << "\033[0m";
        std::clog << '\n';
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    return [file](const Logger::LogEntry& entry)
    {
        if (!file->is_open())
            return;
        write_line(*file, entry);
        *file << std::endl;
    };
}

}   // namespace sinks

}   // namespace roomassign
