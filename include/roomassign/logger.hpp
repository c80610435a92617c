#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace roomassign
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Process-wide, category-tagged logger. Entries below the minimum level are
// dropped before formatting; the rest go to every registered sink in order.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel level() const { return min_level_.load(std::memory_order_relaxed); }
    bool     is_enabled(LogLevel level) const { return level >= this->level(); }

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    // Replaces each "{}" in `pattern` with the next argument. Surplus
    // placeholders are left as they are.
    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view pattern, Args&&... args)
    {
        if (!is_enabled(level))
            return;
        log(level, category, substitute(pattern, {to_text(std::forward<Args>(args))...}));
    }

    static std::string level_to_string(LogLevel level);

    // "trace", "debug", "info", "warn"/"warning", "error", "critical"; any case.
    static std::optional<LogLevel> level_from_string(std::string_view name);

    // Local time, "YYYY-MM-DD HH:MM:SS.mmm".
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> min_level_{LogLevel::Info};
    std::mutex            sinks_mutex_;
    std::vector<LogSink>  sinks_;

    static std::string substitute(std::string_view pattern, const std::vector<std::string>& args);

    template <typename T>
    static std::string to_text(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else if constexpr (std::is_same_v<D, char>)
            return std::string(1, v);
        else if constexpr (std::is_arithmetic_v<D> || std::is_enum_v<D>)
        {
            if constexpr (std::is_enum_v<D>)
                return std::to_string(static_cast<std::underlying_type_t<D>>(v));
            else
                return std::to_string(v);
        }
        else if constexpr (std::is_pointer_v<D>)
            return v ? std::string(v) : std::string("(null)");
        else
            return std::string(std::string_view(v));
    }
};

namespace sinks
{
// Writes to stderr so stdout stays reserved for command output.
// `bright` selects the high-contrast palette used with the dark display mode.
Logger::LogSink console_sink(bool colored = true, bool bright = false);

// Appends to `filename`; entries are dropped if the file cannot be opened.
Logger::LogSink file_sink(const std::string& filename);
}   // namespace sinks

}   // namespace roomassign

#define ROOMASSIGN_LOG(level, category, ...)                                              \
    do                                                                                    \
    {                                                                                     \
        if (::roomassign::Logger::instance().is_enabled(level))                           \
            ::roomassign::Logger::instance().log_formatted(level, category, __VA_ARGS__); \
    } while (0)

#define ROOMASSIGN_LOG_TRACE(category, ...) ROOMASSIGN_LOG(::roomassign::LogLevel::Trace, category, __VA_ARGS__)
#define ROOMASSIGN_LOG_DEBUG(category, ...) ROOMASSIGN_LOG(::roomassign::LogLevel::Debug, category, __VA_ARGS__)
#define ROOMASSIGN_LOG_INFO(category, ...)  ROOMASSIGN_LOG(::roomassign::LogLevel::Info, category, __VA_ARGS__)
#define ROOMASSIGN_LOG_WARN(category, ...)  ROOMASSIGN_LOG(::roomassign::LogLevel::Warning, category, __VA_ARGS__)
#define ROOMASSIGN_LOG_ERROR(category, ...) ROOMASSIGN_LOG(::roomassign::LogLevel::Error, category, __VA_ARGS__)
#define ROOMASSIGN_LOG_CRITICAL(category, ...) \
    ROOMASSIGN_LOG(::roomassign::LogLevel::Critical, category, __VA_ARGS__)
