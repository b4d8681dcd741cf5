#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace cadence
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

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

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    // Reads CADENCE_LOG_LEVEL (trace|debug|info|warn|error|critical|off).
    // Installs a console sink when no sink is registered yet.
    void configure_from_env();

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

    static std::string level_to_string(LogLevel level);
    static bool        parse_level(std::string_view text, LogLevel& out);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else
            return std::to_string(v);
    }

    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        if constexpr (sizeof...(args) > 0)
        {
            size_t cursor       = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", cursor);
                if (pos == std::string::npos)
                    return;
                std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                result.replace(pos, 2, text);
                cursor = pos + text.size();
            };
            (replace_next(std::forward<decltype(args)>(args)), ...);
        }
        return result;
    }
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
    {
        return;
    }

    try
    {
        std::string formatted = format_message(format, std::forward<Args>(args)...);
        log(level, category, formatted);
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("Format error: ") + e.what());
    }
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();

// Keeps the most recent `capacity` entries; used by tests and the preview host overlay.
class MemorySink
{
   public:
    explicit MemorySink(size_t capacity = 256) : capacity_(capacity) {}

    Logger::LogSink sink();

    std::vector<Logger::LogEntry> entries() const;
    size_t                        count(LogLevel level) const;
    bool                          contains(std::string_view needle) const;
    void                          clear();

   private:
    struct Shared
    {
        std::mutex                   mutex;
        std::deque<Logger::LogEntry> entries;
    };

    size_t                  capacity_;
    std::shared_ptr<Shared> shared_ = std::make_shared<Shared>();
};
}   // namespace sinks

#define CADENCE_LOG_AT(level, category, ...)                                            \
    do                                                                                  \
    {                                                                                   \
        if (::cadence::Logger::instance().is_enabled(level))                            \
        {                                                                               \
            ::cadence::Logger::instance().log_formatted(level, category, __VA_ARGS__);  \
        }                                                                               \
    } while (0)

#define CADENCE_LOG_TRACE(category, ...) \
    CADENCE_LOG_AT(::cadence::LogLevel::Trace, category, __VA_ARGS__)
#define CADENCE_LOG_DEBUG(category, ...) \
    CADENCE_LOG_AT(::cadence::LogLevel::Debug, category, __VA_ARGS__)
#define CADENCE_LOG_INFO(category, ...) \
    CADENCE_LOG_AT(::cadence::LogLevel::Info, category, __VA_ARGS__)
#define CADENCE_LOG_WARN(category, ...) \
    CADENCE_LOG_AT(::cadence::LogLevel::Warning, category, __VA_ARGS__)
#define CADENCE_LOG_ERROR(category, ...) \
    CADENCE_LOG_AT(::cadence::LogLevel::Error, category, __VA_ARGS__)
#define CADENCE_LOG_CRITICAL(category, ...) \
    CADENCE_LOG_AT(::cadence::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace cadence
