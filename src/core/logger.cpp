#include <algorithm>
#include <cadence/logger.hpp>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace cadence
{

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::configure_from_env()
{
    if (const char* env = std::getenv("CADENCE_LOG_LEVEL"))
    {
        LogLevel level;
        if (parse_level(env, level))
            set_level(level);
        else
            std::cerr << "cadence: ignoring unknown CADENCE_LOG_LEVEL '" << env << "'\n";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (sinks_.empty())
        sinks_.push_back(sinks::console_sink());
}

void Logger::add_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks()
{
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    if (!is_enabled(level))
    {
        return;
    }

    LogEntry entry{.timestamp = std::chrono::system_clock::now(),
                   .level     = level,
                   .category  = std::string(category),
                   .message   = std::string(message)};

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_)
    {
        sink(entry);
    }
}

bool Logger::is_enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::Off && level >= min_level_;
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
        case LogLevel::Off:
            return "OFF";
    }
    return "UNKNOWN";
}

bool Logger::parse_level(std::string_view text, LogLevel& out)
{
    std::string lower(text);
    std::transform(lower.begin(),
                   lower.end(),
                   lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace")
        out = LogLevel::Trace;
    else if (lower == "debug")
        out = LogLevel::Debug;
    else if (lower == "info")
        out = LogLevel::Info;
    else if (lower == "warn" || lower == "warning")
        out = LogLevel::Warning;
    else if (lower == "error")
        out = LogLevel::Error;
    else if (lower == "critical")
        out = LogLevel::Critical;
    else if (lower == "off")
        out = LogLevel::Off;
    else
        return false;
    return true;
}

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

namespace sinks
{

static std::string format_line(const Logger::LogEntry& entry)
{
    return Logger::timestamp_to_string(entry.timestamp) + " " + Logger::level_to_string(entry.level)
           + " [" + entry.category + "] " + entry.message;
}

Logger::LogSink console_sink()
{
    return [](const Logger::LogEntry& entry)
    {
        const char* color_code = "";
        const char* reset_code = "\033[0m";

        switch (entry.level)
        {
            case LogLevel::Trace:
                color_code = "\033[37m";
                break;
            case LogLevel::Debug:
                color_code = "\033[36m";
                break;
            case LogLevel::Info:
                color_code = "\033[32m";
                break;
            case LogLevel::Warning:
                color_code = "\033[33m";
                break;
            case LogLevel::Error:
                color_code = "\033[31m";
                break;
            case LogLevel::Critical:
            case LogLevel::Off:
                color_code = "\033[35m";
                break;
        }

        // Warnings and above go to stderr so capture logs on stdout stay clean
        std::ostream& out = entry.level >= LogLevel::Warning ? std::cerr : std::cout;
        out << color_code << format_line(entry) << reset_code << std::endl;
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    return [file](const Logger::LogEntry& entry)
    {
        if (file->is_open())
        {
            *file << format_line(entry) << std::endl;
            file->flush();
        }
    };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&) {};
}

Logger::LogSink MemorySink::sink()
{
    auto   shared   = shared_;
    size_t capacity = capacity_;
    return [shared, capacity](const Logger::LogEntry& entry)
    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        shared->entries.push_back(entry);
        while (shared->entries.size() > capacity)
            shared->entries.pop_front();
    };
}

std::vector<Logger::LogEntry> MemorySink::entries() const
{
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return {shared_->entries.begin(), shared_->entries.end()};
}

size_t MemorySink::count(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return static_cast<size_t>(std::count_if(shared_->entries.begin(),
                                             shared_->entries.end(),
                                             [level](const Logger::LogEntry& e)
                                             { return e.level == level; }));
}

bool MemorySink::contains(std::string_view needle) const
{
    std::lock_guard<std::mutex> lock(shared_->mutex);
    for (const auto& e : shared_->entries)
    {
        if (e.message.find(needle) != std::string::npos)
            return true;
    }
    return false;
}

void MemorySink::clear()
{
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->entries.clear();
}

}   // namespace sinks

}   // namespace cadence
