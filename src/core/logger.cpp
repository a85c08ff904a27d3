#include <ctime>
#include <dockbridge/logger.hpp>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace dockbridge
{

namespace
{

thread_local std::optional<LogContext> t_context;

const char* color_for(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Trace:
            return "\033[37m";
        case LogLevel::Debug:
            return "\033[36m";
        case LogLevel::Info:
            return "\033[32m";
        case LogLevel::Warning:
            return "\033[33m";
        case LogLevel::Error:
            return "\033[31m";
        case LogLevel::Critical:
            return "\033[35m";
    }
    return "";
}

// "12:00:01.250 WARN [dock.drop] #7/f42 message"
void write_entry(std::ostream& os, const Logger::LogEntry& entry)
{
    os << Logger::timestamp_to_string(entry.timestamp) << ' ' << Logger::level_to_string(entry.level)
       << " [" << entry.category << "] ";
    if (entry.context)
        os << '#' << entry.context->bridge << "/f" << entry.context->frame << ' ';
    os << entry.message;
}

}   // namespace

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

void Logger::set_category_level(std::string_view category, LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_[std::string(category)] = level;
}

void Logger::clear_category_levels()
{
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_.clear();
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

LogLevel Logger::threshold_for(std::string_view category) const
{
    if (!category.empty())
    {
        auto it = category_levels_.find(category);
        if (it != category_levels_.end())
            return it->second;
    }
    return min_level_;
}

bool Logger::is_enabled(LogLevel level, std::string_view category) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= threshold_for(category);
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message)
{
    LogEntry entry{.timestamp = std::chrono::system_clock::now(),
                   .level     = level,
                   .category  = std::string(category),
                   .message   = std::string(message),
                   .context   = t_context};

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_for(category))
        return;
    for (const auto& sink : sinks_)
        sink(entry);
}

std::optional<LogContext> Logger::current_context()
{
    return t_context;
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

std::string Logger::timestamp_to_string(const std::chrono::system_clock::time_point& tp)
{
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms     = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::ostringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

// ─── ScopedLogContext ────────────────────────────────────────────────────────

ScopedLogContext::ScopedLogContext(uint64_t bridge, uint64_t frame) : previous_(t_context)
{
    t_context = LogContext{bridge, frame};
}

ScopedLogContext::~ScopedLogContext()
{
    t_context = previous_;
}

// ─── Sinks ───────────────────────────────────────────────────────────────────

namespace sinks
{

Logger::LogSink console_sink()
{
    return [](const Logger::LogEntry& entry)
    {
        std::cout << color_for(entry.level);
        write_entry(std::cout, entry);
        std::cout << "\033[0m" << std::endl;
    };
}

Logger::LogSink file_sink(const std::string& filename)
{
    auto file = std::make_shared<std::ofstream>(filename, std::ios::app);
    return [file](const Logger::LogEntry& entry)
    {
        if (!file->is_open())
            return;
        write_entry(*file, entry);
        *file << '\n';
        file->flush();
    };
}

Logger::LogSink null_sink()
{
    return [](const Logger::LogEntry&) {};
}

Logger::LogSink memory_sink(std::shared_ptr<std::vector<Logger::LogEntry>> buffer)
{
    return [buffer = std::move(buffer)](const Logger::LogEntry& entry)
    {
        if (buffer)
            buffer->push_back(entry);
    };
}

Logger::LogSink category_sink(std::string prefix, Logger::LogSink sink)
{
    return [prefix = std::move(prefix), sink = std::move(sink)](const Logger::LogEntry& entry)
    {
        if (sink && entry.category.compare(0, prefix.size(), prefix) == 0)
            sink(entry);
    };
}

}   // namespace sinks

}   // namespace dockbridge
