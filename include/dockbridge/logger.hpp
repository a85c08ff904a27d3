#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dockbridge
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

// Categories used by the library.  Hosts may log under their own names.
namespace log_category
{
inline constexpr std::string_view TREE      = "dock.tree";
inline constexpr std::string_view SESSION   = "dock.session";
inline constexpr std::string_view POLICY    = "dock.policy";
inline constexpr std::string_view DROP      = "dock.drop";
inline constexpr std::string_view LIFECYCLE = "dock.lifecycle";
inline constexpr std::string_view GEOMETRY  = "dock.geometry";
inline constexpr std::string_view PERSIST   = "dock.persist";
inline constexpr std::string_view PLATFORM  = "dock.platform";
}   // namespace log_category

// Bridge and frame an entry was logged from.
struct LogContext
{
    uint64_t bridge = 0;
    uint64_t frame  = 0;
};

class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level = LogLevel::Info;
        std::string                           category;
        std::string                           message;
        std::optional<LogContext>             context;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    // Overrides the global level for one category (e.g. trace only
    // "dock.session" while chasing a release bug).
    void set_category_level(std::string_view category, LogLevel level);
    void clear_category_levels();

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args);

    bool is_enabled(LogLevel level, std::string_view category = {}) const;

    // Context attached to entries logged on this thread.
    static std::optional<LogContext> current_context();

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // Formats the "{}" placeholders of `format` in order.  Surplus
    // placeholders are left as written.
    template <typename... Args>
    static std::string format_message(std::string_view format, Args&&... args)
    {
        std::string result(format);
        size_t      from = 0;
        auto        next = [&](std::string text)
        {
            auto pos = result.find("{}", from);
            if (pos == std::string::npos)
                return;
            result.replace(pos, 2, text);
            from = pos + text.size();
        };
        (next(arg_to_string(std::forward<Args>(args))), ...);
        return result;
    }

   private:
    friend class ScopedLogContext;

    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

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
        else if constexpr (std::is_enum_v<D>)
            return std::to_string(static_cast<std::underlying_type_t<D>>(v));
        else
            return std::to_string(v);
    }

    LogLevel threshold_for(std::string_view category) const;

    mutable std::mutex                         mutex_;
    LogLevel                                   min_level_ = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> category_levels_;
    std::vector<LogSink>                       sinks_;
};

// Tags every entry logged on this thread with a bridge and frame until it
// goes out of scope.  Scopes nest; the previous context is restored.
class ScopedLogContext
{
   public:
    ScopedLogContext(uint64_t bridge, uint64_t frame);
    ~ScopedLogContext();

    ScopedLogContext(const ScopedLogContext&)            = delete;
    ScopedLogContext& operator=(const ScopedLogContext&) = delete;

   private:
    std::optional<LogContext> previous_;
};

template <typename... Args>
void Logger::log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args)
{
    if (!is_enabled(level, category))
        return;

    try
    {
        log(level, category, format_message(format, std::forward<Args>(args)...));
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

// Appends every entry to a shared buffer.  Used by tests and by hosts that
// surface drag diagnostics in their own UI.
Logger::LogSink memory_sink(std::shared_ptr<std::vector<Logger::LogEntry>> buffer);

// Forwards entries whose category starts with `prefix` ("dock." matches
// every library category).
Logger::LogSink category_sink(std::string prefix, Logger::LogSink sink);
}   // namespace sinks

#define DOCKBRIDGE_LOG(level, category, ...)                                                  \
    do                                                                                        \
    {                                                                                         \
        if (::dockbridge::Logger::instance().is_enabled(level, category))                     \
            ::dockbridge::Logger::instance().log_formatted(level, category, __VA_ARGS__);     \
    } while (0)

#define DOCKBRIDGE_LOG_TRACE(category, ...) DOCKBRIDGE_LOG(::dockbridge::LogLevel::Trace, category, __VA_ARGS__)
#define DOCKBRIDGE_LOG_DEBUG(category, ...) DOCKBRIDGE_LOG(::dockbridge::LogLevel::Debug, category, __VA_ARGS__)
#define DOCKBRIDGE_LOG_INFO(category, ...)  DOCKBRIDGE_LOG(::dockbridge::LogLevel::Info, category, __VA_ARGS__)
#define DOCKBRIDGE_LOG_WARN(category, ...)  DOCKBRIDGE_LOG(::dockbridge::LogLevel::Warning, category, __VA_ARGS__)
#define DOCKBRIDGE_LOG_ERROR(category, ...) DOCKBRIDGE_LOG(::dockbridge::LogLevel::Error, category, __VA_ARGS__)
#define DOCKBRIDGE_LOG_CRITICAL(category, ...)                                                \
    DOCKBRIDGE_LOG(::dockbridge::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace dockbridge
