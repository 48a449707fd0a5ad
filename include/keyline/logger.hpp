#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace keyline
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

// Process-wide logger. The engine itself only emits Trace/Debug on state
// transitions and Warning on degraded inputs; it never logs per frame.
// With no sinks installed (the default) every call is a cheap level check.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
        std::string                           file;
        int                                   line;
        std::string                           function;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void   add_sink(LogSink sink);
    void   clear_sinks();
    size_t sink_count() const;

    // Drop all sinks and restore the default Info level.
    void reset();

    void log(LogLevel         level,
             std::string_view category,
             std::string_view message,
             std::string_view file     = "",
             int              line     = 0,
             std::string_view function = "");

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    // False when the level is filtered out or nobody is listening.
    bool is_enabled(LogLevel level) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // Replaces each "{}" in order with the stringified argument.
    template <typename... Args>
    static std::string format_message(std::string_view format, Args&&... args)
    {
        std::string result(format);
        size_t      cursor = 0;
        auto        replace_next = [&](auto&& arg)
        {
            auto pos = result.find("{}", cursor);
            if (pos == std::string::npos)
                return;
            std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
            result.replace(pos, 2, text);
            cursor = pos + text.size();
        };
        (replace_next(std::forward<Args>(args)), ...);
        return result;
    }

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
        else if constexpr (std::is_floating_point_v<D>)
        {
            // Frames and values read better as "150" / "0.25" than "150.000000".
            std::ostringstream os;
            os << v;
            return os.str();
        }
        else if constexpr (std::is_enum_v<D>)
            return std::to_string(static_cast<std::underlying_type_t<D>>(v));
        else
            return std::to_string(v);
    }
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
        return;

    log(level, category, format_message(format, std::forward<Args>(args)...));
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();

// Appends every entry to a shared buffer. Used by tests and by hosts that
// surface engine diagnostics in their own UI.
Logger::LogSink memory_sink(std::shared_ptr<std::vector<Logger::LogEntry>> buffer);
}   // namespace sinks

#define KEYLINE_LOG_AT(level, category, ...)                                                \
    do                                                                                      \
    {                                                                                       \
        if (::keyline::Logger::instance().is_enabled(level))                                \
        {                                                                                   \
            ::keyline::Logger::instance().log_formatted(level, category, __VA_ARGS__);      \
        }                                                                                   \
    } while (0)

#define KEYLINE_LOG_TRACE(category, ...) \
    KEYLINE_LOG_AT(::keyline::LogLevel::Trace, category, __VA_ARGS__)
#define KEYLINE_LOG_DEBUG(category, ...) \
    KEYLINE_LOG_AT(::keyline::LogLevel::Debug, category, __VA_ARGS__)
#define KEYLINE_LOG_INFO(category, ...) \
    KEYLINE_LOG_AT(::keyline::LogLevel::Info, category, __VA_ARGS__)
#define KEYLINE_LOG_WARN(category, ...) \
    KEYLINE_LOG_AT(::keyline::LogLevel::Warning, category, __VA_ARGS__)
#define KEYLINE_LOG_ERROR(category, ...) \
    KEYLINE_LOG_AT(::keyline::LogLevel::Error, category, __VA_ARGS__)
#define KEYLINE_LOG_CRITICAL(category, ...) \
    KEYLINE_LOG_AT(::keyline::LogLevel::Critical, category, __VA_ARGS__)

#define KEYLINE_LOG_WARN_HERE(category, ...) \
    KEYLINE_LOG_WARN(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

#define KEYLINE_LOG_ERROR_HERE(category, ...) \
    KEYLINE_LOG_ERROR(category, __VA_ARGS__ " [{}:{}:{}]", __FILE__, __LINE__, __FUNCTION__)

}   // namespace keyline
