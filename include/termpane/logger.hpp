#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace termpane
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

    // Per-category minimum, overriding the global level for that category
    // only, e.g. set_category_level("drag", LogLevel::Warning).
    void set_category_level(std::string_view category, LogLevel level);
    void clear_category_levels();

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;
    bool is_enabled(LogLevel level, std::string_view category) const;

    static std::string             level_to_string(LogLevel level);
    static std::optional<LogLevel> level_from_string(std::string_view name);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;

    std::map<std::string, LogLevel, std::less<>> category_levels_;

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
            size_t search_from  = 0;
            auto   replace_next = [&](auto&& arg)
            {
                auto pos = result.find("{}", search_from);
                if (pos == std::string::npos)
                    return;
                std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                result.replace(pos, 2, text);
                search_from = pos + text.size();
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
    if (!is_enabled(level, category))
    {
        return;
    }

    try
    {
        log(level, category, format_message(format, std::forward<Args>(args)...));
    }
    catch (const std::exception& e)
    {
        log(LogLevel::Error, "logger", std::string("format error: ") + e.what());
    }
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

#define TERMPANE_LOG_AT(lvl, category, ...)                                               \
    do                                                                                    \
    {                                                                                     \
        if (::termpane::Logger::instance().is_enabled(lvl, category))                     \
        {                                                                                 \
            ::termpane::Logger::instance().log_formatted(lvl, category, __VA_ARGS__);     \
        }                                                                                 \
    } while (0)

#define TERMPANE_LOG_TRACE(category, ...) \
    TERMPANE_LOG_AT(::termpane::LogLevel::Trace, category, __VA_ARGS__)
#define TERMPANE_LOG_DEBUG(category, ...) \
    TERMPANE_LOG_AT(::termpane::LogLevel::Debug, category, __VA_ARGS__)
#define TERMPANE_LOG_INFO(category, ...) \
    TERMPANE_LOG_AT(::termpane::LogLevel::Info, category, __VA_ARGS__)
#define TERMPANE_LOG_WARN(category, ...) \
    TERMPANE_LOG_AT(::termpane::LogLevel::Warning, category, __VA_ARGS__)
#define TERMPANE_LOG_ERROR(category, ...) \
    TERMPANE_LOG_AT(::termpane::LogLevel::Error, category, __VA_ARGS__)
#define TERMPANE_LOG_CRITICAL(category, ...) \
    TERMPANE_LOG_AT(::termpane::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace termpane
