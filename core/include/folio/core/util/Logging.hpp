#pragma once

#include <atomic>
#include <filesystem>
#include <format>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace folio {

enum class LogLevel { Debug, Info, Warn, Error, Off };

class LoggerImpl;

// Minimal logger with console and file sinks.
// Components receive one of these at construction; Logger() is the
// process-wide fallback.
class MinimalLogger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    explicit MinimalLogger(std::string name = "folio");
    ~MinimalLogger();

    MinimalLogger(const MinimalLogger&) = delete;
    MinimalLogger& operator=(const MinimalLogger&) = delete;

    template<typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        if (LogLevel::Debug < current_level_.load()) return;
        write_log(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        if (LogLevel::Info < current_level_.load()) return;
        write_log(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        if (LogLevel::Warn < current_level_.load()) return;
        write_log(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        if (LogLevel::Error < current_level_.load()) return;
        write_log(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    void set_level(LogLevel level) { current_level_ = level; }
    LogLevel level() const { return current_level_.load(); }

    // Console output is on by default
    void set_console(bool enabled) { console_ = enabled; }

    void add_file(const std::filesystem::path& path);

    // Receives every message that passes the level filter, unformatted.
    // Called without the logger's lock held, possibly from several threads.
    void add_sink(Sink sink);

    const std::string& name() const { return name_; }

    static const char* level_string(LogLevel level);

private:
    void write_log(LogLevel level, const std::string& msg);

    std::string name_;
    std::atomic<LogLevel> current_level_{LogLevel::Info};
    std::atomic<bool> console_{true};
    std::unique_ptr<LoggerImpl> impl_;
};

// Returns `log` if set, otherwise the process-wide logger
std::shared_ptr<MinimalLogger> LoggerOr(std::shared_ptr<MinimalLogger> log);

void AddLogFile(const std::filesystem::path& path);
void SetLogLevel(const std::string& s);
LogLevel ParseLogLevel(const std::string& s);
auto Logger() -> std::shared_ptr<MinimalLogger>;

} // namespace folio
