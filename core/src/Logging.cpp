#include "folio/core/util/Logging.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <vector>

namespace folio {

// Internal implementation class
class LoggerImpl {
public:
    std::mutex mutex;
    std::vector<std::shared_ptr<std::ofstream>> file_sinks;
    std::vector<MinimalLogger::Sink> callback_sinks;

    std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm;
        #ifdef _WIN32
        localtime_s(&tm, &time_t);
        #else
        localtime_r(&time_t, &tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
};

MinimalLogger::MinimalLogger(std::string name)
    : name_(std::move(name))
    , impl_(std::make_unique<LoggerImpl>())
{
}

MinimalLogger::~MinimalLogger() = default;

const char* MinimalLogger::level_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        default:              return "?????";
    }
}

void MinimalLogger::write_log(LogLevel level, const std::string& msg) {
    if (level < current_level_.load()) return;

    // Sinks run unlocked so they may log or query other components
    std::vector<Sink> sinks;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        sinks = impl_->callback_sinks;
    }
    for (auto& sink : sinks) {
        sink(level, msg);
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    const bool console = console_.load();
    if (!console && impl_->file_sinks.empty()) return;

    std::string formatted = std::format("[{}] [{}] [{}] {}",
                                        impl_->get_timestamp(), level_string(level), name_, msg);

    if (console) {
        std::cout << formatted << std::endl;
    }

    for (auto& file : impl_->file_sinks) {
        if (file && file->is_open()) {
            (*file) << formatted << std::endl;
            file->flush();
        }
    }
}

void MinimalLogger::add_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto file = std::make_shared<std::ofstream>(path, std::ios::app);
    if (file->is_open()) {
        impl_->file_sinks.push_back(file);
    }
}

void MinimalLogger::add_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->callback_sinks.push_back(std::move(sink));
}

// Global functions
auto Logger() -> std::shared_ptr<MinimalLogger> {
    static auto logger = std::make_shared<MinimalLogger>();
    return logger;
}

std::shared_ptr<MinimalLogger> LoggerOr(std::shared_ptr<MinimalLogger> log) {
    return log ? std::move(log) : Logger();
}

void AddLogFile(const std::filesystem::path& path) {
    Logger()->add_file(path);
}

LogLevel ParseLogLevel(const std::string& s) {
    if (s == "debug" || s == "DEBUG") {
        return LogLevel::Debug;
    } else if (s == "warn" || s == "WARN" || s == "warning" || s == "WARNING") {
        return LogLevel::Warn;
    } else if (s == "error" || s == "ERROR") {
        return LogLevel::Error;
    } else if (s == "off" || s == "OFF") {
        return LogLevel::Off;
    }
    return LogLevel::Info;
}

void SetLogLevel(const std::string& s) {
    Logger()->set_level(ParseLogLevel(s));
}

} // namespace folio
