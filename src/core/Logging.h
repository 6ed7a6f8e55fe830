#pragma once
#include <string>
#include <mutex>
#include <atomic>

namespace infer_scan {

enum class LogLevel { Error=0, Warn=1, Info=2, Debug=3, Trace=4 };

// Process-wide logger. Lines go to stderr so report JSON on stdout stays clean.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel lvl) { level_.store(lvl); }
    LogLevel level() const { return level_.load(); }

    void log(LogLevel lvl, const std::string& msg);
    void error(const std::string& msg){ log(LogLevel::Error, msg); }
    void warn(const std::string& msg){ log(LogLevel::Warn, msg); }
    void info(const std::string& msg){ log(LogLevel::Info, msg); }
    void debug(const std::string& msg){ log(LogLevel::Debug, msg); }
    void trace(const std::string& msg){ log(LogLevel::Trace, msg); }

    bool enabled(LogLevel lvl) const { return static_cast<int>(lvl) <= static_cast<int>(level()); }

private:
    Logger() = default;
    static const char* prefix(LogLevel lvl);

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

}
