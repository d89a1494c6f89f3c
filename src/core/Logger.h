#pragma once
#include <fstream>
#include <mutex>
#include <string>

// Level-filtered line logger: "[YYYY-MM-DD HH:MM:SS] [level] message".
// Levels: debug, info, warn, error. Unknown levels are treated as info.
class Logger {
public:
    Logger(const std::string& level = "info", const std::string& file = "", bool timestamps = true);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(const std::string& level, const std::string& msg);
    bool shouldLog(const std::string& level) const;

    void debug(const std::string& msg) { log("debug", msg); }
    void info(const std::string& msg) { log("info", msg); }
    void warn(const std::string& msg) { log("warn", msg); }
    void error(const std::string& msg) { log("error", msg); }

    const std::string& level() const { return level_; }

private:
    std::string level_;
    std::string file_;
    bool timestamps_;
    std::ofstream stream_;
    std::mutex mutex_;
};
