#include "core/Logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace {

int levelRank(const std::string& level) {
    static const std::map<std::string, int> levels = {
        {"debug", 0}, {"info", 1}, {"warn", 2}, {"error", 3}
    };
    auto it = levels.find(level);
    return it != levels.end() ? it->second : 1;
}

} // namespace

Logger::Logger(const std::string& level, const std::string& file, bool timestamps)
    : level_(level), file_(file), timestamps_(timestamps) {
    if (!file_.empty()) {
        stream_.open(file_, std::ios::app);
        if (!stream_) {
            throw std::runtime_error("Could not open log file: " + file_);
        }
    }
}

bool Logger::shouldLog(const std::string& level) const {
    return levelRank(level) >= levelRank(level_);
}

void Logger::log(const std::string& level, const std::string& msg) {
    if (!shouldLog(level)) {
        return;
    }

    std::ostringstream oss;
    if (timestamps_) {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm_buf{};
        localtime_r(&now, &tm_buf);
        oss << "[" << std::put_time(&tm_buf, "%F %T") << "] ";
    }
    oss << "[" << level << "] " << msg << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_.is_open()) {
        stream_ << oss.str();
        stream_.flush();
    } else {
        std::cout << oss.str() << std::flush;
    }
}
