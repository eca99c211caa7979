#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace qode {
namespace logging {

const char *channel_name(Channel channel) {
    switch (channel) {
        case Channel::CLIENT:
            return "qode-client";
        case Channel::SERVER:
            return "qode-server";
        default:
            return "qode";
    }
}

void StderrSink::set_level(Level level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

Level StderrSink::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

void StderrSink::write(Channel channel, Level level, const char * /*file*/, int /*line*/,
                       const std::string &message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_ || level == Level::LVL_NONE) {
        return;
    }

    // Timestamp
    std::cerr << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    std::cerr << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    // Level
    switch (level) {
        case Level::LVL_DEBUG: std::cerr << " [DEBUG] "; break;
        case Level::LVL_INFO:  std::cerr << " [INFO]  "; break;
        case Level::LVL_WARN:  std::cerr << " [WARN]  "; break;
        case Level::LVL_ERROR: std::cerr << " [ERROR] "; break;
        default: break;
    }

    std::cerr << "[" << channel_name(channel) << "] " << message << "\n";

    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
    }
}

void Logger::log(Level level, const char *file, int line, const std::string &message) const {
    if (!sink_) {
        return;
    }
    sink_->write(channel_, level, file, line, message);
}

Level string_to_level(const std::string &level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE") return Level::LVL_NONE;

    return Level::LVL_INFO;  // Default
}

}  // namespace logging
}  // namespace qode
