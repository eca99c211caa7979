#pragma once

#include <memory>
#include <mutex>
#include <sstream>
#include <string>

namespace qode {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

// Client diagnostics and worker process output are kept apart so the
// embedding application can route them to different places.
enum class Channel {
    CLIENT,
    SERVER
};

const char *channel_name(Channel channel);

// Destination for log records. Supplied by the embedding application.
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(Channel channel, Level level, const char *file, int line, const std::string &message) = 0;
};

// Writes timestamped records to stderr, dropping those below the threshold.
class StderrSink : public LogSink {
public:
    explicit StderrSink(Level threshold = Level::LVL_INFO) : threshold_(threshold) {}

    void set_level(Level level);
    Level level() const;

    void write(Channel channel, Level level, const char *file, int line, const std::string &message) override;

private:
    Level threshold_;
    mutable std::mutex mutex_;
};

// A sink bound to one channel. Cheap to copy; a Logger without a sink
// discards everything.
class Logger {
public:
    Logger() = default;
    Logger(std::shared_ptr<LogSink> sink, Channel channel) : sink_(std::move(sink)), channel_(channel) {}

    void log(Level level, const char *file, int line, const std::string &message) const;

    Channel channel() const { return channel_; }
    bool has_sink() const { return sink_ != nullptr; }
    const std::shared_ptr<LogSink> &sink() const { return sink_; }

private:
    std::shared_ptr<LogSink> sink_;
    Channel channel_ = Channel::CLIENT;
};

// Helper to convert Level to string for config parsing
Level string_to_level(const std::string &level_str);

}  // namespace logging
}  // namespace qode

// Macro macros to handle string building
#define LOG_INTERNAL(logger, level, msg)                                  \
    do {                                                                  \
        std::stringstream ss;                                             \
        ss << msg;                                                        \
        (logger).log(level, __FILE__, __LINE__, ss.str());                \
    } while (0)

#define LOG_DEBUG(logger, msg) LOG_INTERNAL(logger, qode::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(logger, msg) LOG_INTERNAL(logger, qode::logging::Level::LVL_INFO, msg)
#define LOG_WARN(logger, msg) LOG_INTERNAL(logger, qode::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(logger, msg) LOG_INTERNAL(logger, qode::logging::Level::LVL_ERROR, msg)
