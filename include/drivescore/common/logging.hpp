#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <string_view>

#include "drivescore/common/time.hpp"

namespace drivescore::logging {

enum class Level {
    Debug,
    Info,
    Warning,
    Error,
};

constexpr const char* level_to_string(Level level)
{
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warning: return "warn";
        case Level::Error: return "error";
    }
    return "unknown";
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(Level level, std::string_view message) = 0;
};

/// Forwards to `sink` when one is installed; a null sink drops the message.
inline void log(LogSink* sink, Level level, std::string_view message)
{
    if (sink) {
        sink->log(level, message);
    }
}

/// Writes `<utc time> [level] message` lines, dropping anything below
/// `min_level`. Safe to share between threads.
class OstreamLogSink : public LogSink {
public:
    explicit OstreamLogSink(std::ostream& os, Level min_level = Level::Info)
        : os_(os)
        , min_level_(min_level)
    {
    }

    void log(Level level, std::string_view message) override
    {
        if (level < min_level_) {
            return;
        }
        const auto stamp = time::to_iso8601(time::Clock::now());

        std::lock_guard<std::mutex> lock(mutex_);
        os_ << stamp << " [" << level_to_string(level) << "] " << message << '\n';
        os_.flush();
    }

    [[nodiscard]] Level min_level() const noexcept { return min_level_; }

private:
    std::ostream& os_;
    Level         min_level_;
    std::mutex    mutex_;
};

using LogSinkPtr = std::shared_ptr<LogSink>;

inline LogSinkPtr make_console_log_sink(Level min_level = Level::Info)
{
    return std::make_shared<OstreamLogSink>(std::clog, min_level);
}

} // namespace drivescore::logging
