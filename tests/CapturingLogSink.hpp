#pragma once

#include <algorithm>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "drivescore/common/logging.hpp"

namespace drivescore::test {

class CapturingLogSink : public logging::LogSink {
public:
    void log(logging::Level level, std::string_view message) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.emplace_back(level, std::string(message));
    }

    std::size_t count_containing(std::string_view needle) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(), [&](const auto& entry) {
            return entry.second.find(needle) != std::string::npos;
        }));
    }

    std::size_t count_level(logging::Level level) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(
            std::count_if(entries_.begin(), entries_.end(), [&](const auto& entry) { return entry.first == level; }));
    }

private:
    mutable std::mutex                                    mutex_;
    std::vector<std::pair<logging::Level, std::string>> entries_;
};

} // namespace drivescore::test
