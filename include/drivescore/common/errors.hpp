#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace drivescore::errors {

inline std::string append_context(std::string message, std::string_view context)
{
    if (!context.empty()) {
        message = std::string(context) + ": " + message;
    }
    return message;
}

inline std::string with_location(std::string message, const char* file, int line)
{
    return append_context(std::move(message), std::string("at ") + file + ":" + std::to_string(line));
}

class DriveScoreError : public std::runtime_error {
public:
    explicit DriveScoreError(std::string message, std::string context = {})
        : std::runtime_error(append_context(std::move(message), context))
        , context_(std::move(context))
    {
    }

    const std::string& context() const noexcept { return context_; }

private:
    std::string context_{};
};

/// Invalid configuration. `key` is the dotted config path at fault
/// (e.g. `rpm.redline`) when one is known.
class ConfigError : public DriveScoreError {
public:
    explicit ConfigError(std::string message, std::string key = {})
        : DriveScoreError(std::move(message), key)
        , key_(std::move(key))
    {
    }

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_{};
};

/// Rejected caller input: a malformed sample or an invalid argument.
class InputError : public DriveScoreError {
public:
    explicit InputError(std::string message, std::string vehicle_id = {})
        : DriveScoreError(std::move(message), vehicle_id.empty() ? std::string{} : "vehicle=" + vehicle_id)
        , vehicle_id_(std::move(vehicle_id))
    {
    }

    const std::string& vehicle_id() const noexcept { return vehicle_id_; }

private:
    std::string vehicle_id_{};
};

} // namespace drivescore::errors

#define DRIVESCORE_LOC(msg) ::drivescore::errors::with_location((msg), __FILE__, __LINE__)
