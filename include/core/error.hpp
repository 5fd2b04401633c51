#pragma once

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace bwproxy {

/**
 * @brief What kind of startup step failed
 *
 * All three are fatal while the sidecar is starting. After startup, failures
 * are logged and the sidecar keeps serving.
 */
enum class ErrorCategory {
    NONE,
    CONFIGURATION_ERROR,   // missing secret, bad port, unreadable config file
    COMMAND_ERROR,         // a bw invocation exited non-zero or printed nothing useful
    TIMEOUT_ERROR          // bw serve never reported an unlocked vault
};

[[nodiscard]] constexpr std::string_view error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::CONFIGURATION_ERROR: return "configuration error";
        case ErrorCategory::COMMAND_ERROR:       return "command error";
        case ErrorCategory::TIMEOUT_ERROR:       return "timeout";
    }
    return "unknown";
}

struct Error {
    ErrorCategory category = ErrorCategory::NONE;
    std::string message;

    /// "command error: bw login failed: ..."
    [[nodiscard]] std::string describe() const {
        return std::format("{}: {}", error_category_name(category), message);
    }
};

/**
 * @brief Value of a startup step, or the Error that stopped it
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.error_ = Error{category, std::move(message)};
        return r;
    }

    bool is_ok() const { return value_.has_value(); }
    bool is_error() const { return !value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const Error& failure() const { return error_; }
    ErrorCategory error_category() const { return error_.category; }
    const std::string& error_message() const { return error_.message; }

private:
    std::optional<T> value_;
    Error error_;
};

template<>
class Result<void> {
public:
    static Result ok() { return Result{}; }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.failed_ = true;
        r.error_ = Error{category, std::move(message)};
        return r;
    }

    bool is_ok() const { return !failed_; }
    bool is_error() const { return failed_; }

    const Error& failure() const { return error_; }
    ErrorCategory error_category() const { return error_.category; }
    const std::string& error_message() const { return error_.message; }

private:
    bool failed_ = false;
    Error error_;
};

} // namespace bwproxy
