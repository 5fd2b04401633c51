#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace bwproxy::utils {

// ============================================================================
// Parsing
// ============================================================================

// Whole input must be a decimal integer; no sign games, no trailing text.
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

[[nodiscard]] constexpr bool is_valid_port(int64_t value) {
    return value >= 1 && value <= 65535;
}

// ============================================================================
// Strings
// ============================================================================

[[nodiscard]] inline std::string trim(std::string_view str) {
    const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!str.empty() && is_space(str.front())) str.remove_prefix(1);
    while (!str.empty() && is_space(str.back())) str.remove_suffix(1);
    return std::string(str);
}

/// ASCII case-insensitive equality (HTTP header names).
[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) ==
               std::tolower(static_cast<unsigned char>(y));
    });
}

// ============================================================================
// Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] std::chrono::milliseconds elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (stderr, one line per call, safe across threads)
// ============================================================================

namespace log {

namespace detail {
    inline std::mutex& sink_mutex() {
        static std::mutex m;
        return m;
    }

    // 2024-05-01T12:00:00.123
    inline std::string timestamp() {
        const auto now = std::chrono::system_clock::now();
        const auto secs = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::tm local{};
        ::localtime_r(&secs, &local);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
        return std::format("{}.{:03}", buf, millis);
    }

    inline void emit(std::string_view tag, std::string_view msg) {
        const auto line = std::format("{} {} {}\n", timestamp(), tag, msg);
        std::lock_guard lock(sink_mutex());
        std::cerr << line;
    }

    // "FATAL: " leads the line so `grep '^FATAL:'` finds it; timestamp trails.
    inline std::string fatal_line(std::string_view msg) {
        return std::format("FATAL: {} [{}]\n", msg, timestamp());
    }
} // namespace detail

inline void info(std::string_view msg)  { detail::emit("[INFO ]", msg); }
inline void warn(std::string_view msg)  { detail::emit("[WARN ]", msg); }
inline void error(std::string_view msg) { detail::emit("[ERROR]", msg); }

// Startup failure
inline void fatal(std::string_view msg) {
    const auto line = detail::fatal_line(msg);
    std::lock_guard lock(detail::sink_mutex());
    std::cerr << line << std::flush;
}

} // namespace log

} // namespace bwproxy::utils
