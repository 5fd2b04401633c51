#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace bwproxy::duration {

/**
 * @brief Parse a duration string such as "300ms", "1.5s", "2m" or "1h30m"
 *
 * Grammar: optional sign, then one or more decimal numbers (with optional
 * fraction), each followed by a unit: ns, us (or µs), ms, s, m, h.
 * The bare string "0" is accepted. Returns std::nullopt on malformed input
 * or overflow.
 */
[[nodiscard]] std::optional<std::chrono::nanoseconds> parse(std::string_view text);

/**
 * @brief Render a duration the way it is written in configuration ("2m0s", "1.5s", "10ms")
 */
[[nodiscard]] std::string format(std::chrono::nanoseconds d);

} // namespace bwproxy::duration
