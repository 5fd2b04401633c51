#pragma once

#include "core/json.hpp"

#include <string>
#include <string_view>

namespace bwproxy {

inline constexpr std::string_view kUnlockedStatus = "unlocked";

/**
 * @brief Unlock predicate over a bw serve /status payload
 *
 * True when any of these is the string "unlocked":
 *   data.template.status, data.status, status
 * Every other shape (missing keys, non-object intermediate nodes, non-string
 * status values) is "not unlocked". Never throws.
 */
[[nodiscard]] bool is_unlocked(const JsonValue& payload);

/**
 * @brief Parse a raw body and apply is_unlocked(). Invalid JSON is "not unlocked".
 */
[[nodiscard]] bool is_unlocked_body(const std::string& body);

} // namespace bwproxy
