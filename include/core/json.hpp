#pragma once

#include <glaze/glaze.hpp>

#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace bwproxy {

/**
 * @brief Immutable node of a parsed JSON document (glz::json_t)
 *
 * Meant for payloads the sidecar does not control. Lookups never throw:
 * a missing key, or a step through anything that is not an object, yields
 * a null node, and string_value() is empty unless the node is a string.
 */
class JsonValue {
public:
    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    explicit JsonValue(glz::json_t node) : node_(std::move(node)) {}

    /// @throws parse_error on malformed input
    [[nodiscard]] static JsonValue parse(const std::string& text) {
        glz::json_t doc;
        if (const auto ec = glz::read_json(doc, text)) {
            throw parse_error(glz::format_error(ec, text));
        }
        return JsonValue(std::move(doc));
    }

    [[nodiscard]] bool is_null() const { return node_.is_null(); }
    [[nodiscard]] bool is_object() const { return node_.is_object(); }
    [[nodiscard]] bool is_string() const { return node_.is_string(); }

    [[nodiscard]] JsonValue member(std::string_view key) const {
        if (!node_.is_object()) return {};
        const auto& members = node_.get_object();
        const auto it = members.find(std::string(key));
        return it == members.end() ? JsonValue{} : JsonValue(it->second);
    }

    /// member(a).member(b)... ; null as soon as one step is missing
    [[nodiscard]] JsonValue at(std::initializer_list<std::string_view> path) const {
        JsonValue node = *this;
        for (const auto key : path) {
            node = node.member(key);
            if (node.is_null()) break;
        }
        return node;
    }

    [[nodiscard]] std::optional<std::string> string_value() const {
        if (!node_.is_string()) return std::nullopt;
        return node_.get<std::string>();
    }

private:
    glz::json_t node_{};
};

} // namespace bwproxy
