#include "vault/unlock_status.hpp"

namespace bwproxy {

namespace {

bool reports_unlocked(const JsonValue& node) {
    return node.member("status").string_value() == kUnlockedStatus;
}

} // anonymous namespace

bool is_unlocked(const JsonValue& payload) {
    // data.template.status, then data.status, then top-level status
    return reports_unlocked(payload.at({"data", "template"})) ||
           reports_unlocked(payload.member("data")) ||
           reports_unlocked(payload);
}

bool is_unlocked_body(const std::string& body) {
    try {
        return is_unlocked(JsonValue::parse(body));
    } catch (const JsonValue::parse_error&) {
        return false;
    }
}

} // namespace bwproxy
