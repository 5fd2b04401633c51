#pragma once

#include <string>
#include <string_view>

namespace bwproxy::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kHealthPath = "/healthz";
inline const std::string kSyncPath = "/sync";

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kTextContentType = "text/plain; charset=utf-8";

inline constexpr std::string_view kHealthBody = "OK";
inline constexpr std::string_view kSyncSuccessBody = "Sync successful";
inline constexpr std::string_view kMethodNotAllowedBody = "Method not allowed";

} // namespace bwproxy::http
