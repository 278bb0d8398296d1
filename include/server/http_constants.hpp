#pragma once

#include <string>
#include <string_view>

namespace piiguard::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline constexpr const char* kJsonContentType = "application/json";

namespace routes {
inline constexpr const char* kHealth = "/health";
inline constexpr const char* kSanitize = "/api/sanitize";
inline constexpr const char* kContext = "/api/context";
inline constexpr const char* kOutputFilter = "/api/output-filter";
inline constexpr const char* kProcess = "/api/process";
} // namespace routes

} // namespace piiguard::http
