#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace piiguard {

/**
 * @brief Placeholder token syntax: [[PREFIX_n]]
 *
 * PREFIX is one or more of [A-Z_], n one or more digits. Text that already
 * has this shape is indistinguishable from a minted token; no escaping is
 * applied.
 */
namespace placeholder {

inline constexpr std::string_view kOpen = "[[";
inline constexpr std::string_view kClose = "]]";

[[nodiscard]] inline std::string make(EntityClass cls, size_t n) {
    std::string token;
    token.reserve(24);
    token.append(kOpen);
    token.append(display_prefix(cls));
    token.push_back('_');
    token.append(std::to_string(n));
    token.append(kClose);
    return token;
}

/**
 * @brief Length of the token starting at pos, 0 when none starts there
 */
[[nodiscard]] size_t token_length_at(std::string_view text, size_t pos);

/**
 * @brief Whole-string check: text is exactly one well-formed token
 */
[[nodiscard]] bool is_token(std::string_view text);

/**
 * @brief Byte ranges [start, end) of every token in text, in order
 */
[[nodiscard]] std::vector<std::pair<size_t, size_t>> find_all(std::string_view text);

[[nodiscard]] bool contains_any(std::string_view text);

/**
 * @brief True when [start, end) lies inside one token occurrence
 */
[[nodiscard]] bool is_inside_token(
    const std::vector<std::pair<size_t, size_t>>& tokens, size_t start, size_t end);

} // namespace placeholder

} // namespace piiguard
