#include "masking/placeholder.hpp"
#include "core/utils.hpp"
#include <algorithm>

namespace piiguard::placeholder {

namespace {

bool is_prefix_char(char c) {
    return (c >= 'A' && c <= 'Z') || c == '_';
}

} // anonymous namespace

size_t token_length_at(std::string_view text, size_t pos) {
    if (text.substr(pos, kOpen.size()) != kOpen) return 0;

    size_t i = pos + kOpen.size();
    const size_t prefix_start = i;
    while (i < text.size() && is_prefix_char(text[i])) ++i;
    if (i == prefix_start) return 0;

    // The run includes the '_' separator and needs a prefix char before it
    const size_t prefix_end = i;
    if (text[prefix_end - 1] != '_' || prefix_end - 1 == prefix_start) return 0;

    const size_t digits_start = i;
    while (i < text.size() && utils::is_ascii_digit(text[i])) ++i;
    if (i == digits_start) return 0;

    if (text.substr(i, kClose.size()) != kClose) return 0;
    return i + kClose.size() - pos;
}

bool is_token(std::string_view text) {
    return !text.empty() && token_length_at(text, 0) == text.size();
}

std::vector<std::pair<size_t, size_t>> find_all(std::string_view text) {
    std::vector<std::pair<size_t, size_t>> tokens;
    size_t pos = text.find(kOpen);
    while (pos != std::string_view::npos) {
        const size_t len = token_length_at(text, pos);
        if (len > 0) {
            tokens.emplace_back(pos, pos + len);
            pos = text.find(kOpen, pos + len);
        } else {
            pos = text.find(kOpen, pos + 1);
        }
    }
    return tokens;
}

bool contains_any(std::string_view text) {
    return !find_all(text).empty();
}

bool is_inside_token(const std::vector<std::pair<size_t, size_t>>& tokens,
                     size_t start, size_t end) {
    return std::any_of(tokens.begin(), tokens.end(), [start, end](const auto& t) {
        return start >= t.first && end <= t.second;
    });
}

} // namespace piiguard::placeholder
