#include "masking/placeholder_assigner.hpp"
#include "masking/placeholder.hpp"

#include <array>
#include <stdexcept>

namespace piiguard {

Assignment PlaceholderAssigner::assign(const std::string& text,
                                       const std::vector<Span>& spans) {
    Assignment out;
    out.redacted_text.reserve(text.size());

    std::array<size_t, kEntityClassCount> counters{};
    size_t cursor = 0;

    for (const auto& span : spans) {
        if (span.start < cursor || span.end <= span.start || span.end > text.size()) {
            throw std::invalid_argument("spans must be sorted, disjoint and within the text");
        }

        const auto n = ++counters[static_cast<size_t>(span.cls)];
        auto token = placeholder::make(span.cls, n);
        auto original = text.substr(span.start, span.end - span.start);

        out.redacted_text.append(text, cursor, span.start - cursor);
        out.redacted_text.append(token);
        cursor = span.end;

        bool seen = false;
        for (const auto& e : out.entities) {
            if (e.cls == span.cls && e.text == original) {
                seen = true;
                break;
            }
        }
        if (!seen) {
            out.entities.push_back({original, span.cls});
            out.summary.push_back({span.cls, token, kSummaryConfidence, original});
        }

        out.map.insert(std::move(token), std::move(original));
    }
    out.redacted_text.append(text, cursor, std::string::npos);

    return out;
}

} // namespace piiguard
