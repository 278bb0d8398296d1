#include "guard/leak_detector.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "masking/placeholder.hpp"
#include <format>

namespace piiguard {

LeakDetector::LeakDetector(const DetectionEngine& engine, std::string refusal_message)
    : engine_(engine),
      refusal_message_(std::move(refusal_message)) {
    if (refusal_message_.empty()) {
        refusal_message_ = kDefaultRefusal;
    }
}

std::vector<EntityClass> LeakDetector::leaking_classes(
    const std::string& candidate, const std::vector<Span>& spans) {
    const auto tokens = placeholder::find_all(candidate);

    std::vector<EntityClass> leaked;
    for (const auto& span : spans) {
        if (placeholder::is_token(span.text)) continue;
        if (placeholder::is_inside_token(tokens, span.start, span.end)) continue;
        leaked.push_back(span.cls);
    }
    return leaked;
}

LeakDetector::Report LeakDetector::inspect(const std::string& candidate) const {
    Report report;
    if (candidate.empty()) {
        return report;
    }

    try {
        report.leaked_classes = leaking_classes(candidate, engine_.detect_strict(candidate));
    } catch (const DetectionError& e) {
        utils::log::warn(std::format("[{}] Leak check degraded to email/phone scan: {}",
            error_category_to_string(ErrorCategory::LEAK_CHECK_FAILED), e.what()));
        report.fallback_used = true;
        try {
            report.leaked_classes = leaking_classes(candidate, engine_.detect_fallback(candidate));
        } catch (const std::exception& fallback_error) {
            // Nothing could scan the text: release nothing
            utils::log::error(std::format("[{}] Leak fallback scan failed: {}",
                error_category_to_string(ErrorCategory::LEAK_CHECK_FAILED), fallback_error.what()));
            report.leak = true;
        }
    }

    report.leaked_spans = report.leaked_classes.size();
    report.leak = report.leak || report.leaked_spans > 0;
    return report;
}

bool LeakDetector::check_leak(const std::string& candidate) const {
    return inspect(candidate).leak;
}

FilterResult LeakDetector::filter(const std::string& candidate) const {
    FilterResult result;
    if (check_leak(candidate)) {
        result.safe_text = refusal_message_;
        result.leak_detected = true;
        result.note = kLeakNote;
    } else {
        result.safe_text = candidate;
    }
    return result;
}

} // namespace piiguard
