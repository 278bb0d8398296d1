#include "core/pipeline.hpp"
#include "classifier/risk_scorer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "masking/placeholder_assigner.hpp"

#include <format>
#include <stdexcept>

namespace piiguard {

namespace {

const DetectionEngine& require_engine(const PipelineComponents& c) {
    if (!c.detection) {
        throw std::invalid_argument("PrivacyPipeline requires a detection engine");
    }
    return *c.detection;
}

} // anonymous namespace

PrivacyPipeline::PrivacyPipeline(PipelineComponents components, PipelineOptions options)
    : c_(std::move(components)),
      options_(std::move(options)),
      leak_detector_(require_engine(c_), options_.refusal_message) {}

// ============================================================================
// Sanitize
// ============================================================================

SanitizeResult PrivacyPipeline::sanitize(const std::string& text) const {
    sanitize_calls_.fetch_add(1, std::memory_order_relaxed);
    utils::Timer timer;

    std::vector<Span> spans;
    bool degraded = false;
    try {
        auto detection = c_.detection->detect(text);
        spans = std::move(detection.spans);
        degraded = detection.degraded;
    } catch (const std::exception& e) {
        // Reduced scan; if this one throws too nothing is released
        utils::log::warn(std::format("[{}] full detection failed ({}), using email/phone scan",
                                     error_category_to_string(ErrorCategory::DETECTION_DEGRADED),
                                     e.what()));
        spans = c_.detection->detect_fallback(text);
        degraded = true;
    }

    auto assignment = PlaceholderAssigner::assign(text, spans);
    auto classification = classifier_.classify(text);

    SanitizeResult result;
    try {
        result.risk_score = RiskScorer::score(assignment.entities,
                                              classification.context.category);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("[{}] {}",
            error_category_to_string(ErrorCategory::RISK_COMPUTATION_FAILED), e.what()));
        result.risk_score = RiskScorer::fallback(assignment.entities.size());
    }

    result.redacted_text = std::move(assignment.redacted_text);
    result.entities = std::move(assignment.entities);
    result.summary = std::move(assignment.summary);
    result.map = std::move(assignment.map);
    result.context = std::move(classification.context);
    result.categories = std::move(classification.categories);
    result.degraded = degraded;
    if (degraded) {
        degraded_detections_.fetch_add(1, std::memory_order_relaxed);
    }

    utils::log::info(std::format(
        "sanitize: input_len={} entities={} category={} risk={} degraded={} ({}us)",
        text.size(), result.entities.size(), result.context.category, result.risk_score,
        utils::booltostr(degraded), timer.elapsed_us().count()));

    return result;
}

// ============================================================================
// Output Filter
// ============================================================================

FilterResult PrivacyPipeline::check_and_filter(const std::string& candidate,
                                               const Context& context_hint) const {
    filter_calls_.fetch_add(1, std::memory_order_relaxed);

    if (candidate.empty()) {
        return {};
    }

    std::string rewritten;
    if (c_.rewriter) {
        try {
            rewritten = c_.rewriter->rewrite(candidate, context_hint);
        } catch (const std::exception&) {
            // Rewriter messages may quote the text; log the stage only
            utils::log::warn(std::format("safety rewrite '{}' failed, checking the candidate as-is",
                                         c_.rewriter->name()));
            rewritten.clear();
        }
    }
    if (rewritten.empty()) {
        rewritten = candidate;
    }

    auto result = leak_detector_.filter(rewritten);
    if (result.leak_detected) {
        leaks_blocked_.fetch_add(1, std::memory_order_relaxed);
    }

    utils::log::info(std::format("output-filter: candidate_len={} leak_detected={}",
                                 candidate.size(), utils::booltostr(result.leak_detected)));
    return result;
}

// ============================================================================
// Final Risk
// ============================================================================

int PrivacyPipeline::final_risk(const std::string& text) const {
    if (text.empty()) {
        return 0;
    }
    try {
        const auto detection = c_.detection->detect(text);
        std::vector<EntityClass> classes;
        classes.reserve(detection.spans.size());
        for (const auto& span : detection.spans) {
            classes.push_back(span.cls);
        }
        return RiskScorer::score(classes, classifier_.classify(text).context.category);
    } catch (const std::exception& e) {
        utils::log::warn(std::format("[{}] final risk defaulted to 0: {}",
            error_category_to_string(ErrorCategory::RISK_COMPUTATION_FAILED), e.what()));
        return 0;
    }
}

// ============================================================================
// Full Cycle
// ============================================================================

ProcessResult PrivacyPipeline::process(const std::string& text) const {
    process_calls_.fetch_add(1, std::memory_order_relaxed);

    auto sanitized = sanitize(text);

    ProcessResult result;
    if (c_.answer_generator) {
        result.answer = c_.answer_generator->generate(sanitized.redacted_text, sanitized.context);
    } else {
        result.answer = {sanitized.redacted_text, 0.0, "llm_unavailable_fallback", true, ""};
    }

    result.filter = check_and_filter(result.answer.answer, sanitized.context);
    if (result.filter.leak_detected) {
        // The refused text must not travel on in the answer record
        secure_wipe(result.answer.answer);
        secure_wipe(result.answer.raw);
        result.answer.answer = result.filter.safe_text;
    }

    if (options_.rehydrate_output && !result.filter.leak_detected) {
        result.final_text = sanitized.map.rehydrate(result.filter.safe_text);
    } else {
        result.final_text = result.filter.safe_text;
    }
    result.final_risk = final_risk(result.final_text);

    // The map and every copy of an original end their life with this request
    sanitized.map.clear();
    for (auto& entity : sanitized.entities) {
        secure_wipe(entity.text);
    }

    result.sanitized_text = std::move(sanitized.redacted_text);
    result.summary = std::move(sanitized.summary);
    for (auto& record : result.summary) {
        secure_wipe(record.original_text);
    }
    result.context = std::move(sanitized.context);
    result.input_risk = sanitized.risk_score;
    result.degraded = sanitized.degraded;

    utils::log::info(std::format(
        "process: entities={} category={} input_risk={} fallback_used={} leak_detected={} "
        "final_risk={}",
        result.summary.size(), result.context.category, result.input_risk,
        utils::booltostr(result.answer.fallback_used),
        utils::booltostr(result.filter.leak_detected), result.final_risk));

    return result;
}

} // namespace piiguard
