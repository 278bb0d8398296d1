#pragma once

#include "classifier/context_classifier.hpp"
#include "core/answer_generator.hpp"
#include "core/types.hpp"
#include "detector/detection_engine.hpp"
#include "guard/leak_detector.hpp"
#include "guard/safety_rewriter.hpp"
#include "masking/rehydration_map.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief Collaborators the pipeline is built from
 *
 * detection is required. A null answer_generator echoes the sanitized text;
 * a null rewriter passes text through.
 */
struct PipelineComponents {
    std::shared_ptr<DetectionEngine> detection;
    std::shared_ptr<IAnswerGenerator> answer_generator;
    std::shared_ptr<ISafetyRewriter> rewriter;
};

struct PipelineOptions {
    bool rehydrate_output = false;
    std::string refusal_message = LeakDetector::kDefaultRefusal;
};

struct SanitizeResult {
    std::string redacted_text;
    std::vector<DetectedEntity> entities;
    std::vector<EntitySummaryRecord> summary;
    Context context;
    std::vector<std::string> categories;
    int risk_score = 0;
    RehydrationMap map;
    bool degraded = false;      // NER failed, or full detection failed and EMAIL/PHONE was used
};

/**
 * @brief Full request cycle outcome; carries no rehydration map
 */
struct ProcessResult {
    std::string sanitized_text;
    std::vector<EntitySummaryRecord> summary;   // original_text wiped
    Context context;
    int input_risk = 0;
    GeneratedAnswer answer;                     // refusal text when a leak was found
    FilterResult filter;
    std::string final_text;
    int final_risk = 0;
    bool degraded = false;
};

/**
 * @brief Privacy pipeline - redact, answer, re-check
 *
 * Stages:
 * 1. Detect (NER + patterns, fused) and assign placeholders
 * 2. Classify context, score risk (informational)
 * 3. Generate an answer from the redacted text only
 * 4. Optional safety rewrite; a throwing rewriter leaves the text unchanged
 * 5. Leak check; refusal text on any real PII, also replacing the answer
 * 6. Final text, risk recomputed on it; rehydration map cleared
 *
 * Thread-safe: every call allocates its own counters and map.
 */
class PrivacyPipeline {
public:
    /**
     * @throws std::invalid_argument when components.detection is null
     */
    explicit PrivacyPipeline(PipelineComponents components, PipelineOptions options = {});

    [[nodiscard]] SanitizeResult sanitize(const std::string& text) const;

    /**
     * @brief Rewrite then leak-check candidate output
     *
     * A rewriter that throws or returns nothing is skipped.
     */
    [[nodiscard]] FilterResult check_and_filter(const std::string& candidate,
                                                const Context& context_hint) const;

    [[nodiscard]] ProcessResult process(const std::string& text) const;

    [[nodiscard]] ContextClassification classify(const std::string& text) const {
        return classifier_.classify(text);
    }

    /**
     * @brief Risk of text as it would be released; 0 when scoring fails
     */
    [[nodiscard]] int final_risk(const std::string& text) const;

    [[nodiscard]] const PipelineOptions& options() const { return options_; }

    struct Stats {
        uint64_t sanitize_calls;
        uint64_t process_calls;
        uint64_t filter_calls;
        uint64_t leaks_blocked;
        uint64_t degraded_detections;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .sanitize_calls = sanitize_calls_.load(std::memory_order_relaxed),
            .process_calls = process_calls_.load(std::memory_order_relaxed),
            .filter_calls = filter_calls_.load(std::memory_order_relaxed),
            .leaks_blocked = leaks_blocked_.load(std::memory_order_relaxed),
            .degraded_detections = degraded_detections_.load(std::memory_order_relaxed),
        };
    }

private:
    PipelineComponents c_;
    PipelineOptions options_;
    ContextClassifier classifier_;
    LeakDetector leak_detector_;

    mutable std::atomic<uint64_t> sanitize_calls_{0};
    mutable std::atomic<uint64_t> process_calls_{0};
    mutable std::atomic<uint64_t> filter_calls_{0};
    mutable std::atomic<uint64_t> leaks_blocked_{0};
    mutable std::atomic<uint64_t> degraded_detections_{0};
};

} // namespace piiguard
