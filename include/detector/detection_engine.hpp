#pragma once

#include "core/types.hpp"
#include "detector/entity_fuser.hpp"
#include "detector/ner_registry.hpp"
#include "detector/pattern_detectors.hpp"
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief NER + pattern set + fuser over one text
 *
 * Immutable after construction apart from the registry's health counters;
 * one engine is shared by every request.
 */
class DetectionEngine {
public:
    struct Detection {
        std::vector<Span> spans;
        bool ner_used = false;
        bool degraded = false;      // NER configured but failed for this call
    };

    /**
     * @param ner Registry to draw the NER provider from; nullptr runs
     *            pattern-only. Not owned, must outlive the engine.
     */
    explicit DetectionEngine(NerRegistry* ner = nullptr);

    /**
     * @brief Full detection; an NER failure degrades to pattern-only
     */
    [[nodiscard]] Detection detect(const std::string& text) const;

    /**
     * @brief Full detection where any failure is fatal
     * @throws DetectionError if NER or a pattern detector fails
     */
    [[nodiscard]] std::vector<Span> detect_strict(const std::string& text) const;

    /**
     * @brief Reduced EMAIL + PHONE scan used when full detection fails
     */
    [[nodiscard]] std::vector<Span> detect_fallback(const std::string& text) const;

    [[nodiscard]] const PatternDetectorSet& patterns() const { return patterns_; }

private:
    [[nodiscard]] std::vector<Span> annotate(INerProvider& provider,
                                             const std::string& text) const;

    PatternDetectorSet patterns_;
    EntityFuser fuser_;
    NerRegistry* ner_;
};

} // namespace piiguard
