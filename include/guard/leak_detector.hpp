#pragma once

#include "core/types.hpp"
#include "detector/detection_engine.hpp"
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief Output-side re-scan for real (non-placeholder) PII
 *
 * Runs strict detection over candidate text. Any span that is not itself a
 * placeholder token and does not sit inside one is a leak. When strict
 * detection fails, the reduced EMAIL + PHONE scan decides instead.
 */
class LeakDetector {
public:
    static constexpr const char* kDefaultRefusal =
        "We cannot provide this due to sensitive data concerns.";
    static constexpr const char* kLeakNote = "sensitive_entity_detected";

    struct Report {
        bool leak = false;
        bool fallback_used = false;
        size_t leaked_spans = 0;
        std::vector<EntityClass> leaked_classes;
    };

    /**
     * @param engine Shared detection engine; must outlive the detector
     * @param refusal_message Safe text substituted for leaking output
     */
    explicit LeakDetector(const DetectionEngine& engine,
                          std::string refusal_message = kDefaultRefusal);

    [[nodiscard]] bool check_leak(const std::string& candidate) const;

    [[nodiscard]] Report inspect(const std::string& candidate) const;

    /**
     * @brief Leak check plus substitution: refusal text and note on a leak,
     *        candidate unchanged otherwise
     */
    [[nodiscard]] FilterResult filter(const std::string& candidate) const;

    [[nodiscard]] const std::string& refusal_message() const { return refusal_message_; }

private:
    [[nodiscard]] static std::vector<EntityClass> leaking_classes(
        const std::string& candidate, const std::vector<Span>& spans);

    const DetectionEngine& engine_;
    std::string refusal_message_;
};

} // namespace piiguard
