#pragma once

#include "core/types.hpp"
#include "detector/pattern_detectors.hpp"
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace piiguard {

// ============================================================================
// Reclassification Rules
// ============================================================================

/**
 * @brief Shape of a candidate's text, the only input a rule predicate sees
 */
struct ShapeFacts {
    size_t digit_count = 0;
    bool has_separator = false;   // space or hyphen anywhere in the text
    bool has_plus = false;
    bool leading_plus = false;

    [[nodiscard]] static ShapeFacts of(std::string_view text);
};

enum class RuleOutcome : uint8_t {
    ACCEPT,
    REJECT,
    RECLASSIFY
};

[[nodiscard]] inline const char* rule_outcome_to_string(RuleOutcome outcome) {
    switch (outcome) {
        case RuleOutcome::ACCEPT:     return "accept";
        case RuleOutcome::REJECT:     return "reject";
        case RuleOutcome::RECLASSIFY: return "reclassify";
        default:                      return "unknown";
    }
}

/**
 * @brief One row of the reclassification table
 *
 * Rows are evaluated top to bottom for a candidate's class; the first row
 * whose predicate holds decides. A candidate no row matches is accepted
 * under its own class.
 */
struct ReclassificationRule {
    EntityClass candidate;
    const char* name;
    bool (*predicate)(const ShapeFacts&);
    RuleOutcome outcome;
    EntityClass target;     // meaningful for RECLASSIFY only
};

// ============================================================================
// Entity Fuser
// ============================================================================

/**
 * @brief Merges NER spans and pattern spans into one disjoint span list
 *
 * Stages:
 * 1. Seed with NER spans of the sensitive classes
 * 2. Admit pattern candidates in priority order (PAN first, GENERIC_ID
 *    last), each only if it does not intersect an accepted span
 * 3. Apply the reclassification table to every pattern candidate
 * 4. Admit name-fallback candidates that touch no accepted span
 * 5. Merge: sort by start then descending length, drop overlaps
 *
 * Stateless; safe to share across threads.
 */
class EntityFuser {
public:
    [[nodiscard]] std::vector<Span> fuse(
        const std::vector<Span>& ner_spans,
        const PatternMatches& patterns) const;

    /**
     * @brief Run the table for one candidate
     * @return Final class, or nullopt when the candidate is rejected
     */
    [[nodiscard]] static std::optional<EntityClass> reclassify(
        EntityClass cls, std::string_view text);

    /**
     * @brief First rule matching the candidate, nullptr when none does
     */
    [[nodiscard]] static const ReclassificationRule* match_rule(
        EntityClass cls, const ShapeFacts& facts);

    [[nodiscard]] static std::span<const ReclassificationRule> rules();

    /**
     * @brief Sort and drop overlaps; longer span wins, ties keep the earlier one
     */
    [[nodiscard]] static std::vector<Span> merge(std::vector<Span> spans);
};

} // namespace piiguard
