#pragma once

#include "core/types.hpp"
#include "masking/rehydration_map.hpp"
#include <string>
#include <vector>

namespace piiguard {

/**
 * @brief Result of masking one text
 *
 * Holds the rehydration map by value; moving the assignment moves the map.
 */
struct Assignment {
    std::string redacted_text;
    RehydrationMap map;
    std::vector<EntitySummaryRecord> summary;     // deduped by (text, class)
    std::vector<DetectedEntity> entities;         // same dedup, plain view
};

/**
 * @brief Replaces disjoint spans with [[PREFIX_n]] tokens, left to right
 *
 * Counters are per class and local to one assign() call. Every occurrence
 * gets its own token, even when the same text repeats.
 */
class PlaceholderAssigner {
public:
    static constexpr double kSummaryConfidence = 0.98;

    /**
     * @param text Source text
     * @param spans Sorted, pairwise disjoint spans into text
     * @throws std::invalid_argument if spans are unsorted, overlapping or
     *         out of range
     */
    [[nodiscard]] static Assignment assign(const std::string& text,
                                           const std::vector<Span>& spans);
};

} // namespace piiguard
