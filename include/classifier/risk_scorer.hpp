#pragma once

#include "core/types.hpp"
#include <string_view>
#include <vector>

namespace piiguard {

/**
 * @brief Weighted-sum risk score in [0, 100]
 *
 * round(sum(weight(class)) * multiplier(category)), clamped. Deterministic
 * and side-effect free; never seeded from a caller-supplied score.
 */
class RiskScorer {
public:
    static constexpr int kMinScore = 0;
    static constexpr int kMaxScore = 100;
    static constexpr int kDefaultWeight = 7;
    static constexpr int kFallbackPerEntity = 10;

    [[nodiscard]] static int weight(EntityClass cls);

    /**
     * @brief Multiplier for a context label (case-insensitive exact match)
     *
     * Unknown labels, hyphen-joined ones included, use 1.0.
     */
    [[nodiscard]] static double multiplier(std::string_view category);

    [[nodiscard]] static int score(const std::vector<EntityClass>& classes,
                                   std::string_view category);

    [[nodiscard]] static int score(const std::vector<DetectedEntity>& entities,
                                   std::string_view category);

    /**
     * @brief Safe default when scoring itself fails: min(100, 10 * count)
     */
    [[nodiscard]] static int fallback(size_t entity_count);
};

} // namespace piiguard
