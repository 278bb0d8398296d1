#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

struct ContextClassification {
    Context context;
    std::vector<std::string> categories;    // matched, best first; {"general"} when none
};

/**
 * @brief Keyword-vocabulary context classifier
 *
 * Each category scores one point per vocabulary keyword present as a
 * lowercase substring. The label is the best category, or the best two
 * joined with '-' when more than one scored. Ties keep the vocabulary
 * order (medical, financial, personal).
 */
class ContextClassifier {
public:
    struct Category {
        std::string name;
        std::vector<std::string> keywords;
    };

    static constexpr double kMinConfidence = 0.55;
    static constexpr double kMaxConfidence = 0.95;
    static constexpr double kGeneralConfidence = 0.5;

    ContextClassifier();

    [[nodiscard]] ContextClassification classify(std::string_view text) const;

    [[nodiscard]] const std::vector<Category>& vocabulary() const { return categories_; }

private:
    std::vector<Category> categories_;
};

} // namespace piiguard
