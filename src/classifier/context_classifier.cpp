#include "classifier/context_classifier.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <numeric>

namespace piiguard {

ContextClassifier::ContextClassifier() {
    categories_ = {
        {"medical",   {"diagnosis", "patient", "hospital", "medication", "doctor",
                       "symptom", "clinic"}},
        {"financial", {"credit", "debit", "bank", "account", "loan", "salary",
                       "invoice", "card"}},
        {"personal",  {"address", "phone", "email", "ssn", "passport", "license",
                       "birthday"}},
    };
}

ContextClassification ContextClassifier::classify(std::string_view text) const {
    const auto lowered = utils::to_lower(text);

    std::vector<std::pair<size_t, int>> scores;    // category index, score
    scores.reserve(categories_.size());
    for (size_t i = 0; i < categories_.size(); ++i) {
        int score = 0;
        for (const auto& kw : categories_[i].keywords) {
            if (lowered.find(kw) != std::string::npos) ++score;
        }
        scores.emplace_back(i, score);
    }

    const int total = std::accumulate(scores.begin(), scores.end(), 0,
        [](int acc, const auto& s) { return acc + s.second; });

    ContextClassification result;
    if (total == 0) {
        result.context = {"general", kGeneralConfidence};
        result.categories = {"general"};
        return result;
    }

    std::stable_sort(scores.begin(), scores.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });

    for (const auto& [idx, score] : scores) {
        if (score > 0) result.categories.push_back(categories_[idx].name);
    }

    result.context.category = result.categories.size() > 1
        ? result.categories[0] + "-" + result.categories[1]
        : result.categories[0];

    const double share = static_cast<double>(scores.front().second) / total;
    result.context.confidence = std::min(kMaxConfidence, std::max(kMinConfidence, share));
    return result;
}

} // namespace piiguard
