#include "classifier/risk_scorer.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <cmath>

namespace piiguard {

int RiskScorer::weight(EntityClass cls) {
    switch (cls) {
        case EntityClass::EMAIL:      return 20;
        case EntityClass::PHONE:      return 20;
        case EntityClass::GENERIC_ID: return 25;
        case EntityClass::PERSON:     return 15;
        case EntityClass::ORG:        return 10;
        case EntityClass::LOCATION:   return 10;
        case EntityClass::MONEY:      return 18;
        case EntityClass::DATE:       return 6;
        case EntityClass::TIME:       return 4;
        case EntityClass::NUMBER:     return 5;
        case EntityClass::GROUP:      return 8;
        case EntityClass::PAN:
        case EntityClass::AADHAAR:
        case EntityClass::CARD:
        case EntityClass::ACCOUNT:
        case EntityClass::SSN:
        case EntityClass::IP:
        case EntityClass::URL:
        case EntityClass::CURRENCY:
            return kDefaultWeight;
    }
    return kDefaultWeight;
}

double RiskScorer::multiplier(std::string_view category) {
    const auto lowered = utils::to_lower(category);
    if (lowered == "medical") return 1.4;
    if (lowered == "financial") return 1.4;
    if (lowered == "personal") return 1.2;
    return 1.0;
}

int RiskScorer::score(const std::vector<EntityClass>& classes, std::string_view category) {
    long base = 0;
    for (const auto cls : classes) {
        base += weight(cls);
    }
    const auto scaled = std::lround(static_cast<double>(base) * multiplier(category));
    return static_cast<int>(std::clamp<long>(scaled, kMinScore, kMaxScore));
}

int RiskScorer::score(const std::vector<DetectedEntity>& entities, std::string_view category) {
    std::vector<EntityClass> classes;
    classes.reserve(entities.size());
    for (const auto& e : entities) {
        classes.push_back(e.cls);
    }
    return score(classes, category);
}

int RiskScorer::fallback(size_t entity_count) {
    return static_cast<int>(std::min<size_t>(kMaxScore, kFallbackPerEntity * entity_count));
}

} // namespace piiguard
