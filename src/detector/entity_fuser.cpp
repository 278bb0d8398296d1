#include "detector/entity_fuser.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <array>

namespace piiguard {

// ============================================================================
// Shape Facts
// ============================================================================

ShapeFacts ShapeFacts::of(std::string_view text) {
    ShapeFacts facts;
    for (const char c : text) {
        if (utils::is_ascii_digit(c)) {
            ++facts.digit_count;
        } else if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '-') {
            facts.has_separator = true;
        } else if (c == '+') {
            facts.has_plus = true;
        }
    }
    facts.leading_plus = !text.empty() && text.front() == '+';
    return facts;
}

// ============================================================================
// Reclassification Table
// ============================================================================

namespace {

constexpr bool in_digits(const ShapeFacts& f, size_t lo, size_t hi) {
    return f.digit_count >= lo && f.digit_count <= hi;
}

const std::array<ReclassificationRule, 10> kRules = {{
    {EntityClass::CARD, "card_short_unseparated_is_account",
     [](const ShapeFacts& f) {
         return !in_digits(f, 13, 19) && in_digits(f, 9, 18) && !f.has_separator;
     },
     RuleOutcome::RECLASSIFY, EntityClass::ACCOUNT},

    {EntityClass::CARD, "card_digit_count_out_of_range",
     [](const ShapeFacts& f) { return !in_digits(f, 13, 19); },
     RuleOutcome::REJECT, EntityClass::CARD},

    {EntityClass::CARD, "card_sixteen_unseparated_is_account",
     [](const ShapeFacts& f) { return f.digit_count == 16 && !f.has_separator; },
     RuleOutcome::RECLASSIFY, EntityClass::ACCOUNT},

    {EntityClass::AADHAAR, "aadhaar_not_twelve_digits",
     [](const ShapeFacts& f) { return f.digit_count != 12; },
     RuleOutcome::REJECT, EntityClass::AADHAAR},

    {EntityClass::ACCOUNT, "account_digit_count_out_of_range",
     [](const ShapeFacts& f) { return !in_digits(f, 9, 18); },
     RuleOutcome::REJECT, EntityClass::ACCOUNT},

    {EntityClass::ACCOUNT, "account_separated_or_plus",
     [](const ShapeFacts& f) { return f.has_separator || f.has_plus; },
     RuleOutcome::REJECT, EntityClass::ACCOUNT},

    {EntityClass::PHONE, "phone_digit_count_out_of_range",
     [](const ShapeFacts& f) { return !in_digits(f, 10, 15); },
     RuleOutcome::REJECT, EntityClass::PHONE},

    {EntityClass::PHONE, "phone_twelve_without_country_code",
     [](const ShapeFacts& f) { return f.digit_count == 12 && !f.leading_plus; },
     RuleOutcome::REJECT, EntityClass::PHONE},

    {EntityClass::PHONE, "phone_long_bare_digits",
     [](const ShapeFacts& f) {
         return f.digit_count >= 12 && !f.has_separator && !f.has_plus;
     },
     RuleOutcome::REJECT, EntityClass::PHONE},

    {EntityClass::GENERIC_ID, "generic_id_covered_by_specific_class",
     [](const ShapeFacts& f) { return f.digit_count >= 9; },
     RuleOutcome::REJECT, EntityClass::GENERIC_ID},
}};

bool intersects_any(const Span& candidate, const std::vector<Span>& accepted) {
    return std::any_of(accepted.begin(), accepted.end(),
        [&candidate](const Span& s) { return s.overlaps(candidate); });
}

} // anonymous namespace

std::span<const ReclassificationRule> EntityFuser::rules() {
    return kRules;
}

const ReclassificationRule* EntityFuser::match_rule(EntityClass cls, const ShapeFacts& facts) {
    for (const auto& rule : kRules) {
        if (rule.candidate == cls && rule.predicate(facts)) {
            return &rule;
        }
    }
    return nullptr;
}

std::optional<EntityClass> EntityFuser::reclassify(EntityClass cls, std::string_view text) {
    const auto* rule = match_rule(cls, ShapeFacts::of(text));
    if (rule == nullptr) {
        return cls;
    }
    switch (rule->outcome) {
        case RuleOutcome::ACCEPT:     return cls;
        case RuleOutcome::REJECT:     return std::nullopt;
        case RuleOutcome::RECLASSIFY: return rule->target;
    }
    return std::nullopt;
}

// ============================================================================
// Fusion
// ============================================================================

std::vector<Span> EntityFuser::merge(std::vector<Span> spans) {
    std::stable_sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.length() > b.length();
    });

    std::vector<Span> merged;
    merged.reserve(spans.size());
    for (auto& span : spans) {
        if (merged.empty() || span.start >= merged.back().end) {
            merged.push_back(std::move(span));
        } else if (span.length() > merged.back().length()) {
            merged.back() = std::move(span);
        }
    }
    return merged;
}

std::vector<Span> EntityFuser::fuse(
    const std::vector<Span>& ner_spans,
    const PatternMatches& patterns) const {

    std::vector<Span> accepted;
    std::vector<Span> ner_persons;

    // Stage 1: NER seed
    for (const auto& span : ner_spans) {
        if (span.end <= span.start || !is_ner_sensitive(span.cls)) continue;
        accepted.push_back(span);
        if (span.cls == EntityClass::PERSON) {
            ner_persons.push_back(span);
        }
    }

    // Stages 2-3: structured classes in priority order
    for (const auto cls : PatternDetectorSet::priority_order()) {
        for (const auto& candidate : patterns.of(cls)) {
            if (intersects_any(candidate, accepted)) continue;

            const auto final_class = reclassify(cls, candidate.text);
            if (!final_class) continue;

            Span span = candidate;
            span.cls = *final_class;
            accepted.push_back(std::move(span));
        }
    }

    // Stage 4: name fallback
    for (const auto& candidate : patterns.names) {
        if (intersects_any(candidate, accepted)) continue;
        if (intersects_any(candidate, ner_persons)) continue;
        accepted.push_back(candidate);
    }

    // Stage 5
    return merge(std::move(accepted));
}

} // namespace piiguard
