#pragma once

#include "core/types.hpp"
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace piiguard {

/**
 * @brief Output of one full pattern scan, bucketed by class
 *
 * Name-fallback candidates are kept apart from the PERSON bucket because the
 * fuser admits them only after every structured class has been placed.
 */
struct PatternMatches {
    std::array<std::vector<Span>, kEntityClassCount> by_class;
    std::vector<Span> names;

    [[nodiscard]] const std::vector<Span>& of(EntityClass cls) const {
        return by_class[static_cast<size_t>(cls)];
    }

    [[nodiscard]] std::vector<Span>& of(EntityClass cls) {
        return by_class[static_cast<size_t>(cls)];
    }

    [[nodiscard]] size_t total() const;
};

/**
 * @brief Regex-based recognizers for structured PII
 *
 * Each detector is independent of the others and reports every
 * non-overlapping match it finds on its own. Patterns are compiled once at
 * construction; the set is immutable afterwards and safe to share across
 * threads. Matching runs on RE2, so its cost is linear in the text and its
 * stack use does not grow with the length of a match.
 */
class PatternDetectorSet {
public:
    /**
     * @throws DetectionError if a pattern fails to compile
     */
    PatternDetectorSet();
    ~PatternDetectorSet();

    PatternDetectorSet(PatternDetectorSet&&) noexcept;
    PatternDetectorSet& operator=(PatternDetectorSet&&) noexcept;
    PatternDetectorSet(const PatternDetectorSet&) = delete;
    PatternDetectorSet& operator=(const PatternDetectorSet&) = delete;

    /**
     * @brief Run the detector for one structured class
     * @return Matches in text order; empty for classes with no pattern
     *         (the NER-only classes)
     */
    [[nodiscard]] std::vector<Span> detect(EntityClass cls, const std::string& text) const;

    /**
     * @brief Latin-script name fallback (2-3 capitalized tokens, class PERSON)
     */
    [[nodiscard]] std::vector<Span> detect_names(const std::string& text) const;

    /**
     * @brief Run every structured detector plus the name fallback
     */
    [[nodiscard]] PatternMatches scan(const std::string& text) const;

    /**
     * @brief Classes that have a pattern detector, in fusion priority order
     */
    [[nodiscard]] static const std::vector<EntityClass>& priority_order();

    [[nodiscard]] static bool is_name_stop_word(const std::string& token);

private:
    [[nodiscard]] const re2::RE2* regex_for(EntityClass cls) const;

    std::unique_ptr<const re2::RE2> email_regex_;
    std::unique_ptr<const re2::RE2> phone_regex_;
    std::unique_ptr<const re2::RE2> pan_regex_;
    std::unique_ptr<const re2::RE2> ssn_regex_;
    std::unique_ptr<const re2::RE2> aadhaar_regex_;
    std::unique_ptr<const re2::RE2> card_regex_;
    std::unique_ptr<const re2::RE2> account_regex_;
    std::unique_ptr<const re2::RE2> generic_id_regex_;
    std::unique_ptr<const re2::RE2> ip_regex_;
    std::unique_ptr<const re2::RE2> url_regex_;
    std::unique_ptr<const re2::RE2> currency_regex_;
    std::unique_ptr<const re2::RE2> name_token_regex_;
};

} // namespace piiguard
