#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

/**
 * @brief Interface for statistical named-entity recognizers
 *
 * Implementations report spans in the recognizer's own label vocabulary;
 * map_ner_label() folds them onto EntityClass. annotate() throws
 * DetectionError when the recognizer cannot produce a result.
 */
class INerProvider {
public:
    virtual ~INerProvider() = default;

    /**
     * @brief Annotate text with entity spans
     * @param text Source text (UTF-8)
     * @return Spans with byte offsets into text
     */
    [[nodiscard]] virtual std::vector<NerSpan> annotate(const std::string& text) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Map a recognizer label (spaCy vocabulary) to an entity class
 * @return nullopt for labels that are not tracked
 */
[[nodiscard]] inline std::optional<EntityClass> map_ner_label(std::string_view label) {
    if (label == "PERSON" || label == "PER") return EntityClass::PERSON;
    if (label == "ORG") return EntityClass::ORG;
    if (label == "GPE" || label == "LOC" || label == "FAC" || label == "LOCATION") {
        return EntityClass::LOCATION;
    }
    if (label == "NORP" || label == "GROUP") return EntityClass::GROUP;
    if (label == "DATE") return EntityClass::DATE;
    if (label == "TIME") return EntityClass::TIME;
    if (label == "MONEY") return EntityClass::MONEY;
    if (label == "CARDINAL" || label == "QUANTITY" || label == "ORDINAL" || label == "NUMBER") {
        return EntityClass::NUMBER;
    }
    return std::nullopt;
}

/**
 * @brief Convert raw recognizer output to tagged spans
 *
 * Drops untracked labels and spans whose range does not fit the text.
 * Span text is taken from the source, not from the recognizer.
 */
[[nodiscard]] inline std::vector<Span> to_entity_spans(
    const std::vector<NerSpan>& raw, const std::string& text) {
    std::vector<Span> spans;
    spans.reserve(raw.size());
    for (const auto& ner : raw) {
        if (ner.end <= ner.start || ner.end > text.size()) continue;
        const auto cls = map_ner_label(ner.label);
        if (!cls) continue;
        spans.emplace_back(ner.start, ner.end, *cls, text.substr(ner.start, ner.end - ner.start));
    }
    return spans;
}

} // namespace piiguard
