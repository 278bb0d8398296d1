#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

// ============================================================================
// Entity Classes
// ============================================================================

enum class EntityClass : uint8_t {
    PERSON,
    ORG,
    LOCATION,
    MONEY,
    DATE,
    TIME,
    NUMBER,
    GROUP,
    EMAIL,
    PHONE,
    PAN,
    AADHAAR,
    CARD,
    ACCOUNT,
    SSN,
    IP,
    URL,
    CURRENCY,
    GENERIC_ID
};

inline constexpr size_t kEntityClassCount = 19;

// Every switch over EntityClass below is exhaustive with no default branch,
// so -Wswitch reports any class added without a table entry.

[[nodiscard]] inline constexpr const char* entity_class_to_string(EntityClass cls) noexcept {
    switch (cls) {
        case EntityClass::PERSON:     return "PERSON";
        case EntityClass::ORG:        return "ORG";
        case EntityClass::LOCATION:   return "LOCATION";
        case EntityClass::MONEY:      return "MONEY";
        case EntityClass::DATE:       return "DATE";
        case EntityClass::TIME:       return "TIME";
        case EntityClass::NUMBER:     return "NUMBER";
        case EntityClass::GROUP:      return "GROUP";
        case EntityClass::EMAIL:      return "EMAIL";
        case EntityClass::PHONE:      return "PHONE";
        case EntityClass::PAN:        return "PAN";
        case EntityClass::AADHAAR:    return "AADHAAR";
        case EntityClass::CARD:       return "CARD";
        case EntityClass::ACCOUNT:    return "ACCOUNT";
        case EntityClass::SSN:        return "SSN";
        case EntityClass::IP:         return "IP";
        case EntityClass::URL:        return "URL";
        case EntityClass::CURRENCY:   return "CURRENCY";
        case EntityClass::GENERIC_ID: return "GENERIC_ID";
    }
    return "UNKNOWN";
}

/**
 * @brief Prefix used inside placeholder tokens ([[PREFIX_n]])
 *
 * Part of the wire contract with downstream rendering: never change an
 * existing prefix.
 */
[[nodiscard]] inline constexpr const char* display_prefix(EntityClass cls) noexcept {
    switch (cls) {
        case EntityClass::PERSON:     return "PERSON";
        case EntityClass::ORG:        return "ORG";
        case EntityClass::LOCATION:   return "LOCATION";
        case EntityClass::MONEY:      return "MONEY";
        case EntityClass::DATE:       return "DATE";
        case EntityClass::TIME:       return "TIME";
        case EntityClass::NUMBER:     return "NUMBER";
        case EntityClass::GROUP:      return "GROUP";
        case EntityClass::EMAIL:      return "EMAIL";
        case EntityClass::PHONE:      return "PHONE";
        case EntityClass::PAN:        return "PAN";
        case EntityClass::AADHAAR:    return "AADHAAR";
        case EntityClass::CARD:       return "CARD";
        case EntityClass::ACCOUNT:    return "ACC";
        case EntityClass::SSN:        return "SSN";
        case EntityClass::IP:         return "IP";
        case EntityClass::URL:        return "URL";
        case EntityClass::CURRENCY:   return "CURRENCY";
        case EntityClass::GENERIC_ID: return "ID";
    }
    return "ENTITY";
}

// Classes the statistical recognizer is trusted to report
[[nodiscard]] inline constexpr bool is_ner_sensitive(EntityClass cls) noexcept {
    switch (cls) {
        case EntityClass::PERSON:
        case EntityClass::ORG:
        case EntityClass::LOCATION:
        case EntityClass::MONEY:
        case EntityClass::DATE:
        case EntityClass::TIME:
        case EntityClass::NUMBER:
        case EntityClass::GROUP:
            return true;
        case EntityClass::EMAIL:
        case EntityClass::PHONE:
        case EntityClass::PAN:
        case EntityClass::AADHAAR:
        case EntityClass::CARD:
        case EntityClass::ACCOUNT:
        case EntityClass::SSN:
        case EntityClass::IP:
        case EntityClass::URL:
        case EntityClass::CURRENCY:
        case EntityClass::GENERIC_ID:
            return false;
    }
    return false;
}

[[nodiscard]] inline std::optional<EntityClass> entity_class_from_string(std::string_view name) {
    static constexpr std::array<EntityClass, kEntityClassCount> kAll = {
        EntityClass::PERSON, EntityClass::ORG, EntityClass::LOCATION,
        EntityClass::MONEY, EntityClass::DATE, EntityClass::TIME,
        EntityClass::NUMBER, EntityClass::GROUP, EntityClass::EMAIL,
        EntityClass::PHONE, EntityClass::PAN, EntityClass::AADHAAR,
        EntityClass::CARD, EntityClass::ACCOUNT, EntityClass::SSN,
        EntityClass::IP, EntityClass::URL, EntityClass::CURRENCY,
        EntityClass::GENERIC_ID
    };
    for (const auto cls : kAll) {
        if (name == entity_class_to_string(cls) || name == display_prefix(cls)) {
            return cls;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Spans
// ============================================================================

/**
 * @brief Tagged half-open byte range [start, end) into a source text
 */
struct Span {
    size_t start = 0;
    size_t end = 0;
    EntityClass cls = EntityClass::PERSON;
    std::string text;

    Span() = default;
    Span(size_t s, size_t e, EntityClass c, std::string t)
        : start(s), end(e), cls(c), text(std::move(t)) {}

    [[nodiscard]] size_t length() const { return end - start; }

    [[nodiscard]] bool overlaps(size_t other_start, size_t other_end) const {
        return !(other_end <= start || other_start >= end);
    }

    [[nodiscard]] bool overlaps(const Span& other) const {
        return overlaps(other.start, other.end);
    }
};

/**
 * @brief Raw entity as reported by an NER provider (recognizer's own label set)
 */
struct NerSpan {
    size_t start = 0;
    size_t end = 0;
    std::string label;
    std::string text;
};

// ============================================================================
// Sanitize / Filter Results
// ============================================================================

struct DetectedEntity {
    std::string text;
    EntityClass cls = EntityClass::PERSON;
};

/**
 * @brief Per-entity bookkeeping record
 *
 * original_text must never be written to a log sink.
 */
struct EntitySummaryRecord {
    EntityClass cls = EntityClass::PERSON;
    std::string placeholder;
    double confidence = 0.0;
    std::string original_text;
};

struct Context {
    std::string category = "general";
    double confidence = 0.5;
};

struct FilterResult {
    std::string safe_text;
    bool leak_detected = false;
    std::optional<std::string> note;
};

} // namespace piiguard
