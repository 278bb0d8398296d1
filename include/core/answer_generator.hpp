#pragma once

#include "core/types.hpp"
#include <string>

namespace piiguard {

struct GeneratedAnswer {
    std::string answer;
    double confidence = 0.0;
    std::string explanation;
    bool fallback_used = false;
    std::string raw;            // model text as returned, may be empty
};

/**
 * @brief Produces an answer for already-sanitized text
 *
 * Implementations only ever see redacted text; they must not be handed the
 * rehydration map or the original input.
 */
class IAnswerGenerator {
public:
    virtual ~IAnswerGenerator() = default;

    [[nodiscard]] virtual GeneratedAnswer generate(const std::string& sanitized_text,
                                                   const Context& context) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace piiguard
