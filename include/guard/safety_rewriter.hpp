#pragma once

#include "core/types.hpp"
#include <string>

namespace piiguard {

/**
 * @brief Optional rewrite of model output before the leak check
 *
 * Implementations may rephrase or trim text but must keep placeholder
 * tokens intact.
 */
class ISafetyRewriter {
public:
    virtual ~ISafetyRewriter() = default;

    [[nodiscard]] virtual std::string rewrite(const std::string& text,
                                              const Context& context) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

class PassthroughRewriter final : public ISafetyRewriter {
public:
    [[nodiscard]] std::string rewrite(const std::string& text,
                                      const Context& /*context*/) override {
        return text;
    }

    [[nodiscard]] std::string name() const override { return "passthrough"; }
};

} // namespace piiguard
