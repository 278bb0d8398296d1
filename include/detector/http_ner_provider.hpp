#pragma once

#include "detector/ner_provider.hpp"
#include <cstdint>
#include <string>

namespace piiguard {

/**
 * @brief NER provider backed by an HTTP annotation service
 *
 * POSTs {"text": ...} and expects
 * {"entities":[{"start","end","label","text"}]} with code point offsets,
 * which are converted to byte offsets here.
 */
class HttpNerProvider final : public INerProvider {
public:
    struct Config {
        std::string endpoint;               // scheme://host[:port]
        std::string path = "/annotate";
        uint32_t timeout_ms = 2000;
    };

    /**
     * @throws std::invalid_argument when the endpoint is empty
     */
    explicit HttpNerProvider(Config config);

    [[nodiscard]] std::vector<NerSpan> annotate(const std::string& text) override;

    [[nodiscard]] std::string name() const override { return "http"; }

    /**
     * @brief Parse an annotation response body
     * @throws DetectionError on malformed bodies
     */
    [[nodiscard]] static std::vector<NerSpan> parse_response(
        const std::string& body, const std::string& text);

private:
    Config config_;
};

} // namespace piiguard
