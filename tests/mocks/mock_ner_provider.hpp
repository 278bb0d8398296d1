#pragma once

#include "detector/ner_provider.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

namespace piiguard::testing {

/**
 * @brief Scripted NER provider
 *
 * Returns the configured spans for every text, or throws when set to fail.
 */
class MockNerProvider : public INerProvider {
public:
    explicit MockNerProvider(std::vector<NerSpan> spans = {}, bool should_fail = false)
        : spans_(std::move(spans)), should_fail_(should_fail) {}

    [[nodiscard]] std::vector<NerSpan> annotate(const std::string& /*text*/) override {
        annotate_count_.fetch_add(1, std::memory_order_relaxed);
        if (should_fail_) {
            throw std::runtime_error("mock NER unavailable");
        }
        return spans_;
    }

    [[nodiscard]] std::string name() const override { return "mock"; }

    [[nodiscard]] uint64_t annotate_count() const {
        return annotate_count_.load(std::memory_order_relaxed);
    }

    void set_should_fail(bool v) { should_fail_ = v; }

private:
    std::vector<NerSpan> spans_;
    bool should_fail_;
    std::atomic<uint64_t> annotate_count_{0};
};

/**
 * @brief Span helper: byte range of the first occurrence of needle
 */
inline NerSpan ner_span(const std::string& text, const std::string& needle,
                        std::string label) {
    const auto pos = text.find(needle);
    return NerSpan{pos, pos + needle.size(), std::move(label), needle};
}

} // namespace piiguard::testing
