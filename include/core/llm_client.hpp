#pragma once

#include "core/answer_generator.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace piiguard {

struct LlmResponse {
    bool success = false;
    std::string content;
    std::string error;
    std::string model_used;
    std::chrono::milliseconds latency{0};
};

/**
 * @brief LLM client that answers over sanitized text.
 *
 * Speaks the OpenAI chat-completions format or the Anthropic messages
 * format via httplib::Client.
 * Features:
 * - Placeholder-preserving system prompt, JSON {"answer": ...} contract
 * - One retry with a stronger prompt when the answer is unusable
 * - Rate limiting on LLM API calls
 * - Graceful degradation: falls back to echoing the sanitized text
 */
class LlmClient final : public IAnswerGenerator {
public:
    struct Config {
        bool enabled = false;
        std::string provider = "openai";            // openai | anthropic
        std::string endpoint = "https://api.openai.com";
        std::string api_key;
        std::string default_model = "gpt-4o-mini";
        uint32_t timeout_ms = 30000;
        uint32_t max_retries = 2;
        uint32_t max_requests_per_minute = 60;
        double temperature = 0.2;
        int max_tokens = 1024;
    };

    static constexpr double kFirstTryConfidence = 0.9;
    static constexpr double kRetryConfidence = 0.8;

    LlmClient();
    explicit LlmClient(Config config);

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }

    [[nodiscard]] GeneratedAnswer generate(const std::string& sanitized_text,
                                           const Context& context) override;

    [[nodiscard]] std::string name() const override { return "llm:" + config_.provider; }

    /**
     * @brief One chat round trip (rate limited, transport retries)
     */
    [[nodiscard]] LlmResponse complete(const std::string& system_prompt,
                                       const std::string& user_prompt);

    // Prompt construction and answer parsing (for testing)
    [[nodiscard]] static std::string get_system_prompt(bool strict);
    [[nodiscard]] static std::string get_user_prompt(const std::string& sanitized_text,
                                                     const Context& context);

    /**
     * @brief Extract the "answer" field from model text
     *
     * Accepts bare JSON, JSON inside a ``` fence, or the first flat JSON
     * object in the text that has an "answer" key.
     */
    [[nodiscard]] static std::optional<std::string> parse_answer(const std::string& content);

    /**
     * @brief Answer keeps at least one placeholder, or the input had none
     */
    [[nodiscard]] static bool placeholders_preserved(const std::string& answer,
                                                     const std::string& sanitized_text);

    /**
     * @brief Pull the assistant text out of a provider response body
     * @return nullopt when the body does not have the provider's shape
     */
    [[nodiscard]] static std::optional<std::string> extract_content(
        const std::string& body, const std::string& provider);

    struct Stats {
        uint64_t total_requests = 0;
        uint64_t api_calls = 0;
        uint64_t api_errors = 0;
        uint64_t rate_limited = 0;
        uint64_t retries = 0;
        uint64_t fallbacks = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] LlmResponse call_api(const std::string& system_prompt,
                                       const std::string& user_prompt,
                                       const std::string& model);

    [[nodiscard]] bool check_rate_limit();

    [[nodiscard]] GeneratedAnswer fallback(const std::string& sanitized_text,
                                           const char* explanation,
                                           std::string raw);

    Config config_;

    // Rate limiting
    std::atomic<uint32_t> requests_this_minute_{0};
    std::chrono::steady_clock::time_point minute_start_ =
        std::chrono::steady_clock::now();
    std::mutex rate_mutex_;

    // Stats
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> api_calls_{0};
    std::atomic<uint64_t> api_errors_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> fallbacks_{0};
};

} // namespace piiguard
