#include "core/llm_client.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "masking/placeholder.hpp"
#include "server/http_constants.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>
#include <re2/re2.h>

#include <format>
#include <sstream>
#include <thread>

namespace piiguard {

using json = nlohmann::json;

// ============================================================================
// Construction
// ============================================================================

LlmClient::LlmClient() = default;

LlmClient::LlmClient(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// Prompts
// ============================================================================

std::string LlmClient::get_system_prompt(bool strict) {
    std::string prompt =
        "You are a privacy-safe assistant. You are given text containing placeholders "
        "like [[PERSON_1]], [[EMAIL_1]], [[PHONE_1]]. You must NOT modify or remove these "
        "placeholders. Output EXACTLY a JSON object with a single key 'answer' whose value "
        "is the textual reply and which contains placeholders verbatim wherever appropriate. "
        "If you cannot answer, return {\"answer\":\"REFUSE\"}. "
        "Do NOT change, translate, expand, paraphrase, or remove placeholders of the form "
        "[[TYPE_n]]. Keep them exactly as-is in your answer.";

    if (strict) {
        prompt +=
            "\n\nCRITICAL: You MUST output valid JSON with an 'answer' field. "
            "You MUST preserve ALL placeholders like [[PERSON_1]] exactly as they appear. "
            "Do NOT paraphrase or remove them.";
    }
    return prompt;
}

std::string LlmClient::get_user_prompt(const std::string& sanitized_text,
                                       const Context& context) {
    const auto category = context.category.empty() ? std::string("general")
                                                   : utils::to_lower(context.category);
    return std::format(
        "Context category: {}.\n"
        "Sanitized input: {}\n\n"
        "Write a helpful, safety-focused answer. Use placeholders exactly as they appear "
        "in the input. Output valid JSON ONLY with an 'answer' field containing your response.",
        category, sanitized_text);
}

// ============================================================================
// Answer Parsing
// ============================================================================

namespace {

std::optional<std::string> answer_field(const json& doc) {
    if (!doc.is_object()) return std::nullopt;
    const auto it = doc.find("answer");
    if (it == doc.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

// Body of the first ``` fenced block, fence language tag dropped
std::string strip_code_fence(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    std::string body;
    bool inside = false;
    while (std::getline(in, line)) {
        if (utils::trim(line).starts_with("```")) {
            if (inside) break;
            inside = true;
            continue;
        }
        if (inside) {
            body += line;
            body += '\n';
        }
    }
    return body;
}

} // anonymous namespace

std::optional<std::string> LlmClient::parse_answer(const std::string& content) {
    auto cleaned = utils::trim(content);
    if (cleaned.empty()) {
        return std::nullopt;
    }
    if (cleaned.starts_with("```")) {
        cleaned = strip_code_fence(cleaned);
    }

    const auto doc = json::parse(cleaned, nullptr, /*allow_exceptions=*/false);
    if (!doc.is_discarded()) {
        if (auto answer = answer_field(doc)) return answer;
    }

    // Model wrapped the object in prose
    static const re2::RE2 embedded_object(R"((\{[^{}]*"answer"[^{}]*\}))");
    re2::StringPiece object;
    if (re2::RE2::PartialMatch(content, embedded_object, &object)) {
        const auto embedded = json::parse(object.begin(), object.end(), nullptr, false);
        if (!embedded.is_discarded()) {
            return answer_field(embedded);
        }
    }
    return std::nullopt;
}

bool LlmClient::placeholders_preserved(const std::string& answer,
                                       const std::string& sanitized_text) {
    return placeholder::contains_any(answer) || !placeholder::contains_any(sanitized_text);
}

std::optional<std::string> LlmClient::extract_content(const std::string& body,
                                                      const std::string& provider) {
    const auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }

    if (provider == "anthropic") {
        // {"content":[{"type":"text","text":"..."}]}
        const auto it = doc.find("content");
        if (it == doc.end() || !it->is_array()) return std::nullopt;
        std::string text;
        for (const auto& block : *it) {
            if (block.is_object() && block.value("type", "") == "text" &&
                block.contains("text") && block["text"].is_string()) {
                text += block["text"].get<std::string>();
            }
        }
        if (text.empty()) return std::nullopt;
        return text;
    }

    // {"choices":[{"message":{"content":"..."}}]}
    const auto choices = doc.find("choices");
    if (choices == doc.end() || !choices->is_array() || choices->empty()) return std::nullopt;
    const auto& first = choices->front();
    if (!first.is_object() || !first.contains("message")) return std::nullopt;
    const auto& message = first["message"];
    if (!message.is_object() || !message.contains("content") ||
        !message["content"].is_string()) {
        return std::nullopt;
    }
    return message["content"].get<std::string>();
}

// ============================================================================
// Rate Limiting
// ============================================================================

bool LlmClient::check_rate_limit() {
    std::lock_guard lock(rate_mutex_);
    const auto now = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        now - minute_start_);

    if (elapsed.count() >= 60) {
        // New minute window
        minute_start_ = now;
        requests_this_minute_.store(0, std::memory_order_relaxed);
    }

    const uint32_t current = requests_this_minute_.load(std::memory_order_relaxed);
    if (current >= config_.max_requests_per_minute) {
        return false;
    }

    requests_this_minute_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

// ============================================================================
// Core API
// ============================================================================

LlmResponse LlmClient::complete(const std::string& system_prompt,
                                const std::string& user_prompt) {
    if (!config_.enabled) {
        return {false, "", "LLM client is disabled", "", {}};
    }

    if (!check_rate_limit()) {
        rate_limited_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "Rate limited: too many LLM API requests", "", {}};
    }

    return call_api(system_prompt, user_prompt, config_.default_model);
}

GeneratedAnswer LlmClient::fallback(const std::string& sanitized_text,
                                    const char* explanation,
                                    std::string raw) {
    fallbacks_.fetch_add(1, std::memory_order_relaxed);
    return {sanitized_text, 0.0, explanation, true, std::move(raw)};
}

GeneratedAnswer LlmClient::generate(const std::string& sanitized_text,
                                    const Context& context) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (!config_.enabled || config_.api_key.empty() || config_.endpoint.empty()) {
        return fallback(sanitized_text, "llm_unavailable_fallback", "");
    }

    const auto user_prompt = get_user_prompt(sanitized_text, context);

    auto first = complete(get_system_prompt(false), user_prompt);
    if (first.success) {
        const auto answer = parse_answer(first.content);
        if (answer && placeholders_preserved(*answer, sanitized_text)) {
            return {*answer, kFirstTryConfidence, "success_json_with_placeholders",
                    false, std::move(first.content)};
        }
    } else {
        utils::log::warn(std::format("[{}] LLM first attempt failed: {}",
            error_category_to_string(ErrorCategory::LLM_ERROR), first.error));
    }

    retries_.fetch_add(1, std::memory_order_relaxed);
    auto second = complete(get_system_prompt(true), user_prompt);
    if (second.success) {
        const auto answer = parse_answer(second.content);
        if (answer && placeholders_preserved(*answer, sanitized_text)) {
            return {*answer, kRetryConfidence, "success_after_retry",
                    false, std::move(second.content)};
        }
    } else {
        utils::log::warn(std::format("[{}] LLM retry failed: {}",
            error_category_to_string(ErrorCategory::LLM_ERROR), second.error));
    }

    if (!first.success && !second.success) {
        return fallback(sanitized_text, "llm_unavailable_fallback", "");
    }
    auto raw = second.success ? std::move(second.content) : std::move(first.content);
    return fallback(sanitized_text, "non_json_or_placeholders_missing_fallback", std::move(raw));
}

// ============================================================================
// API Call
// ============================================================================

LlmResponse LlmClient::call_api(
    const std::string& system_prompt,
    const std::string& user_prompt,
    const std::string& model) {
    api_calls_.fetch_add(1, std::memory_order_relaxed);

    const auto start = std::chrono::steady_clock::now();
    const auto elapsed_ms = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };

    if (config_.api_key.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "No API key configured", model, {}};
    }

    if (config_.endpoint.empty()) {
        api_errors_.fetch_add(1, std::memory_order_relaxed);
        return {false, "", "No endpoint configured", model, {}};
    }

    // Build JSON request body
    json body;
    if (config_.provider == "anthropic") {
        body = {
            {"model", model},
            {"max_tokens", config_.max_tokens},
            {"system", system_prompt},
            {"messages", json::array({{{"role", "user"}, {"content", user_prompt}}})}
        };
    } else {
        body = {
            {"model", model},
            {"temperature", config_.temperature},
            {"max_tokens", config_.max_tokens},
            {"messages", json::array({
                {{"role", "system"}, {"content", system_prompt}},
                {{"role", "user"}, {"content", user_prompt}}
            })}
        };
    }
    const auto json_body = body.dump(-1, ' ', false, json::error_handler_t::replace);

    // HTTP client
    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));

    httplib::Headers headers;
    std::string path;

    if (config_.provider == "anthropic") {
        headers = {
            {"x-api-key", config_.api_key},
            {"anthropic-version", "2023-06-01"}
        };
        path = "/v1/messages";
    } else {
        headers = {
            {http::kAuthorizationHeader, "Bearer " + config_.api_key}
        };
        path = "/v1/chat/completions";
    }

    // Retry loop
    for (uint32_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        const auto res = cli.Post(path, headers, json_body, http::kJsonContentType);

        if (!res) {
            if (attempt < config_.max_retries) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1000 * (attempt + 1)));
                continue;
            }
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return {false, "", "HTTP request failed: connection error", model, elapsed_ms()};
        }

        if (res->status == httplib::StatusCode::TooManyRequests_429) {
            if (attempt < config_.max_retries) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1000 * (attempt + 1)));
                continue;
            }
        }

        if (res->status != httplib::StatusCode::OK_200) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return {false, "", std::format("API error: HTTP {}", res->status),
                    model, elapsed_ms()};
        }

        auto content = extract_content(res->body, config_.provider);
        if (!content) {
            api_errors_.fetch_add(1, std::memory_order_relaxed);
            return {false, "", "API error: unexpected response shape", model, elapsed_ms()};
        }

        return {true, std::move(*content), "", model, elapsed_ms()};
    }

    api_errors_.fetch_add(1, std::memory_order_relaxed);
    return {false, "", "Max retries exceeded", model, elapsed_ms()};
}

// ============================================================================
// Stats
// ============================================================================

LlmClient::Stats LlmClient::get_stats() const {
    return {
        total_requests_.load(std::memory_order_relaxed),
        api_calls_.load(std::memory_order_relaxed),
        api_errors_.load(std::memory_order_relaxed),
        rate_limited_.load(std::memory_order_relaxed),
        retries_.load(std::memory_order_relaxed),
        fallbacks_.load(std::memory_order_relaxed)
    };
}

} // namespace piiguard
