#pragma once

#include <cstdint>
#include <string>

namespace piiguard {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    int64_t port = 8080;
    int64_t thread_pool_size = 4;
    int64_t max_input_length = 65536;     // bytes; larger bodies get 413
};

struct LoggingConfig {
    std::string level = "info";            // info | warn | error
};

struct DetectionConfig {
    bool ner_enabled = false;
    std::string ner_endpoint;              // scheme://host[:port]
    std::string ner_path = "/annotate";
    int64_t ner_timeout_ms = 2000;
};

struct LlmConfig {
    bool enabled = false;
    std::string provider = "openai";       // openai | anthropic
    std::string endpoint = "https://api.openai.com";
    std::string api_key;
    std::string model = "gpt-4o-mini";
    int64_t timeout_ms = 30000;
    int64_t max_retries = 2;
    int64_t max_requests_per_minute = 60;
};

struct OutputConfig {
    bool rehydrate_output = false;
    std::string refusal_message = "We cannot provide this due to sensitive data concerns.";
};

struct GuardConfig {
    ServerConfig server;
    LoggingConfig logging;
    DetectionConfig detection;
    LlmConfig llm;
    OutputConfig output;
};

} // namespace piiguard
