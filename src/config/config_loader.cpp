#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace piiguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);
    cfg.port = s["port"].value_or(cfg.port);
    cfg.thread_pool_size = s["threads"].value_or(cfg.thread_pool_size);
    cfg.max_input_length = s["max_input_length"].value_or(cfg.max_input_length);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = utils::to_lower((*logging)["level"].value_or("info"s));
    return cfg;
}

DetectionConfig extract_detection(const toml::table& root) {
    DetectionConfig cfg;
    const auto* detection = root["detection"].as_table();
    if (!detection) return cfg;
    const auto& d = *detection;

    cfg.ner_enabled = d["ner_enabled"].value_or(false);
    cfg.ner_endpoint = d["ner_endpoint"].value_or(""s);
    cfg.ner_path = d["ner_path"].value_or(cfg.ner_path);
    cfg.ner_timeout_ms = d["ner_timeout_ms"].value_or(cfg.ner_timeout_ms);
    return cfg;
}

LlmConfig extract_llm(const toml::table& root) {
    LlmConfig cfg;
    const auto* llm = root["llm"].as_table();
    if (!llm) return cfg;
    const auto& l = *llm;

    cfg.enabled = l["enabled"].value_or(false);
    cfg.provider = utils::to_lower(l["provider"].value_or(cfg.provider));
    cfg.endpoint = l["endpoint"].value_or(cfg.endpoint);
    cfg.api_key = l["api_key"].value_or(""s);
    cfg.model = l["model"].value_or(cfg.model);
    cfg.timeout_ms = l["timeout_ms"].value_or(cfg.timeout_ms);
    cfg.max_retries = l["max_retries"].value_or(cfg.max_retries);
    cfg.max_requests_per_minute = l["max_requests_per_minute"].value_or(cfg.max_requests_per_minute);
    return cfg;
}

OutputConfig extract_output(const toml::table& root) {
    OutputConfig cfg;
    const auto* output = root["output"].as_table();
    if (!output) return cfg;
    const auto& o = *output;

    cfg.rehydrate_output = o["rehydrate_output"].value_or(false);
    cfg.refusal_message = o["refusal_message"].value_or(cfg.refusal_message);
    return cfg;
}

GuardConfig extract_all_sections(const toml::table& tbl) {
    GuardConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.detection = extract_detection(tbl);
    config.llm = extract_llm(tbl);
    config.output = extract_output(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GuardConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GuardConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port < 1 || config.server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size <= 0) {
        errors.push_back(std::format("server.threads must be > 0, got {}",
                                     config.server.thread_pool_size));
    }
    if (config.server.max_input_length <= 0) {
        errors.push_back(std::format("server.max_input_length must be > 0, got {}",
                                     config.server.max_input_length));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be info, warn or error, got '{}'",
                                     config.logging.level));
    }

    if (config.detection.ner_enabled && config.detection.ner_endpoint.empty()) {
        errors.push_back("detection.ner_endpoint required when NER is enabled");
    }
    if (config.detection.ner_timeout_ms <= 0) {
        errors.push_back("detection.ner_timeout_ms must be > 0");
    }

    if (config.llm.provider != "openai" && config.llm.provider != "anthropic") {
        errors.push_back(std::format("llm.provider must be openai or anthropic, got '{}'",
                                     config.llm.provider));
    }
    if (config.llm.enabled && config.llm.endpoint.empty()) {
        errors.push_back("llm.endpoint required when the LLM is enabled");
    }
    if (config.llm.timeout_ms <= 0) {
        errors.push_back("llm.timeout_ms must be > 0");
    }
    if (config.llm.max_retries < 0) {
        errors.push_back("llm.max_retries must be >= 0");
    }
    if (config.llm.max_requests_per_minute <= 0) {
        errors.push_back("llm.max_requests_per_minute must be > 0");
    }

    return errors;
}

} // namespace piiguard
