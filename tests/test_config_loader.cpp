#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace piiguard;

TEST_CASE("ConfigLoader: defaults when sections are missing", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.host == "0.0.0.0");
    CHECK(cfg.server.port == 8080);
    CHECK(cfg.server.thread_pool_size == 4);
    CHECK(cfg.logging.level == "info");
    CHECK_FALSE(cfg.detection.ner_enabled);
    CHECK_FALSE(cfg.llm.enabled);
    CHECK(cfg.llm.provider == "openai");
    CHECK_FALSE(cfg.output.rehydrate_output);
    CHECK(cfg.output.refusal_message == "We cannot provide this due to sensitive data concerns.");
}

TEST_CASE("ConfigLoader: full file", "[config]") {
    const std::string toml = R"(
[server]
host = "127.0.0.1"
port = 9090
threads = 8
max_input_length = 4096

[logging]
level = "WARN"

[detection]
ner_enabled = true
ner_endpoint = "http://ner:8001"
ner_path = "/v2/annotate"
ner_timeout_ms = 750

[llm]
enabled = true
provider = "Anthropic"
endpoint = "https://api.anthropic.com"
api_key = "sk-test"
model = "claude-test"
timeout_ms = 10000
max_retries = 1
max_requests_per_minute = 30

[output]
rehydrate_output = true
refusal_message = "Withheld."
)";
    const auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 9090);
    CHECK(cfg.server.thread_pool_size == 8);
    CHECK(cfg.server.max_input_length == 4096);
    CHECK(cfg.logging.level == "warn");
    CHECK(cfg.detection.ner_enabled);
    CHECK(cfg.detection.ner_endpoint == "http://ner:8001");
    CHECK(cfg.detection.ner_path == "/v2/annotate");
    CHECK(cfg.detection.ner_timeout_ms == 750);
    CHECK(cfg.llm.provider == "anthropic");
    CHECK(cfg.llm.model == "claude-test");
    CHECK(cfg.llm.max_retries == 1);
    CHECK(cfg.llm.max_requests_per_minute == 30);
    CHECK(cfg.output.rehydrate_output);
    CHECK(cfg.output.refusal_message == "Withheld.");
}

TEST_CASE("ConfigLoader: environment substitution", "[config][env]") {
    ::setenv("PII_GUARD_TEST_API_KEY", "sk-from-env", 1);
    ::unsetenv("PII_GUARD_TEST_UNSET");

    SECTION("Set and unset variables") {
        const auto result = ConfigLoader::load_from_string(R"(
[llm]
api_key = "${PII_GUARD_TEST_API_KEY}"
model = "m-${PII_GUARD_TEST_UNSET}x"
)");
        REQUIRE(result.success);
        CHECK(result.config.llm.api_key == "sk-from-env");
        CHECK(result.config.llm.model == "m-x");
    }

    SECTION("Unclosed substitution is an error") {
        const auto result = ConfigLoader::load_from_string(R"(
[llm]
api_key = "${PII_GUARD_TEST_API_KEY"
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: validation", "[config][validation]") {
    SECTION("Port out of range") {
        const auto result = ConfigLoader::load_from_string("[server]\nport = 70000\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("server.port") != std::string::npos);
    }

    SECTION("Zero threads") {
        const auto result = ConfigLoader::load_from_string("[server]\nthreads = 0\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("server.threads") != std::string::npos);
    }

    SECTION("NER enabled without endpoint") {
        const auto result = ConfigLoader::load_from_string("[detection]\nner_enabled = true\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("detection.ner_endpoint") != std::string::npos);
    }

    SECTION("Unknown provider") {
        const auto result = ConfigLoader::load_from_string("[llm]\nprovider = \"other\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("llm.provider") != std::string::npos);
    }

    SECTION("Unknown log level") {
        const auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"debug\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("logging.level") != std::string::npos);
    }

    SECTION("Every violation is reported") {
        const auto result = ConfigLoader::load_from_string(
            "[server]\nport = 0\nmax_input_length = 0\n[llm]\nmax_retries = -1\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.starts_with("Config validation failed:"));
        CHECK(result.error_message.find("server.port") != std::string::npos);
        CHECK(result.error_message.find("server.max_input_length") != std::string::npos);
        CHECK(result.error_message.find("llm.max_retries") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: parse and file errors", "[config]") {
    const auto bad = ConfigLoader::load_from_string("[server\nport = 1");
    CHECK_FALSE(bad.success);
    CHECK(bad.error_message.starts_with("Failed to parse config:"));

    const auto missing = ConfigLoader::load_from_file("/nonexistent/pii_guard.toml");
    CHECK_FALSE(missing.success);
    CHECK(missing.error_message.starts_with("Failed to load config:"));
}
