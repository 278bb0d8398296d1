#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/llm_client.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "detector/detection_engine.hpp"
#include "detector/http_ner_provider.hpp"
#include "detector/ner_registry.hpp"
#include "guard/safety_rewriter.hpp"
#include "server/http_server.hpp"

#include <csignal>
#include <cstdlib>
#include <format>
#include <memory>

using namespace piiguard;

// Global instance for signal handling
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
    exit(0);
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("PII Guard starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/pii_guard.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        // =====================================================================
        // [1/4] Configuration
        // =====================================================================
        utils::log::info(std::format("[1/4] Loading configuration from {}", config_file));

        GuardConfig cfg;
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (config_result.success) {
            cfg = std::move(config_result.config);
            utils::log::info("Config loaded");
        } else {
            utils::log::error(std::format("[{}] {}",
                error_category_to_string(ErrorCategory::CONFIG_ERROR),
                config_result.error_message));
            utils::log::warn("Starting with default configuration");
        }

        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }

        // =====================================================================
        // [2/4] Detection (patterns + optional NER)
        // =====================================================================
        utils::log::info("[2/4] Detection engine initializing...");

        NerRegistry* ner = nullptr;
        if (cfg.detection.ner_enabled) {
            HttpNerProvider::Config ner_config{
                .endpoint = cfg.detection.ner_endpoint,
                .path = cfg.detection.ner_path,
                .timeout_ms = static_cast<uint32_t>(cfg.detection.ner_timeout_ms),
            };
            NerRegistry::instance().set_factory([ner_config] {
                return std::make_unique<HttpNerProvider>(ner_config);
            });
            ner = &NerRegistry::instance();
            utils::log::info(std::format("NER: {}{}", cfg.detection.ner_endpoint,
                                         cfg.detection.ner_path));
        } else {
            utils::log::info("NER: disabled, pattern detection only");
        }
        auto detection = std::make_shared<DetectionEngine>(ner);

        // =====================================================================
        // [3/4] Answer generation + pipeline
        // =====================================================================
        utils::log::info("[3/4] Pipeline initializing...");

        LlmClient::Config llm_config;
        llm_config.enabled = cfg.llm.enabled;
        llm_config.provider = cfg.llm.provider;
        llm_config.endpoint = cfg.llm.endpoint;
        llm_config.api_key = cfg.llm.api_key;
        llm_config.default_model = cfg.llm.model;
        llm_config.timeout_ms = static_cast<uint32_t>(cfg.llm.timeout_ms);
        llm_config.max_retries = static_cast<uint32_t>(cfg.llm.max_retries);
        llm_config.max_requests_per_minute = static_cast<uint32_t>(cfg.llm.max_requests_per_minute);
        auto llm = std::make_shared<LlmClient>(llm_config);
        utils::log::info(std::format("LLM: {} ({})", llm->is_enabled() ? "enabled" : "disabled",
                                     llm->name()));

        PipelineComponents components{
            .detection = detection,
            .answer_generator = llm,
            .rewriter = std::make_shared<PassthroughRewriter>(),
        };
        PipelineOptions options{
            .rehydrate_output = cfg.output.rehydrate_output,
            .refusal_message = cfg.output.refusal_message,
        };
        auto pipeline = std::make_shared<PrivacyPipeline>(std::move(components),
                                                          std::move(options));

        // =====================================================================
        // [4/4] HTTP server
        // =====================================================================
        utils::log::info("[4/4] HTTP server initializing...");

        g_server = std::make_shared<HttpServer>(pipeline, ner, cfg.server);

        utils::log::info(std::format("Server ready on http://{}:{}", cfg.server.host,
                                     cfg.server.port));

        // Start HTTP server (blocking)
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
