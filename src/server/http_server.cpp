#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace piiguard {

using json = nlohmann::json;

namespace {

constexpr auto kDumpErrors = json::error_handler_t::replace;

std::string dump(const json& body) {
    return body.dump(-1, ' ', false, kDumpErrors);
}

/**
 * @brief Parse a request body as a JSON object
 */
Result<json> parse_body(const std::string& body) {
    json parsed = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Result<json>::error(ErrorCategory::INVALID_REQUEST,
                                   "Request body must be a JSON object");
    }
    return Result<json>::ok(std::move(parsed));
}

/**
 * @brief First present field among names; absent or null reads as empty
 * @return nullopt when a present field is not a string
 */
std::optional<std::string> text_field(const json& body,
                                      std::initializer_list<const char*> names) {
    for (const char* name : names) {
        const auto it = body.find(name);
        if (it == body.end() || it->is_null()) continue;
        if (!it->is_string()) return std::nullopt;
        auto value = it->get<std::string>();
        if (!value.empty()) return value;
    }
    return std::string{};
}

/**
 * @brief Context hint from {"context": "medical"} or {"context": {"category": ...}}
 */
Context context_hint(const json& body) {
    Context ctx;
    const auto it = body.find("context");
    if (it == body.end()) return ctx;
    if (it->is_string()) {
        ctx.category = it->get<std::string>();
    } else if (it->is_object()) {
        if (auto cat = it->find("category"); cat != it->end() && cat->is_string()) {
            ctx.category = cat->get<std::string>();
        }
        if (auto conf = it->find("confidence"); conf != it->end() && conf->is_number()) {
            ctx.confidence = conf->get<double>();
        }
    }
    if (ctx.category.empty()) ctx.category = "general";
    return ctx;
}

json summary_to_json(const std::vector<EntitySummaryRecord>& summary, bool with_original) {
    json out = json::array();
    for (const auto& record : summary) {
        json item = {
            {"class", entity_class_to_string(record.cls)},
            {"placeholder", record.placeholder},
            {"confidence", record.confidence},
        };
        if (with_original) {
            item["original"] = record.original_text;
        }
        out.push_back(std::move(item));
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Construction / lifecycle
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<PrivacyPipeline> pipeline,
                       NerRegistry* ner,
                       ServerConfig config)
    : pipeline_(std::move(pipeline)),
      ner_(ner),
      config_(std::move(config)) {
    if (!pipeline_) {
        throw std::invalid_argument("HttpServer requires a pipeline");
    }
}

HttpServer::~HttpServer() = default;

void HttpServer::start() {
    httplib::Server* svr = nullptr;
    {
        std::lock_guard lock(server_mutex_);
        server_ = std::make_unique<httplib::Server>();
        svr = server_.get();
    }

    const auto pool_size = static_cast<size_t>(config_.thread_pool_size);
    svr->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    // JSON escaping can expand text up to six bytes per input byte
    svr->set_payload_max_length(static_cast<size_t>(config_.max_input_length) * 6 + 4096);

    register_routes(*svr);

    utils::log::info(std::format("Starting PII Guard on {}:{} ({} threads)",
                                 config_.host, config_.port, config_.thread_pool_size));

    running_.store(true, std::memory_order_release);
    const bool listened = svr->listen(config_.host, static_cast<int>(config_.port));
    running_.store(false, std::memory_order_release);

    if (!listened) {
        throw std::runtime_error("Failed to start HTTP server");
    }
}

void HttpServer::stop() {
    std::lock_guard lock(server_mutex_);
    if (server_) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Get(http::routes::kHealth, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Post(http::routes::kSanitize, [this](const httplib::Request& req, httplib::Response& res) {
        handle_sanitize(req, res);
    });
    svr.Post(http::routes::kContext, [this](const httplib::Request& req, httplib::Response& res) {
        handle_context(req, res);
    });
    svr.Post(http::routes::kOutputFilter, [this](const httplib::Request& req, httplib::Response& res) {
        handle_output_filter(req, res);
    });
    svr.Post(http::routes::kProcess, [this](const httplib::Request& req, httplib::Response& res) {
        handle_process(req, res);
    });
}

void HttpServer::reply_error(httplib::Response& res, int status,
                             const char* code, const char* message) {
    if (status == httplib::StatusCode::PayloadTooLarge_413) {
        too_large_.fetch_add(1, std::memory_order_relaxed);
    } else if (status >= 500) {
        internal_errors_.fetch_add(1, std::memory_order_relaxed);
    } else {
        bad_requests_.fetch_add(1, std::memory_order_relaxed);
    }
    res.status = status;
    res.set_content(dump({{"error", code}, {"message", message}}), http::kJsonContentType);
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);
    const NerStatus ner = ner_ ? ner_->status() : NerStatus::DISABLED;
    res.set_content(dump({{"status", "ok"}, {"ner", ner_status_to_string(ner)}}),
                    http::kJsonContentType);
}

void HttpServer::handle_sanitize(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    const auto body = parse_body(req.body);
    if (body.is_error()) {
        reply_error(res, httplib::StatusCode::BadRequest_400, "invalid_json",
                    "Request body must be a JSON object");
        return;
    }
    const auto text = text_field(body.value(), {"input"});
    if (!text) {
        reply_error(res, httplib::StatusCode::BadRequest_400, "invalid_field",
                    "Field 'input' must be a string");
        return;
    }
    if (text->size() > static_cast<size_t>(config_.max_input_length)) {
        reply_error(res, httplib::StatusCode::PayloadTooLarge_413, "input_too_large",
                    "Field 'input' exceeds the configured maximum length");
        return;
    }

    try {
        auto result = pipeline_->sanitize(*text);

        json entities = json::array();
        for (const auto& entity : result.entities) {
            entities.push_back({{"text", entity.text},
                                {"class", entity_class_to_string(entity.cls)}});
        }
        json rehydration = json::object();
        for (const auto& [token, original] : result.map.entries()) {
            rehydration[token] = original;
        }

        json out = {
            {"sanitized", result.redacted_text},
            {"entities", std::move(entities)},
            {"entities_summary", summary_to_json(result.summary, true)},
            {"context", result.context.category},
            {"confidence", result.context.confidence},
            {"risk_score", result.risk_score},
            {"degraded", result.degraded},
            {"rehydration_map", std::move(rehydration)},
        };
        result.map.clear();

        res.set_content(dump(out), http::kJsonContentType);
        utils::log::info(std::format("sanitize: input_len={} risk={} category={}",
                                     text->size(), result.risk_score, result.context.category));
    } catch (const std::exception& e) {
        utils::log::error(std::format("[{}] sanitize failed: {}",
            error_category_to_string(ErrorCategory::INTERNAL_ERROR), e.what()));
        reply_error(res, httplib::StatusCode::InternalServerError_500, "internal_error",
                    "Sanitization failed");
    }
}

void HttpServer::handle_context(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    const auto body = parse_body(req.body);
    if (body.is_error()) {
        reply_error(res, httplib::StatusCode::BadRequest_400, "invalid_json",
                    "Request body must be a JSON object");
        return;
    }
    const auto text = text_field(body.value(), {"input", "sanitized"});
    if (!text) {
        reply_error(res, httplib::StatusCode::BadRequest_400, "invalid_field",
                    "Fields 'input' and 'sanitized' must be strings");
        return;
    }
    if (text->size() > static_cast<size_t>(config_.max_input_length)) {
        reply_error(res, httplib::StatusCode::PayloadTooLarge_413, "input_too_large",
                    "Input exceeds the configured maximum length");
        return;
    }

    const auto classification = pipeline_->classify(*text);
    res.set_content(dump({{"category", classification.context.category},
                          {"confidence", classification.context.confidence}}),
                    http::kJsonContentType);
    utils::log::info(std::format("context: category={} confidence={:.2f}",
                                 classification.context.category,
                                 classification.context.confidence));
}

void HttpServer::handle_output_filter(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    const auto body = parse_body(req.body);
    if (body.is_error()) {
        reply_error(res, httplib::StatusCode::BadRequest_400, "invalid_json",
                    "Request body must be a JSON object");
        return;
    }
    const auto answer = text_field(body.value(), {"answer"});
    if (!answer) {
        reply_error(res, httplib::StatusCode::BadRequest_400, "invalid_field",
                    "Field 'answer' must be a string");
        return;
    }
    if (answer->size() > static_cast<size_t>(config_.max_input_length)) {
        reply_error(res, httplib::StatusCode::PayloadTooLarge_413, "input_too_large",
                    "Field 'answer' exceeds the configured maximum length");
        return;
    }

    try {
        const auto result = pipeline_->check_and_filter(*answer, context_hint(body.value()));
        json notes = json::array();
        if (result.note) {
            notes.push_back(*result.note);
        }
        res.set_content(dump({{"safe_sanitized_text", result.safe_text},
                              {"leak_detected", result.leak_detected},
                              {"notes", std::move(notes)}}),
                        http::kJsonContentType);
    } catch (const std::exception& e) {
        utils::log::error(std::format("[{}] output filter failed: {}",
            error_category_to_string(ErrorCategory::INTERNAL_ERROR), e.what()));
        reply_error(res, httplib::StatusCode::InternalServerError_500, "internal_error",
                    "Output filtering failed");
    }
}

void HttpServer::handle_process(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    const auto body = parse_body(req.body);
    if (body.is_error()) {
        reply_error(res, httplib::StatusCode::BadRequest_400, "invalid_json",
                    "Request body must be a JSON object");
        return;
    }
    const auto text = text_field(body.value(), {"input"});
    if (!text) {
        reply_error(res, httplib::StatusCode::BadRequest_400, "invalid_field",
                    "Field 'input' must be a string");
        return;
    }
    if (text->size() > static_cast<size_t>(config_.max_input_length)) {
        reply_error(res, httplib::StatusCode::PayloadTooLarge_413, "input_too_large",
                    "Field 'input' exceeds the configured maximum length");
        return;
    }

    try {
        const auto result = pipeline_->process(*text);

        json notes = json::array();
        if (result.filter.note) {
            notes.push_back(*result.filter.note);
        }
        json out = {
            {"sanitized", result.sanitized_text},
            {"entities_summary", summary_to_json(result.summary, false)},
            {"context", result.context.category},
            {"confidence", result.context.confidence},
            {"risk_score", result.input_risk},
            {"degraded", result.degraded},
            {"llm", {
                {"answer", result.answer.answer},
                {"confidence", result.answer.confidence},
                {"explanation", result.answer.explanation},
                {"fallback_used", result.answer.fallback_used},
            }},
            {"output_filter", {
                {"safe_sanitized_text", result.filter.safe_text},
                {"leak_detected", result.filter.leak_detected},
                {"notes", std::move(notes)},
            }},
            {"final_text", result.final_text},
            {"final_risk", result.final_risk},
        };
        res.set_content(dump(out), http::kJsonContentType);
    } catch (const std::exception& e) {
        utils::log::error(std::format("[{}] process failed: {}",
            error_category_to_string(ErrorCategory::INTERNAL_ERROR), e.what()));
        reply_error(res, httplib::StatusCode::InternalServerError_500, "internal_error",
                    "Processing failed");
    }
}

} // namespace piiguard
