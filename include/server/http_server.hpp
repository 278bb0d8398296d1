#pragma once

#include "config/config_types.hpp"
#include "core/pipeline.hpp"
#include "detector/ner_registry.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace piiguard {

/**
 * @brief HTTP front end for the privacy pipeline
 *
 * Routes (see http_constants.hpp):
 * - GET  /health             service and NER status
 * - POST /api/sanitize       {"input"} -> redacted text, entities, map
 * - POST /api/context        {"input"|"sanitized"} -> category, confidence
 * - POST /api/output-filter  {"answer", "context"?} -> leak-checked text
 * - POST /api/process        {"input"} -> full cycle, no map
 *
 * Error bodies carry a code and a fixed message, never request content.
 * Request text is logged by length only.
 */
class HttpServer {
public:
    /**
     * @param ner Registry reported by /health; nullptr reports "disabled"
     */
    HttpServer(std::shared_ptr<PrivacyPipeline> pipeline,
               NerRegistry* ner,
               ServerConfig config);

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Build the server, register routes and block in listen()
     * @throws std::runtime_error when the socket cannot be bound
     */
    void start();

    /**
     * @brief Stop a running listen(); safe from a signal-watching thread
     */
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(std::memory_order_acquire); }

    // ---- Route handlers (callable without a socket) ------------------------

    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_sanitize(const httplib::Request& req, httplib::Response& res);
    void handle_context(const httplib::Request& req, httplib::Response& res);
    void handle_output_filter(const httplib::Request& req, httplib::Response& res);
    void handle_process(const httplib::Request& req, httplib::Response& res);

    struct HttpStats {
        uint64_t requests;
        uint64_t bad_requests;
        uint64_t too_large;
        uint64_t internal_errors;
    };

    [[nodiscard]] HttpStats get_http_stats() const {
        return {
            .requests = requests_.load(std::memory_order_relaxed),
            .bad_requests = bad_requests_.load(std::memory_order_relaxed),
            .too_large = too_large_.load(std::memory_order_relaxed),
            .internal_errors = internal_errors_.load(std::memory_order_relaxed),
        };
    }

private:
    void register_routes(httplib::Server& svr);

    void reply_error(httplib::Response& res, int status, const char* code, const char* message);

    std::shared_ptr<PrivacyPipeline> pipeline_;
    NerRegistry* ner_;
    ServerConfig config_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> bad_requests_{0};
    std::atomic<uint64_t> too_large_{0};
    std::atomic<uint64_t> internal_errors_{0};
};

} // namespace piiguard
