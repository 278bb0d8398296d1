#include <catch2/catch_test_macros.hpp>
#include "server/http_server.hpp"
#include "mocks/mock_answer_generator.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

using namespace piiguard;
using json = nlohmann::json;
using piiguard::testing::MockAnswerGenerator;

namespace {

const std::string kContact = "Contact John Doe at john.doe@example.com or call +1 555-123-4567.";

std::shared_ptr<PrivacyPipeline> make_pipeline(std::string reply = "") {
    PipelineComponents components;
    components.detection = std::make_shared<DetectionEngine>();
    components.answer_generator = std::make_shared<MockAnswerGenerator>(std::move(reply));
    return std::make_shared<PrivacyPipeline>(std::move(components));
}

httplib::Request make_request(std::string body) {
    httplib::Request req;
    req.body = std::move(body);
    return req;
}

ServerConfig small_config() {
    ServerConfig cfg;
    cfg.max_input_length = 200;
    return cfg;
}

} // anonymous namespace

TEST_CASE("HttpServer: health", "[http][health]") {
    HttpServer server(make_pipeline(), nullptr, ServerConfig{});
    httplib::Response res;
    server.handle_health(make_request(""), res);

    const auto body = json::parse(res.body);
    CHECK(body["status"] == "ok");
    CHECK(body["ner"] == "disabled");

    SECTION("Reports the registry status") {
        NerRegistry registry([] { return std::unique_ptr<INerProvider>(); });
        HttpServer with_ner(make_pipeline(), &registry, ServerConfig{});
        httplib::Response pending;
        with_ner.handle_health(make_request(""), pending);
        CHECK(json::parse(pending.body)["ner"] == "pending");
    }
}

TEST_CASE("HttpServer: sanitize", "[http][sanitize]") {
    HttpServer server(make_pipeline(), nullptr, small_config());
    httplib::Response res;
    server.handle_sanitize(make_request(json{{"input", kContact}}.dump()), res);

    REQUIRE_FALSE(res.body.empty());
    const auto body = json::parse(res.body);
    CHECK(body["sanitized"] == "Contact [[PERSON_1]] at [[EMAIL_1]] or call [[PHONE_1]].");
    CHECK(body["context"] == "general");
    CHECK(body["risk_score"] == 55);
    CHECK(body["rehydration_map"]["[[EMAIL_1]]"] == "john.doe@example.com");

    REQUIRE(body["entities"].size() == 3);
    CHECK(body["entities"][0]["class"] == "PERSON");
    CHECK(body["entities"][0]["text"] == "John Doe");

    REQUIRE(body["entities_summary"].size() == 3);
    CHECK(body["entities_summary"][1]["placeholder"] == "[[EMAIL_1]]");
    CHECK(body["entities_summary"][1]["original"] == "john.doe@example.com");
}

TEST_CASE("HttpServer: request errors never echo the input", "[http][errors]") {
    HttpServer server(make_pipeline(), nullptr, small_config());

    SECTION("Body is not JSON") {
        httplib::Response res;
        server.handle_sanitize(make_request(R"({"input": "secret@example.com")"), res);
        CHECK(res.status == 400);
        CHECK(json::parse(res.body)["error"] == "invalid_json");
        CHECK(res.body.find("secret") == std::string::npos);
    }

    SECTION("Input is not a string") {
        httplib::Response res;
        server.handle_process(make_request(R"({"input": ["secret@example.com"]})"), res);
        CHECK(res.status == 400);
        CHECK(res.body.find("secret") == std::string::npos);
    }

    SECTION("Input exceeds the configured maximum") {
        httplib::Response res;
        const std::string big(500, 'x');
        server.handle_sanitize(make_request(json{{"input", big}}.dump()), res);
        CHECK(res.status == 413);
        CHECK(json::parse(res.body)["error"] == "input_too_large");
        CHECK(res.body.find("xxxx") == std::string::npos);
    }

    CHECK(server.get_http_stats().requests == 1);
}

TEST_CASE("HttpServer: context", "[http][context]") {
    HttpServer server(make_pipeline(), nullptr, small_config());

    SECTION("From sanitized text") {
        httplib::Response res;
        server.handle_context(make_request(R"({"sanitized":"patient at the hospital"})"), res);
        const auto body = json::parse(res.body);
        CHECK(body["category"] == "medical");
        CHECK(body["confidence"].get<double>() > 0.9);
    }

    SECTION("Missing text is general") {
        httplib::Response res;
        server.handle_context(make_request("{}"), res);
        CHECK(json::parse(res.body)["category"] == "general");
    }
}

TEST_CASE("HttpServer: output filter", "[http][filter]") {
    HttpServer server(make_pipeline(), nullptr, small_config());

    SECTION("Leak") {
        httplib::Response res;
        server.handle_output_filter(
            make_request(R"({"answer":"Mail john.doe@example.com","context":"personal"})"), res);
        const auto body = json::parse(res.body);
        CHECK(body["leak_detected"] == true);
        CHECK(body["safe_sanitized_text"] == LeakDetector::kDefaultRefusal);
        REQUIRE(body["notes"].size() == 1);
        CHECK(body["notes"][0] == "sensitive_entity_detected");
    }

    SECTION("Clean") {
        httplib::Response res;
        server.handle_output_filter(
            make_request(R"({"answer":"Mail [[EMAIL_1]]","context":{"category":"personal"}})"), res);
        const auto body = json::parse(res.body);
        CHECK(body["leak_detected"] == false);
        CHECK(body["safe_sanitized_text"] == "Mail [[EMAIL_1]]");
        CHECK(body["notes"].empty());
    }
}

TEST_CASE("HttpServer: process keeps the map in the process", "[http][process]") {
    HttpServer server(make_pipeline(), nullptr, small_config());
    httplib::Response res;
    server.handle_process(make_request(json{{"input", kContact}}.dump()), res);

    const auto body = json::parse(res.body);
    CHECK(body["sanitized"] == "Contact [[PERSON_1]] at [[EMAIL_1]] or call [[PHONE_1]].");
    CHECK(body["final_text"] == body["sanitized"]);
    CHECK(body["output_filter"]["leak_detected"] == false);
    CHECK(body["risk_score"] == 55);
    CHECK(body["final_risk"] == 0);
    CHECK_FALSE(body.contains("rehydration_map"));
    CHECK(res.body.find("john.doe@example.com") == std::string::npos);
}

TEST_CASE("HttpServer: process never returns a refused answer", "[http][process]") {
    HttpServer server(make_pipeline("You can reach them at john.doe@example.com"), nullptr,
                      small_config());
    httplib::Response res;
    server.handle_process(make_request(json{{"input", kContact}}.dump()), res);

    const auto body = json::parse(res.body);
    CHECK(body["output_filter"]["leak_detected"] == true);
    CHECK(body["final_text"] == LeakDetector::kDefaultRefusal);
    CHECK(body["llm"]["answer"] == LeakDetector::kDefaultRefusal);
    CHECK(res.body.find("john.doe@example.com") == std::string::npos);
}
