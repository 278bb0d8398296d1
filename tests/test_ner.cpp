#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "detector/http_ner_provider.hpp"
#include "detector/ner_registry.hpp"
#include "mocks/mock_ner_provider.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace piiguard;
using piiguard::testing::MockNerProvider;

// ============================================================================
// Label mapping
// ============================================================================

TEST_CASE("NerProvider: label mapping", "[ner]") {
    CHECK(map_ner_label("PERSON") == EntityClass::PERSON);
    CHECK(map_ner_label("GPE") == EntityClass::LOCATION);
    CHECK(map_ner_label("FAC") == EntityClass::LOCATION);
    CHECK(map_ner_label("NORP") == EntityClass::GROUP);
    CHECK(map_ner_label("CARDINAL") == EntityClass::NUMBER);
    CHECK(map_ner_label("ORDINAL") == EntityClass::NUMBER);
    CHECK_FALSE(map_ner_label("WORK_OF_ART").has_value());
    CHECK_FALSE(map_ner_label("person").has_value());
}

TEST_CASE("NerProvider: raw spans to entity spans", "[ner]") {
    const std::string text = "Priya joined Acme in 2020";
    const auto spans = to_entity_spans({
        {0, 5, "PERSON", "Priya"},
        {13, 17, "ORG", "ignored"},
        {21, 25, "DATE", "2020"},
        {21, 40, "DATE", "out of range"},
        {5, 5, "PERSON", ""},
        {6, 12, "EVENT", "joined"},
    }, text);

    REQUIRE(spans.size() == 3);
    CHECK(spans[0].cls == EntityClass::PERSON);
    // Text comes from the source, not from the recognizer
    CHECK(spans[1].text == "Acme");
    CHECK(spans[2].cls == EntityClass::DATE);
}

// ============================================================================
// NerRegistry
// ============================================================================

TEST_CASE("NerRegistry: lifecycle", "[ner][registry]") {
    SECTION("No factory means disabled") {
        NerRegistry registry;
        CHECK(registry.status() == NerStatus::DISABLED);
        CHECK(registry.provider() == nullptr);
        CHECK(registry.status() == NerStatus::DISABLED);
    }

    SECTION("Pending until first use, then ready") {
        NerRegistry registry([] { return std::make_unique<MockNerProvider>(); });
        CHECK(registry.status() == NerStatus::PENDING);
        REQUIRE(registry.provider() != nullptr);
        CHECK(registry.provider()->name() == "mock");
        CHECK(registry.status() == NerStatus::READY);
    }

    SECTION("Throwing factory leaves the registry degraded") {
        NerRegistry registry([]() -> std::unique_ptr<INerProvider> {
            throw std::runtime_error("model missing");
        });
        CHECK(registry.provider() == nullptr);
        CHECK(registry.status() == NerStatus::DEGRADED);
    }

    SECTION("Factory returning null leaves the registry degraded") {
        NerRegistry registry([] { return std::unique_ptr<INerProvider>(); });
        CHECK(registry.provider() == nullptr);
        CHECK(registry.status() == NerStatus::DEGRADED);
    }

    SECTION("Factory change after initialization is ignored") {
        NerRegistry registry([] { return std::make_unique<MockNerProvider>(); });
        auto* first = registry.provider();
        registry.set_factory([]() -> std::unique_ptr<INerProvider> { return nullptr; });
        CHECK(registry.provider() == first);
    }

    SECTION("Runtime failures flip status until the next success") {
        NerRegistry registry([] { return std::make_unique<MockNerProvider>(); });
        REQUIRE(registry.provider() != nullptr);

        registry.record_failure();
        registry.record_failure();
        CHECK(registry.status() == NerStatus::DEGRADED);
        CHECK(registry.failure_count() == 2);

        registry.record_success();
        CHECK(registry.status() == NerStatus::READY);
    }
}

TEST_CASE("NerRegistry: concurrent first use initializes once", "[ner][registry][concurrency]") {
    std::atomic<int> created{0};
    NerRegistry registry([&created] {
        created.fetch_add(1);
        return std::make_unique<MockNerProvider>();
    });

    std::vector<std::thread> threads;
    std::vector<INerProvider*> seen(8, nullptr);
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&registry, &seen, i] { seen[i] = registry.provider(); });
    }
    for (auto& t : threads) t.join();

    CHECK(created.load() == 1);
    for (auto* p : seen) {
        CHECK(p == seen.front());
    }
}

// ============================================================================
// HttpNerProvider
// ============================================================================

TEST_CASE("HttpNerProvider: response parsing", "[ner][http]") {
    SECTION("Code point offsets become byte offsets") {
        const std::string text = "Caf\xC3\xA9 owner Ana";
        const auto spans = HttpNerProvider::parse_response(
            R"({"entities":[{"start":11,"end":14,"label":"PERSON","text":"Ana"}]})", text);

        REQUIRE(spans.size() == 1);
        CHECK(spans[0].start == 12);
        CHECK(spans[0].end == 15);
        CHECK(spans[0].text == "Ana");
        CHECK(spans[0].label == "PERSON");
    }

    SECTION("Malformed entries are skipped") {
        const auto spans = HttpNerProvider::parse_response(
            R"({"entities":[
                {"start":0,"end":3,"label":"ORG"},
                {"start":2,"end":99,"label":"ORG"},
                {"start":-1,"end":2,"label":"ORG"},
                {"start":1,"end":1,"label":"ORG"},
                {"start":0,"end":2},
                "junk"
            ]})", "abcdef");
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].text == "abc");
    }

    SECTION("Body without an entities array is an error") {
        CHECK_THROWS_AS(HttpNerProvider::parse_response("not json", "x"), DetectionError);
        CHECK_THROWS_AS(HttpNerProvider::parse_response(R"({"spans":[]})", "x"), DetectionError);
        CHECK_THROWS_AS(HttpNerProvider::parse_response("[]", "x"), DetectionError);
    }

    SECTION("Empty entities array") {
        CHECK(HttpNerProvider::parse_response(R"({"entities":[]})", "x").empty());
    }
}

TEST_CASE("HttpNerProvider: configuration and transport", "[ner][http]") {
    CHECK_THROWS_AS(HttpNerProvider(HttpNerProvider::Config{}), std::invalid_argument);

    HttpNerProvider provider({.endpoint = "http://127.0.0.1:1", .path = "/annotate",
                              .timeout_ms = 500});
    CHECK(provider.name() == "http");
    CHECK(provider.annotate("").empty());
    CHECK_THROWS_AS(provider.annotate("Priya"), DetectionError);
}
