#include <catch2/catch_test_macros.hpp>
#include "masking/placeholder.hpp"
#include "masking/placeholder_assigner.hpp"

using namespace piiguard;

// ============================================================================
// Token syntax
// ============================================================================

TEST_CASE("Placeholder: token syntax", "[placeholder]") {
    CHECK(placeholder::make(EntityClass::PERSON, 1) == "[[PERSON_1]]");
    CHECK(placeholder::make(EntityClass::ACCOUNT, 3) == "[[ACC_3]]");
    CHECK(placeholder::make(EntityClass::GENERIC_ID, 12) == "[[ID_12]]");

    CHECK(placeholder::is_token("[[EMAIL_1]]"));
    CHECK(placeholder::is_token("[[GENERIC_ID_2]]"));
    CHECK_FALSE(placeholder::is_token("[[EMAIL_]]"));
    CHECK_FALSE(placeholder::is_token("[[_1]]"));
    CHECK_FALSE(placeholder::is_token("[[email_1]]"));
    CHECK_FALSE(placeholder::is_token("[[EMAIL_1]] "));
    CHECK_FALSE(placeholder::is_token(""));
}

TEST_CASE("Placeholder: find_all", "[placeholder]") {
    const std::string text = "Hi [[PERSON_1]], mail [[EMAIL_1]] or [[broken]]";
    const auto tokens = placeholder::find_all(text);

    REQUIRE(tokens.size() == 2);
    CHECK(text.substr(tokens[0].first, tokens[0].second - tokens[0].first) == "[[PERSON_1]]");
    CHECK(text.substr(tokens[1].first, tokens[1].second - tokens[1].first) == "[[EMAIL_1]]");

    CHECK(placeholder::is_inside_token(tokens, tokens[1].first + 2, tokens[1].first + 7));
    CHECK_FALSE(placeholder::is_inside_token(tokens, 0, 2));
    CHECK(placeholder::contains_any(text));
    CHECK_FALSE(placeholder::contains_any("nothing here [[ ]]"));
}

// ============================================================================
// Assignment
// ============================================================================

TEST_CASE("PlaceholderAssigner: per-class counters left to right", "[assigner]") {
    const std::string text = "a@x.com, 9876543210, b@y.com";
    const std::vector<Span> spans = {
        Span(0, 7, EntityClass::EMAIL, "a@x.com"),
        Span(9, 19, EntityClass::PHONE, "9876543210"),
        Span(21, 28, EntityClass::EMAIL, "b@y.com"),
    };

    const auto out = PlaceholderAssigner::assign(text, spans);

    CHECK(out.redacted_text == "[[EMAIL_1]], [[PHONE_1]], [[EMAIL_2]]");
    REQUIRE(out.map.size() == 3);
    REQUIRE(out.map.find("[[EMAIL_2]]") != nullptr);
    CHECK(*out.map.find("[[EMAIL_2]]") == "b@y.com");

    REQUIRE(out.summary.size() == 3);
    CHECK(out.summary[1].placeholder == "[[PHONE_1]]");
    CHECK(out.summary[1].cls == EntityClass::PHONE);
    CHECK(out.summary[1].confidence == PlaceholderAssigner::kSummaryConfidence);
    CHECK(out.summary[1].original_text == "9876543210");
}

TEST_CASE("PlaceholderAssigner: repeated values", "[assigner]") {
    const std::string text = "a@x.com and a@x.com";
    const auto out = PlaceholderAssigner::assign(text, {
        Span(0, 7, EntityClass::EMAIL, "a@x.com"),
        Span(12, 19, EntityClass::EMAIL, "a@x.com"),
    });

    CHECK(out.redacted_text == "[[EMAIL_1]] and [[EMAIL_2]]");
    CHECK(out.map.size() == 2);
    // Entity list and summary hold each (text, class) pair once
    REQUIRE(out.entities.size() == 1);
    CHECK(out.entities[0].text == "a@x.com");
    REQUIRE(out.summary.size() == 1);
    CHECK(out.summary[0].placeholder == "[[EMAIL_1]]");
}

TEST_CASE("PlaceholderAssigner: rehydration restores the original", "[assigner]") {
    const std::string text = "Card 1234 5678 9012 3456, Aadhaar 1234 5678 9012.";
    const auto out = PlaceholderAssigner::assign(text, {
        Span(5, 24, EntityClass::CARD, "1234 5678 9012 3456"),
        Span(34, 48, EntityClass::AADHAAR, "1234 5678 9012"),
    });

    CHECK(out.redacted_text == "Card [[CARD_1]], Aadhaar [[AADHAAR_1]].");
    CHECK(out.map.rehydrate(out.redacted_text) == text);
}

TEST_CASE("PlaceholderAssigner: no spans", "[assigner]") {
    const auto out = PlaceholderAssigner::assign("nothing sensitive", {});
    CHECK(out.redacted_text == "nothing sensitive");
    CHECK(out.map.empty());
    CHECK(out.summary.empty());

    CHECK(PlaceholderAssigner::assign("", {}).redacted_text.empty());
}

TEST_CASE("PlaceholderAssigner: rejects malformed span lists", "[assigner]") {
    const std::string text = "0123456789";

    CHECK_THROWS_AS(PlaceholderAssigner::assign(text, {
        Span(5, 8, EntityClass::NUMBER, "567"),
        Span(0, 3, EntityClass::NUMBER, "012"),
    }), std::invalid_argument);

    CHECK_THROWS_AS(PlaceholderAssigner::assign(text, {
        Span(0, 5, EntityClass::NUMBER, "01234"),
        Span(3, 8, EntityClass::NUMBER, "34567"),
    }), std::invalid_argument);

    CHECK_THROWS_AS(PlaceholderAssigner::assign(text, {
        Span(8, 12, EntityClass::NUMBER, "89"),
    }), std::invalid_argument);
}
