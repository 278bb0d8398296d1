#include <catch2/catch_test_macros.hpp>
#include "detector/pattern_detectors.hpp"

using namespace piiguard;

namespace {

std::vector<std::string> texts(const std::vector<Span>& spans) {
    std::vector<std::string> out;
    out.reserve(spans.size());
    for (const auto& s : spans) out.push_back(s.text);
    return out;
}

} // anonymous namespace

// ============================================================================
// Structured classes
// ============================================================================

TEST_CASE("PatternDetectors: email", "[pattern][email]") {
    PatternDetectorSet detectors;

    SECTION("Plus and dots in local part, multi-label domain") {
        const auto spans = detectors.detect(EntityClass::EMAIL,
                                            "Mail a.b+c@mail.example.co.in now");
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].text == "a.b+c@mail.example.co.in");
        CHECK(spans[0].cls == EntityClass::EMAIL);
    }

    SECTION("Trailing sentence dot is not part of the address") {
        const auto spans = detectors.detect(EntityClass::EMAIL, "write to x@y.com.");
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].text == "x@y.com");
    }

    SECTION("Domain without a dot is not an email") {
        CHECK(detectors.detect(EntityClass::EMAIL, "user@localhost").empty());
    }
}

TEST_CASE("PatternDetectors: phone", "[pattern][phone]") {
    PatternDetectorSet detectors;

    CHECK(texts(detectors.detect(EntityClass::PHONE, "call +1 555-123-4567.")) ==
          std::vector<std::string>{"+1 555-123-4567"});
    CHECK(texts(detectors.detect(EntityClass::PHONE, "mobile +91 98765 43210")) ==
          std::vector<std::string>{"+91 98765 43210"});
    CHECK(texts(detectors.detect(EntityClass::PHONE, "ring 9876543210 today")) ==
          std::vector<std::string>{"9876543210"});
    CHECK(detectors.detect(EntityClass::PHONE, "room 42").empty());
}

TEST_CASE("PatternDetectors: government identifiers", "[pattern]") {
    PatternDetectorSet detectors;

    SECTION("PAN, case-insensitive") {
        CHECK(texts(detectors.detect(EntityClass::PAN, "PAN ABCDE1234F")) ==
              std::vector<std::string>{"ABCDE1234F"});
        CHECK(texts(detectors.detect(EntityClass::PAN, "pan abcde1234f")) ==
              std::vector<std::string>{"abcde1234f"});
    }

    SECTION("SSN") {
        CHECK(texts(detectors.detect(EntityClass::SSN, "SSN 123-45-6789")) ==
              std::vector<std::string>{"123-45-6789"});
        CHECK(detectors.detect(EntityClass::SSN, "123-456-789").empty());
    }

    SECTION("Aadhaar, separated or not") {
        CHECK(texts(detectors.detect(EntityClass::AADHAAR, "Aadhaar: 1234 5678 9012")) ==
              std::vector<std::string>{"1234 5678 9012"});
        CHECK(texts(detectors.detect(EntityClass::AADHAAR, "id 123456789012")) ==
              std::vector<std::string>{"123456789012"});
    }
}

TEST_CASE("PatternDetectors: card and account", "[pattern][card]") {
    PatternDetectorSet detectors;

    CHECK(texts(detectors.detect(EntityClass::CARD, "Card: 1234 5678 9012 3456 ok")) ==
          std::vector<std::string>{"1234 5678 9012 3456"});
    CHECK(texts(detectors.detect(EntityClass::CARD, "1234-5678-9012-3456")) ==
          std::vector<std::string>{"1234-5678-9012-3456"});
    CHECK(texts(detectors.detect(EntityClass::ACCOUNT, "acct 123456789 end")) ==
          std::vector<std::string>{"123456789"});

    SECTION("Account digits right after '+' are a phone, not an account") {
        CHECK(detectors.detect(EntityClass::ACCOUNT, "+919876543210").empty());
    }

    SECTION("Eight digits are too short for an account") {
        CHECK(detectors.detect(EntityClass::ACCOUNT, "pin 12345678").empty());
    }
}

TEST_CASE("PatternDetectors: network identifiers", "[pattern]") {
    PatternDetectorSet detectors;

    CHECK(texts(detectors.detect(EntityClass::IP, "server 192.168.1.10 down")) ==
          std::vector<std::string>{"192.168.1.10"});
    CHECK(detectors.detect(EntityClass::IP, "999.1.1.1").empty());

    CHECK(texts(detectors.detect(EntityClass::URL, "see https://example.com/path?q=1 now")) ==
          std::vector<std::string>{"https://example.com/path?q=1"});
    CHECK(texts(detectors.detect(EntityClass::URL, "HTTP://EXAMPLE.COM")) ==
          std::vector<std::string>{"HTTP://EXAMPLE.COM"});
}

TEST_CASE("PatternDetectors: currency", "[pattern][currency]") {
    PatternDetectorSet detectors;

    CHECK(texts(detectors.detect(EntityClass::CURRENCY, "Pay $1,200.50 today")) ==
          std::vector<std::string>{"$1,200.50"});
    CHECK(texts(detectors.detect(EntityClass::CURRENCY, "fee Rs. 500 only")) ==
          std::vector<std::string>{"Rs. 500"});
    CHECK(texts(detectors.detect(EntityClass::CURRENCY, "\xE2\x82\xB9" "2000 paid")) ==
          std::vector<std::string>{"\xE2\x82\xB9" "2000"});
    CHECK(texts(detectors.detect(EntityClass::CURRENCY, "\xE2\x82\xAC" "45")) ==
          std::vector<std::string>{"\xE2\x82\xAC" "45"});
}

TEST_CASE("PatternDetectors: NER-only classes have no pattern", "[pattern]") {
    PatternDetectorSet detectors;
    CHECK(detectors.detect(EntityClass::ORG, "Acme Corp").empty());
    CHECK(detectors.detect(EntityClass::DATE, "12 March 2024").empty());
    CHECK(detectors.detect(EntityClass::EMAIL, "").empty());
}

// ============================================================================
// Name fallback
// ============================================================================

TEST_CASE("PatternDetectors: name fallback", "[pattern][names]") {
    PatternDetectorSet detectors;

    SECTION("Salutation word is not part of the name") {
        CHECK(texts(detectors.detect_names("Contact John Doe at home")) ==
              std::vector<std::string>{"John Doe"});
    }

    SECTION("Runs are cut into three-token chunks") {
        CHECK(texts(detectors.detect_names("Alice Mary Jane Smith Brown")) ==
              (std::vector<std::string>{"Alice Mary Jane", "Smith Brown"}));
    }

    SECTION("A trailing single token is dropped") {
        CHECK(texts(detectors.detect_names("Alice Mary Jane Smith")) ==
              std::vector<std::string>{"Alice Mary Jane"});
    }

    SECTION("Single capitalized words are not names") {
        CHECK(detectors.detect_names("Hello Alice, welcome").empty());
        CHECK(detectors.detect_names("New York").empty());
    }

    SECTION("Punctuation breaks a run") {
        CHECK(detectors.detect_names("Alice, Bob").empty());
    }

    SECTION("All-caps words are not name tokens") {
        CHECK(detectors.detect_names("ACME CORP").empty());
    }

    SECTION("Name spans are tagged PERSON") {
        const auto spans = detectors.detect_names("Ravi Kumar");
        REQUIRE(spans.size() == 1);
        CHECK(spans[0].cls == EntityClass::PERSON);
        CHECK(spans[0].start == 0);
        CHECK(spans[0].end == 10);
    }
}

TEST_CASE("PatternDetectors: stop words", "[pattern][names]") {
    CHECK(PatternDetectorSet::is_name_stop_word("Contact"));
    CHECK(PatternDetectorSet::is_name_stop_word("Monday"));
    CHECK_FALSE(PatternDetectorSet::is_name_stop_word("John"));
    CHECK_FALSE(PatternDetectorSet::is_name_stop_word("contact"));
}

// ============================================================================
// Full scan
// ============================================================================

TEST_CASE("PatternDetectors: scan buckets every class", "[pattern][scan]") {
    PatternDetectorSet detectors;
    const auto matches = detectors.scan(
        "Contact John Doe at john.doe@example.com or call +1 555-123-4567.");

    CHECK(matches.of(EntityClass::EMAIL).size() == 1);
    CHECK(matches.of(EntityClass::PHONE).size() == 1);
    CHECK(matches.of(EntityClass::CARD).empty());
    REQUIRE(matches.names.size() == 1);
    CHECK(matches.names[0].text == "John Doe");
    CHECK(matches.total() == 3);
}

TEST_CASE("PatternDetectors: priority order", "[pattern]") {
    const auto& order = PatternDetectorSet::priority_order();
    REQUIRE(order.size() == 11);
    CHECK(order.front() == EntityClass::PAN);
    CHECK(order.back() == EntityClass::GENERIC_ID);
}
