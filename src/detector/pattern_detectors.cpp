#include "detector/pattern_detectors.hpp"
#include "core/error.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <format>
#include <unordered_set>

namespace piiguard {

namespace {

/**
 * @brief Compile one detector pattern
 *
 * Latin-1 mode matches byte for byte, so offsets are byte offsets into the
 * UTF-8 source and multi-byte literals (currency symbols) match as sequences.
 * @throws DetectionError if the pattern does not compile
 */
std::unique_ptr<const re2::RE2> compile(const std::string& pattern, bool case_sensitive = true) {
    re2::RE2::Options options;
    options.set_encoding(re2::RE2::Options::EncodingLatin1);
    options.set_case_sensitive(case_sensitive);
    options.set_log_errors(false);

    auto re = std::make_unique<const re2::RE2>(pattern, options);
    if (!re->ok()) {
        throw DetectionError(std::format("invalid detector pattern: {}", re->error()));
    }
    return re;
}

/**
 * @brief Every non-overlapping match, left to right
 *
 * A pattern with a capturing group reports group 1 and resumes scanning at
 * its end; the rest of the match is trailing context only.
 */
template<typename Fn>
void for_each_match(const re2::RE2& re, const std::string& text, Fn&& on_match) {
    const int group = re.NumberOfCapturingGroups() > 0 ? 1 : 0;
    const re2::StringPiece input(text.data(), text.size());
    re2::StringPiece m[2];

    size_t pos = 0;
    while (pos < text.size() &&
           re.Match(input, pos, text.size(), re2::RE2::UNANCHORED, m, group + 1)) {
        const auto& hit = m[group];
        if (hit.data() == nullptr || hit.empty()) {
            ++pos;
            continue;
        }
        const auto start = static_cast<size_t>(hit.data() - text.data());
        const auto end = start + hit.size();
        on_match(start, end);
        pos = end;
    }
}

std::vector<Span> find_all(const re2::RE2& re, EntityClass cls, const std::string& text) {
    std::vector<Span> spans;
    for_each_match(re, text, [&](size_t start, size_t end) {
        spans.emplace_back(start, end, cls, text.substr(start, end - start));
    });
    return spans;
}

struct NameToken {
    size_t start;
    size_t end;
    std::string text;
};

bool only_whitespace_between(const std::string& text, size_t from, size_t to) {
    if (from >= to) return false;
    for (size_t i = from; i < to; ++i) {
        const char c = text[i];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return false;
    }
    return true;
}

// Emit 3-token chunks greedily from a run of non-stop-word tokens; a trailing
// 2-token chunk is kept, a trailing single token is dropped.
void emit_name_chunks(const std::vector<NameToken>& run, const std::string& text,
                      std::vector<Span>& out) {
    size_t i = 0;
    while (run.size() - i >= 2) {
        const size_t take = std::min<size_t>(3, run.size() - i);
        const size_t start = run[i].start;
        const size_t end = run[i + take - 1].end;
        out.emplace_back(start, end, EntityClass::PERSON, text.substr(start, end - start));
        i += take;
    }
}

} // anonymous namespace

size_t PatternMatches::total() const {
    size_t n = names.size();
    for (const auto& bucket : by_class) n += bucket.size();
    return n;
}

PatternDetectorSet::PatternDetectorSet() {
    // Local part @ domain with at least one dot, no trailing dot
    email_regex_ = compile(R"([\w.+-]+@[\w-]+(?:\.[\w-]+)+)");

    // Alternatives are tried left to right at each position. Group 1 is the
    // number; the trailing non-digit (or end) keeps a match from stopping
    // inside a longer digit run.
    phone_regex_ = compile(
        R"(((?:\+\d{1,4}\s\d{3}[\s\-]?\d{3}[\s\-]?\d{4}))"
        R"(|(?:\+\d{1,4}[\s\-]\d{3,}[\s\-]?\d{3,}))"
        R"(|(?:\+\d{1,4}[\s\-]?\d{3}[\s\-]?\d{3}[\s\-]?\d{4}))"
        R"(|(?:\b\d{3}[\s\-]?\d{3}[\s\-]?\d{4}\b))"
        R"(|(?:\b\d{10}\b)))"
        R"((?:\D|$))");

    pan_regex_ = compile(R"(\b[A-Z]{5}\d{4}[A-Z]\b)", false);

    ssn_regex_ = compile(R"(\b\d{3}-\d{2}-\d{4}\b)");

    // \b on both ends already rules out an adjacent digit
    aadhaar_regex_ = compile(R"(\b\d{4}[-\s]?\d{4}[-\s]?\d{4}\b)");

    card_regex_ = compile(R"(\b(?:\d{4}[-\s]?){3,4}\d{1,4}\b)");

    // Preceding '+' is checked after matching (no lookbehind)
    account_regex_ = compile(R"(\b\d{9,18}\b)");

    generic_id_regex_ = compile(R"(\b(?:\d{4}[-\s]?){3,}\d{1,4}\b)");

    ip_regex_ = compile(
        R"(\b(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3})"
        R"((?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\b)");

    url_regex_ = compile(R"(https?://[^\s]+)", false);

    // Only the ASCII markers fold case; the symbol bytes must match exactly
    currency_regex_ = compile(
        "(?:\xE2\x82\xB9|(?i:Rs)\\.?|(?i:INR)|\\$|\xC2\xA3|\xE2\x82\xAC)\\s?\\d+(?:,\\d{3})*(?:[.,]\\d{2})?");

    name_token_regex_ = compile(R"(\b[A-Z][a-z]+\b)");
}

PatternDetectorSet::~PatternDetectorSet() = default;
PatternDetectorSet::PatternDetectorSet(PatternDetectorSet&&) noexcept = default;
PatternDetectorSet& PatternDetectorSet::operator=(PatternDetectorSet&&) noexcept = default;

const std::vector<EntityClass>& PatternDetectorSet::priority_order() {
    static const std::vector<EntityClass> order = {
        EntityClass::PAN,
        EntityClass::SSN,
        EntityClass::EMAIL,
        EntityClass::IP,
        EntityClass::URL,
        EntityClass::CURRENCY,
        EntityClass::CARD,
        EntityClass::AADHAAR,
        EntityClass::PHONE,
        EntityClass::ACCOUNT,
        EntityClass::GENERIC_ID
    };
    return order;
}

const re2::RE2* PatternDetectorSet::regex_for(EntityClass cls) const {
    switch (cls) {
        case EntityClass::EMAIL:      return email_regex_.get();
        case EntityClass::PHONE:      return phone_regex_.get();
        case EntityClass::PAN:        return pan_regex_.get();
        case EntityClass::AADHAAR:    return aadhaar_regex_.get();
        case EntityClass::CARD:       return card_regex_.get();
        case EntityClass::ACCOUNT:    return account_regex_.get();
        case EntityClass::SSN:        return ssn_regex_.get();
        case EntityClass::IP:         return ip_regex_.get();
        case EntityClass::URL:        return url_regex_.get();
        case EntityClass::CURRENCY:   return currency_regex_.get();
        case EntityClass::GENERIC_ID: return generic_id_regex_.get();
        case EntityClass::PERSON:
        case EntityClass::ORG:
        case EntityClass::LOCATION:
        case EntityClass::MONEY:
        case EntityClass::DATE:
        case EntityClass::TIME:
        case EntityClass::NUMBER:
        case EntityClass::GROUP:
            return nullptr;
    }
    return nullptr;
}

std::vector<Span> PatternDetectorSet::detect(EntityClass cls, const std::string& text) const {
    const auto* re = regex_for(cls);
    if (re == nullptr || text.empty()) {
        return {};
    }

    auto spans = find_all(*re, cls, text);

    if (cls == EntityClass::ACCOUNT) {
        std::erase_if(spans, [&text](const Span& s) {
            return s.start > 0 && text[s.start - 1] == '+';
        });
    }
    return spans;
}

bool PatternDetectorSet::is_name_stop_word(const std::string& token) {
    static const std::unordered_set<std::string> stop_words = {
        // Articles, demonstratives
        "The", "A", "An", "This", "That",
        // Place-name fragments
        "New", "Old", "North", "South", "East", "West", "United", "States",
        "Kingdom", "Republic", "City", "Street", "Avenue", "Road",
        // Salutations and sentence openers
        "Contact", "Call", "Dear", "Hi", "Hello", "Please", "Thanks", "Thank",
        "My", "Our", "Your", "His", "Her", "Their", "Mr", "Mrs", "Ms", "Dr",
        // Calendar
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday",
        "January", "February", "March", "April", "May", "June", "July",
        "August", "September", "October", "November", "December"
    };
    return stop_words.contains(token);
}

std::vector<Span> PatternDetectorSet::detect_names(const std::string& text) const {
    std::vector<Span> names;
    std::vector<NameToken> run;

    for_each_match(*name_token_regex_, text, [&](size_t start, size_t end) {
        NameToken token{start, end, text.substr(start, end - start)};

        if (is_name_stop_word(token.text)) {
            emit_name_chunks(run, text, names);
            run.clear();
            return;
        }

        if (!run.empty() && !only_whitespace_between(text, run.back().end, token.start)) {
            emit_name_chunks(run, text, names);
            run.clear();
        }
        run.push_back(std::move(token));
    });
    emit_name_chunks(run, text, names);

    return names;
}

PatternMatches PatternDetectorSet::scan(const std::string& text) const {
    PatternMatches matches;
    for (const auto cls : priority_order()) {
        matches.of(cls) = detect(cls, text);
    }
    matches.names = detect_names(text);
    return matches;
}

} // namespace piiguard
