#include "detector/http_ner_provider.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "server/http_constants.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace piiguard {

using json = nlohmann::json;

HttpNerProvider::HttpNerProvider(Config config)
    : config_(std::move(config)) {
    if (config_.endpoint.empty()) {
        throw std::invalid_argument("NER endpoint must not be empty");
    }
}

std::vector<NerSpan> HttpNerProvider::parse_response(
    const std::string& body, const std::string& text) {

    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::parse_error& e) {
        throw DetectionError(std::format("NER response is not JSON (byte {})", e.byte));
    }

    if (!doc.is_object() || !doc.contains("entities") || !doc["entities"].is_array()) {
        throw DetectionError("NER response has no entities array");
    }

    std::vector<NerSpan> spans;
    for (const auto& ent : doc["entities"]) {
        if (!ent.is_object()) continue;
        const auto start_it = ent.find("start");
        const auto end_it = ent.find("end");
        const auto label_it = ent.find("label");
        if (start_it == ent.end() || end_it == ent.end() || label_it == ent.end()) continue;
        if (!start_it->is_number_unsigned() || !end_it->is_number_unsigned() ||
            !label_it->is_string()) {
            continue;
        }

        // Offsets arrive as code point indices
        const auto byte_start = utils::utf8_byte_offset(text, start_it->get<size_t>());
        const auto byte_end = utils::utf8_byte_offset(text, end_it->get<size_t>());
        if (byte_start == std::string::npos || byte_end == std::string::npos ||
            byte_end <= byte_start) {
            continue;
        }

        NerSpan span;
        span.start = byte_start;
        span.end = byte_end;
        span.label = label_it->get<std::string>();
        span.text = text.substr(byte_start, byte_end - byte_start);
        spans.push_back(std::move(span));
    }
    return spans;
}

std::vector<NerSpan> HttpNerProvider::annotate(const std::string& text) {
    if (text.empty()) {
        return {};
    }

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));

    const json request = {{"text", text}};
    const auto res = cli.Post(config_.path,
        request.dump(-1, ' ', false, json::error_handler_t::replace), http::kJsonContentType);

    if (!res) {
        throw DetectionError(std::format("NER request failed: {}",
                                         httplib::to_string(res.error())));
    }
    if (res->status != httplib::StatusCode::OK_200) {
        throw DetectionError(std::format("NER request failed: HTTP {}", res->status));
    }

    return parse_response(res->body, text);
}

} // namespace piiguard
