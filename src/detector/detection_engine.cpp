#include "detector/detection_engine.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include <format>
#include <iterator>

namespace piiguard {

DetectionEngine::DetectionEngine(NerRegistry* ner)
    : ner_(ner) {}

std::vector<Span> DetectionEngine::annotate(INerProvider& provider,
                                            const std::string& text) const {
    auto spans = to_entity_spans(provider.annotate(text), text);
    if (ner_) ner_->record_success();
    return spans;
}

DetectionEngine::Detection DetectionEngine::detect(const std::string& text) const {
    Detection result;
    std::vector<Span> ner_spans;

    if (ner_ != nullptr) {
        if (auto* provider = ner_->provider()) {
            try {
                ner_spans = annotate(*provider, text);
                result.ner_used = true;
            } catch (const std::exception&) {
                ner_->record_failure();
                ner_spans.clear();
                result.degraded = true;
            }
        }
    }

    result.spans = fuser_.fuse(ner_spans, patterns_.scan(text));
    return result;
}

std::vector<Span> DetectionEngine::detect_strict(const std::string& text) const {
    std::vector<Span> ner_spans;

    if (ner_ != nullptr) {
        // An unavailable provider was already reported at init; full pattern
        // coverage still applies
        if (auto* provider = ner_->provider()) {
            try {
                ner_spans = annotate(*provider, text);
            } catch (const DetectionError&) {
                ner_->record_failure();
                throw;
            } catch (const std::exception& e) {
                ner_->record_failure();
                throw DetectionError(std::format("NER provider failed: {}", e.what()));
            }
        }
    }

    try {
        return fuser_.fuse(ner_spans, patterns_.scan(text));
    } catch (const std::exception& e) {
        throw DetectionError(std::format("pattern scan failed: {}", e.what()));
    }
}

std::vector<Span> DetectionEngine::detect_fallback(const std::string& text) const {
    auto spans = patterns_.detect(EntityClass::EMAIL, text);
    auto phones = patterns_.detect(EntityClass::PHONE, text);
    spans.insert(spans.end(),
                 std::make_move_iterator(phones.begin()),
                 std::make_move_iterator(phones.end()));
    return EntityFuser::merge(std::move(spans));
}

} // namespace piiguard
