#include "detector/ner_registry.hpp"
#include "core/utils.hpp"
#include <format>

namespace piiguard {

void NerRegistry::set_factory(Factory factory) {
    if (initialized_.load(std::memory_order_acquire)) {
        utils::log::warn("NER factory change ignored: provider already initialized");
        return;
    }
    std::lock_guard lock(factory_mutex_);
    factory_ = std::move(factory);
}

void NerRegistry::initialize() {
    Factory factory;
    {
        std::lock_guard lock(factory_mutex_);
        factory = factory_;
    }

    if (factory) {
        try {
            provider_ = factory();
            if (!provider_) {
                init_failed_.store(true, std::memory_order_relaxed);
                utils::log::warn("NER provider unavailable: factory returned no provider, "
                                 "running pattern-only");
            } else {
                utils::log::info(std::format("NER provider '{}' initialized", provider_->name()));
            }
        } catch (const std::exception& e) {
            provider_.reset();
            init_failed_.store(true, std::memory_order_relaxed);
            utils::log::warn(std::format("NER provider unavailable: {}, running pattern-only",
                                         e.what()));
        }
    }
    initialized_.store(true, std::memory_order_release);
}

INerProvider* NerRegistry::provider() {
    std::call_once(init_flag_, [this] { initialize(); });
    return provider_.get();
}

NerStatus NerRegistry::status() const {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::lock_guard lock(factory_mutex_);
        return factory_ ? NerStatus::PENDING : NerStatus::DISABLED;
    }
    if (init_failed_.load(std::memory_order_relaxed) ||
        last_call_failed_.load(std::memory_order_relaxed)) {
        return NerStatus::DEGRADED;
    }
    return provider_ ? NerStatus::READY : NerStatus::DISABLED;
}

void NerRegistry::record_failure() {
    failures_.fetch_add(1, std::memory_order_relaxed);
    last_call_failed_.store(true, std::memory_order_relaxed);
    // Warn once per process; later failures only count
    if (!warned_.exchange(true, std::memory_order_relaxed)) {
        utils::log::warn("NER annotation failed, degrading to pattern-only detection");
    }
}

void NerRegistry::record_success() {
    last_call_failed_.store(false, std::memory_order_relaxed);
}

} // namespace piiguard
