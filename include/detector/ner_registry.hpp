#pragma once

#include "detector/ner_provider.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace piiguard {

enum class NerStatus : uint8_t {
    DISABLED,   // no factory configured
    PENDING,    // factory configured, not yet initialized
    READY,
    DEGRADED    // initialization failed, or the last annotate call failed
};

[[nodiscard]] inline const char* ner_status_to_string(NerStatus status) {
    switch (status) {
        case NerStatus::DISABLED: return "disabled";
        case NerStatus::PENDING:  return "pending";
        case NerStatus::READY:    return "ready";
        case NerStatus::DEGRADED: return "degraded";
        default:                  return "unknown";
    }
}

/**
 * @brief Lazily initialized holder for the process NER provider
 *
 * The factory runs at most once, on first use, behind std::call_once.
 * A factory that throws or returns nullptr leaves the registry degraded for
 * the rest of its life; callers then run pattern-only.
 *
 * Usage:
 *   NerRegistry::instance().set_factory([cfg] {
 *       return std::make_unique<HttpNerProvider>(cfg); });
 *   auto* ner = NerRegistry::instance().provider();   // nullptr if unavailable
 */
class NerRegistry {
public:
    using Factory = std::function<std::unique_ptr<INerProvider>()>;

    NerRegistry() = default;
    explicit NerRegistry(Factory factory) : factory_(std::move(factory)) {}

    NerRegistry(const NerRegistry&) = delete;
    NerRegistry& operator=(const NerRegistry&) = delete;

    static NerRegistry& instance() {
        static NerRegistry registry;
        return registry;
    }

    /**
     * @brief Install the factory; ignored once initialization has run
     */
    void set_factory(Factory factory);

    /**
     * @brief Provider, initializing on first call
     * @return nullptr when disabled or initialization failed
     */
    [[nodiscard]] INerProvider* provider();

    [[nodiscard]] NerStatus status() const;

    // Runtime health, fed by the detection engine
    void record_failure();
    void record_success();

    [[nodiscard]] uint64_t failure_count() const {
        return failures_.load(std::memory_order_relaxed);
    }

private:
    void initialize();

    mutable std::mutex factory_mutex_;
    Factory factory_;
    std::once_flag init_flag_;
    std::unique_ptr<INerProvider> provider_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> init_failed_{false};
    std::atomic<bool> last_call_failed_{false};
    std::atomic<bool> warned_{false};
    std::atomic<uint64_t> failures_{0};
};

} // namespace piiguard
