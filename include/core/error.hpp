#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace piiguard {

/**
 * @brief Error categories for the redaction service
 */
enum class ErrorCategory {
    NONE,
    DETECTION_DEGRADED,
    LEAK_CHECK_FAILED,
    RISK_COMPUTATION_FAILED,
    CONFIG_ERROR,
    LLM_ERROR,
    INVALID_REQUEST,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                    return "NONE";
        case ErrorCategory::DETECTION_DEGRADED:      return "DETECTION_DEGRADED";
        case ErrorCategory::LEAK_CHECK_FAILED:       return "LEAK_CHECK_FAILED";
        case ErrorCategory::RISK_COMPUTATION_FAILED: return "RISK_COMPUTATION_FAILED";
        case ErrorCategory::CONFIG_ERROR:            return "CONFIG_ERROR";
        case ErrorCategory::LLM_ERROR:               return "LLM_ERROR";
        case ErrorCategory::INVALID_REQUEST:         return "INVALID_REQUEST";
        case ErrorCategory::INTERNAL_ERROR:          return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Thrown when the detection engine cannot produce a complete result
 *
 * Raised only on the strict path (leak re-scan). Messages carry the failing
 * component, never the scanned text.
 */
class DetectionError : public std::runtime_error {
public:
    explicit DetectionError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace piiguard
