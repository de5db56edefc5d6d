/**
 * @file error_codes.h
 * @brief Standardized error codes for unexpected authentication failures
 *
 * Format: COMPONENT_ERROR_TYPE_DETAIL
 * Rejections are not errors and never carry an ErrorCode. A fatal result
 * always answers 500 (see auth::responseStatusFor).
 */

#pragma once

#include <string>
#include <json/json.h>

namespace certauth {
namespace common {

/**
 * @brief Error code enumeration
 */
enum class ErrorCode {
    // Success
    SUCCESS = 0,

    // Configuration Errors (1000-1999)
    CONFIG_INVALID_VALUE = 1001,

    // Chain Engine Errors (2000-2999)
    CHAIN_ENGINE_FAILURE = 2001,

    // Hook Errors (3000-3999)
    HOOK_FAILED = 3001,
    HOOK_INVALID_RESULT = 3002,

    // Parsing Errors (6000-6999)
    PARSE_DER_ERROR = 6001,

    // System Errors (9000-9999)
    SYSTEM_INTERNAL_ERROR = 9001,
    OPERATION_CANCELLED = 9002,
};

/**
 * @brief Convert error code to string
 */
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";

        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";

        case ErrorCode::CHAIN_ENGINE_FAILURE: return "CHAIN_ENGINE_FAILURE";

        case ErrorCode::HOOK_FAILED: return "HOOK_FAILED";
        case ErrorCode::HOOK_INVALID_RESULT: return "HOOK_INVALID_RESULT";

        case ErrorCode::PARSE_DER_ERROR: return "PARSE_DER_ERROR";

        case ErrorCode::SYSTEM_INTERNAL_ERROR: return "SYSTEM_INTERNAL_ERROR";
        case ErrorCode::OPERATION_CANCELLED: return "OPERATION_CANCELLED";
    }
    return "UNKNOWN_ERROR";
}

/**
 * @brief Error response builder
 */
class ErrorResponse {
private:
    ErrorCode code_;
    std::string message_;

public:
    ErrorResponse(ErrorCode code, const std::string& message)
        : code_(code), message_(message) {}

    /**
     * @brief Convert to JSON response
     */
    Json::Value toJson() const {
        Json::Value json;
        json["success"] = false;
        json["error"]["code"] = errorCodeToString(code_);
        json["error"]["numericCode"] = static_cast<int>(code_);
        json["error"]["message"] = message_;
        return json;
    }
};

} // namespace common
} // namespace certauth
