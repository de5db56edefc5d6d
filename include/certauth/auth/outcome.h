/**
 * @file outcome.h
 * @brief Authentication outcomes and the engine's result type
 *
 * Every attempt ends in exactly one of:
 *   - a ValidationOutcome (NO_RESULT, REJECTED, CHAIN_INVALID or VALID), or
 *   - a fatal FailureInfo, for unexpected errors the failure hook did not
 *     handle. The caller decides what to do with it; rethrowIfFatal()
 *     rethrows the original exception unchanged.
 */

#pragma once

#include <exception>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

#include "certauth/auth/claims.h"
#include "certauth/common/error_codes.h"
#include "certauth/validation/types.h"

namespace certauth {
namespace auth {

/// @brief Property key of the raw certificate on a VALID outcome
constexpr const char* RAW_CERTIFICATE_PROPERTY = "Certificate";

/// @brief Failure message of a CHAIN_INVALID outcome
constexpr const char* CHAIN_INVALID_MESSAGE = "Client certificate failed validation.";

/// @brief Auxiliary string properties attached to an outcome
using AuthenticationProperties = std::map<std::string, std::string>;

enum class OutcomeKind {
    NO_RESULT,      ///< Cannot authenticate here; another scheme may try
    REJECTED,       ///< Policy or hook rejection with a reason
    CHAIN_INVALID,  ///< Path validation failed; chainStatus carries the details
    VALID           ///< Authenticated; principal is set
};

/// @brief Convert OutcomeKind to string
std::string outcomeKindToString(OutcomeKind kind);

/**
 * @brief Result of a non-fatal authentication attempt
 */
struct ValidationOutcome {
    OutcomeKind kind = OutcomeKind::NO_RESULT;
    std::string failureMessage;
    std::vector<validation::ChainStatusEntry> chainStatus;
    std::optional<ClaimsPrincipal> principal;
    AuthenticationProperties properties;

    static ValidationOutcome noResult();
    static ValidationOutcome rejected(std::string reason);
    static ValidationOutcome chainInvalid(std::vector<validation::ChainStatusEntry> statuses);
    static ValidationOutcome success(ClaimsPrincipal principal);

    bool isValid() const { return kind == OutcomeKind::VALID; }
    bool isNoResult() const { return kind == OutcomeKind::NO_RESULT; }

    /// @brief REJECTED or CHAIN_INVALID
    bool isRejected() const {
        return kind == OutcomeKind::REJECTED || kind == OutcomeKind::CHAIN_INVALID;
    }

    Json::Value toJson() const;
};

/**
 * @brief Unexpected failure details
 */
struct FailureInfo {
    common::ErrorCode code = common::ErrorCode::SYSTEM_INTERNAL_ERROR;
    std::string message;
    std::exception_ptr exception;  ///< Original exception, rethrown verbatim

    Json::Value toJson() const;
};

/**
 * @brief Engine result: an outcome, or a fatal failure
 */
class AuthenticateResult {
public:
    static AuthenticateResult fromOutcome(ValidationOutcome outcome);
    static AuthenticateResult fatal(FailureInfo failure);

    bool isFatal() const { return failure_.has_value(); }

    /// @throws std::logic_error if isFatal()
    const ValidationOutcome& outcome() const;

    /// @throws std::logic_error if !isFatal()
    const FailureInfo& failure() const;

    /**
     * @brief Rethrow the original exception of a fatal result
     *
     * No-op for non-fatal results. A fatal result without an exception_ptr
     * throws common::CertAuthException with the failure message.
     */
    void rethrowIfFatal() const;

    Json::Value toJson() const;

private:
    std::optional<ValidationOutcome> outcome_;
    std::optional<FailureInfo> failure_;
};

/**
 * @brief Status code for a challenge (and for forbid)
 *
 * The certificate is negotiated at connection level, so there is nothing
 * to challenge for; both map to 403.
 */
inline int challengeStatusCode() { return 403; }

/**
 * @brief HTTP status for a result
 * @return 200 for VALID, 0 for NO_RESULT (no opinion), 403 for REJECTED and
 *         CHAIN_INVALID, 500 for fatal results
 */
int responseStatusFor(const AuthenticateResult& result);

/**
 * @brief Recover the raw DER bytes stored under RAW_CERTIFICATE_PROPERTY
 * @throws common::ParsingException if the property is missing or malformed
 */
std::vector<uint8_t> decodeRawCertificateProperty(const AuthenticationProperties& properties);

} // namespace auth
} // namespace certauth
