/**
 * @file outcome.cpp
 * @brief Authentication outcomes implementation
 */

#include "certauth/auth/outcome.h"
#include "certauth/common/exceptions.h"
#include "certauth/x509/certificate.h"

#include <stdexcept>

namespace certauth {
namespace auth {

std::string outcomeKindToString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::NO_RESULT:     return "NO_RESULT";
        case OutcomeKind::REJECTED:      return "REJECTED";
        case OutcomeKind::CHAIN_INVALID: return "CHAIN_INVALID";
        case OutcomeKind::VALID:         return "VALID";
    }
    return "UNKNOWN";
}

// --- ValidationOutcome ---

ValidationOutcome ValidationOutcome::noResult() {
    return ValidationOutcome();
}

ValidationOutcome ValidationOutcome::rejected(std::string reason) {
    ValidationOutcome outcome;
    outcome.kind = OutcomeKind::REJECTED;
    outcome.failureMessage = std::move(reason);
    return outcome;
}

ValidationOutcome ValidationOutcome::chainInvalid(std::vector<validation::ChainStatusEntry> statuses) {
    ValidationOutcome outcome;
    outcome.kind = OutcomeKind::CHAIN_INVALID;
    outcome.failureMessage = CHAIN_INVALID_MESSAGE;
    outcome.chainStatus = std::move(statuses);
    return outcome;
}

ValidationOutcome ValidationOutcome::success(ClaimsPrincipal principal) {
    ValidationOutcome outcome;
    outcome.kind = OutcomeKind::VALID;
    outcome.principal = std::move(principal);
    return outcome;
}

Json::Value ValidationOutcome::toJson() const {
    Json::Value json;
    json["outcome"] = outcomeKindToString(kind);

    if (!failureMessage.empty()) {
        json["message"] = failureMessage;
    }

    if (!chainStatus.empty()) {
        json["chainStatus"] = Json::arrayValue;
        for (const auto& entry : chainStatus) {
            Json::Value item;
            item["status"] = validation::chainStatusFlagToString(entry.status);
            item["detail"] = entry.detail;
            json["chainStatus"].append(item);
        }
    }

    if (principal) {
        json["principal"] = principal->toJson();
    }

    if (!properties.empty()) {
        Json::Value props(Json::objectValue);
        for (const auto& [key, value] : properties) {
            props[key] = value;
        }
        json["properties"] = props;
    }
    return json;
}

// --- FailureInfo ---

Json::Value FailureInfo::toJson() const {
    return common::ErrorResponse(code, message).toJson();
}

// --- AuthenticateResult ---

AuthenticateResult AuthenticateResult::fromOutcome(ValidationOutcome outcome) {
    AuthenticateResult result;
    result.outcome_ = std::move(outcome);
    return result;
}

AuthenticateResult AuthenticateResult::fatal(FailureInfo failure) {
    AuthenticateResult result;
    result.failure_ = std::move(failure);
    return result;
}

const ValidationOutcome& AuthenticateResult::outcome() const {
    if (!outcome_) {
        throw std::logic_error("AuthenticateResult::outcome: result is fatal");
    }
    return *outcome_;
}

const FailureInfo& AuthenticateResult::failure() const {
    if (!failure_) {
        throw std::logic_error("AuthenticateResult::failure: result is not fatal");
    }
    return *failure_;
}

void AuthenticateResult::rethrowIfFatal() const {
    if (!failure_) return;
    if (failure_->exception) {
        std::rethrow_exception(failure_->exception);
    }
    throw common::CertAuthException(failure_->message);
}

Json::Value AuthenticateResult::toJson() const {
    if (failure_) {
        return failure_->toJson();
    }
    Json::Value json = outcome_->toJson();
    json["success"] = outcome_->isValid();
    return json;
}

// --- Response mapping ---

int responseStatusFor(const AuthenticateResult& result) {
    if (result.isFatal()) {
        return 500;
    }
    switch (result.outcome().kind) {
        case OutcomeKind::VALID:         return 200;
        case OutcomeKind::NO_RESULT:     return 0;
        case OutcomeKind::REJECTED:
        case OutcomeKind::CHAIN_INVALID: return challengeStatusCode();
    }
    return 500;
}

std::vector<uint8_t> decodeRawCertificateProperty(const AuthenticationProperties& properties) {
    auto it = properties.find(RAW_CERTIFICATE_PROPERTY);
    if (it == properties.end()) {
        throw common::ParsingException(std::string("Property '") + RAW_CERTIFICATE_PROPERTY +
                                       "' not present");
    }
    return x509::rawDataFromString(it->second);
}

} // namespace auth
} // namespace certauth
