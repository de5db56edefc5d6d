/**
 * @file decision_engine.cpp
 * @brief Client certificate authentication decision engine implementation
 */

#include "certauth/auth/decision_engine.h"
#include "certauth/auth/chain_policy_builder.h"
#include "certauth/auth/claims_mapper.h"
#include "certauth/common/exceptions.h"
#include "certauth/validation/certificate_classifier.h"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace certauth {
namespace auth {

using common::ErrorCode;
using validation::CertificateType;

namespace {

/**
 * @brief Wait for a hook's future while honoring the cancellation token
 * @throws common::HookException if the hook returned no future
 * @throws common::OperationCancelledException if token fires first
 */
HookResult awaitHook(std::future<HookResult>& future, const validation::CancellationToken& token,
                     const std::string& hookName) {
    if (!future.valid()) {
        throw common::HookException(hookName + " returned an invalid future");
    }

    while (true) {
        std::future_status status =
            future.wait_for(CertificateAuthenticationEngine::HOOK_POLL_INTERVAL);
        if (status != std::future_status::timeout) {
            // ready, or deferred (runs on get())
            break;
        }
        if (token.isCancelled()) {
            throw common::OperationCancelledException(hookName + ": " + token.reason());
        }
    }
    return future.get();
}

void attachRawCertificate(ValidationOutcome& outcome, const x509::Certificate& cert) {
    outcome.properties[RAW_CERTIFICATE_PROPERTY] = cert.rawDataString();
}

void logChainFailure(const x509::Certificate& cert, const validation::ChainValidationResult& result) {
    std::string scope = cert.sha256Fingerprint();
    spdlog::warn("[{}] Client certificate failed validation, subject was {}",
                 scope, cert.subjectName());
    for (const auto& entry : result.statuses) {
        spdlog::warn("[{}] {} {}", scope,
                     validation::chainStatusFlagToString(entry.status), entry.detail);
    }
}

} // namespace

FailureInfo describeFailure(std::exception_ptr error) {
    FailureInfo info;
    info.exception = error;

    try {
        std::rethrow_exception(error);
    } catch (const common::ParsingException& e) {
        info.code = ErrorCode::PARSE_DER_ERROR;
        info.message = e.what();
    } catch (const common::ConfigException& e) {
        info.code = ErrorCode::CONFIG_INVALID_VALUE;
        info.message = e.what();
    } catch (const common::ChainEngineException& e) {
        info.code = ErrorCode::CHAIN_ENGINE_FAILURE;
        info.message = e.what();
    } catch (const common::HookException& e) {
        info.code = ErrorCode::HOOK_INVALID_RESULT;
        info.message = e.what();
    } catch (const common::OperationCancelledException& e) {
        info.code = ErrorCode::OPERATION_CANCELLED;
        info.message = e.what();
    } catch (const std::exception& e) {
        info.code = ErrorCode::SYSTEM_INTERNAL_ERROR;
        info.message = e.what();
    } catch (...) {
        info.code = ErrorCode::SYSTEM_INTERNAL_ERROR;
        info.message = "Unknown exception";
    }
    return info;
}

CertificateAuthenticationEngine::CertificateAuthenticationEngine(
    std::shared_ptr<OptionsMonitor> options,
    const validation::IChainValidator* validator,
    CertificateAuthenticationEvents events)
    : options_(std::move(options))
    , validator_(validator)
    , events_(std::move(events))
{
    if (!options_) {
        throw std::invalid_argument("CertificateAuthenticationEngine: options cannot be nullptr");
    }
    if (!validator_) {
        throw std::invalid_argument("CertificateAuthenticationEngine: validator cannot be nullptr");
    }
}

CertificateAuthenticationEngine::CertificateAuthenticationEngine(
    CertificateAuthenticationOptions options,
    const validation::IChainValidator* validator,
    CertificateAuthenticationEvents events)
    : CertificateAuthenticationEngine(std::make_shared<OptionsMonitor>(std::move(options)),
                                      validator, std::move(events))
{
}

AuthenticateResult CertificateAuthenticationEngine::authenticate(
    const AuthenticationRequest& request,
    const validation::CancellationToken& token) const {
    // One snapshot per attempt, even if the monitor is updated meanwhile
    std::shared_ptr<const CertificateAuthenticationOptions> options = options_->current();

    try {
        return AuthenticateResult::fromOutcome(decide(request, options, token));
    } catch (...) {
        return handleFailure(std::current_exception(), request, options, token);
    }
}

ValidationOutcome CertificateAuthenticationEngine::decide(
    const AuthenticationRequest& request,
    const std::shared_ptr<const CertificateAuthenticationOptions>& options,
    const validation::CancellationToken& token) const {

    // Step 1: Channel
    if (!request.channelSecured) {
        spdlog::info("Request channel is not secured, no client certificate available.");
        return ValidationOutcome::noResult();
    }

    // Step 2: Certificate presence
    if (!request.clientCertificate || request.clientCertificate->empty()) {
        spdlog::debug("No client certificate found.");
        return ValidationOutcome::noResult();
    }

    x509::Certificate cert = x509::Certificate::fromDer(*request.clientCertificate);

    // Step 3: Policy gate (before any chain work)
    CertificateType type = validation::classifyCertificate(cert);

    if (type == CertificateType::SELF_SIGNED &&
        !options->allowedCertificateTypes.contains(CertificateType::SELF_SIGNED)) {
        spdlog::warn("Self signed certificate rejected, subject was {}", cert.subjectName());
        return ValidationOutcome::rejected("self-signed not permitted");
    }
    if (type == CertificateType::CHAINED &&
        !options->allowedCertificateTypes.contains(CertificateType::CHAINED)) {
        spdlog::warn("Chained certificate rejected, subject was {}", cert.subjectName());
        return ValidationOutcome::rejected("chained not permitted");
    }

    // Step 4: Chain
    validation::ChainPolicy policy = buildChainPolicy(cert, type, *options);
    spdlog::debug("Chain policy: {}", describeChainPolicy(policy));
    validation::ChainValidationResult chainResult = validator_->validate(cert, policy, token);

    if (!chainResult.valid) {
        logChainFailure(cert, chainResult);
        return ValidationOutcome::chainInvalid(chainResult.statuses);
    }

    spdlog::debug("Client certificate chain built: type={}, path={}, depth={}",
                  validation::certificateTypeToString(type), chainResult.path, chainResult.depth);

    // Step 5: Validate hook, then default claims
    if (events_.onValidateCertificate.isSet()) {
        ValidateCertificateContext context{cert, request.context, options, token};
        std::future<HookResult> pending = events_.onValidateCertificate.tryValidate(std::move(context));
        HookResult hookOutcome = awaitHook(pending, token, "Validate certificate hook");

        if (hookOutcome && !hookOutcome->isNoResult()) {
            spdlog::debug("Validate certificate hook decided: outcome={}",
                          outcomeKindToString(hookOutcome->kind));
            if (hookOutcome->isValid()) {
                if (!hookOutcome->principal) {
                    throw common::HookException("Validate certificate hook returned VALID without a principal");
                }
                attachRawCertificate(*hookOutcome, cert);
            }
            return *hookOutcome;
        }
    }

    ValidationOutcome outcome =
        ValidationOutcome::success(createPrincipal(cert, options->claimsIssuer));
    attachRawCertificate(outcome, cert);

    spdlog::debug("Client certificate authenticated: subject={}, thumbprint={}",
                  cert.subjectName(), cert.thumbprint());
    return outcome;
}

AuthenticateResult CertificateAuthenticationEngine::handleFailure(
    std::exception_ptr error,
    const AuthenticationRequest& request,
    const std::shared_ptr<const CertificateAuthenticationOptions>& options,
    const validation::CancellationToken& token) const {

    FailureInfo failure = describeFailure(error);
    spdlog::error("Certificate authentication failed: code={}, message={}",
                  common::errorCodeToString(failure.code), failure.message);

    if (!events_.onAuthenticationFailed.isSet()) {
        return AuthenticateResult::fatal(std::move(failure));
    }

    try {
        AuthenticationFailedContext context{failure, request.context, options, token};
        std::future<HookResult> pending = events_.onAuthenticationFailed.tryRecover(std::move(context));
        HookResult recovered = awaitHook(pending, token, "Authentication failed hook");

        if (recovered) {
            spdlog::info("Authentication failure handled by hook: outcome={}",
                         outcomeKindToString(recovered->kind));
            return AuthenticateResult::fromOutcome(std::move(*recovered));
        }
    } catch (const common::OperationCancelledException& e) {
        spdlog::warn("Authentication failed hook abandoned: {}", e.what());
        return AuthenticateResult::fatal(std::move(failure));
    } catch (...) {
        FailureInfo hookFailure = describeFailure(std::current_exception());
        hookFailure.code = ErrorCode::HOOK_FAILED;
        spdlog::error("Authentication failed hook threw: {}", hookFailure.message);
        return AuthenticateResult::fatal(std::move(hookFailure));
    }

    return AuthenticateResult::fatal(std::move(failure));
}

} // namespace auth
} // namespace certauth
