/**
 * @file decision_engine.h
 * @brief Client certificate authentication decision engine
 *
 * Flow per attempt:
 *   channel secured? -> certificate present? -> classify + policy gate
 *   -> build chain policy -> validate chain -> validate hook / default claims
 * Any unexpected error goes through the failure hook; if the hook does not
 * supply an outcome the result is fatal.
 *
 * Usage:
 * @code
 *   auto anchors = validation::StaticTrustAnchorProvider::fromPemBundle(bundlePath);
 *   validation::ChainValidator validator(&anchors);
 *   CertificateAuthenticationEngine engine(
 *       CertificateAuthenticationOptions::fromEnvironment(), &validator);
 *
 *   AuthenticateResult result = engine.authenticate({true, clientCertDer, {}});
 *   result.rethrowIfFatal();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "certauth/auth/hooks.h"
#include "certauth/auth/options.h"
#include "certauth/auth/outcome.h"
#include "certauth/validation/cancellation.h"
#include "certauth/validation/chain_validator.h"

namespace certauth {
namespace auth {

/**
 * @brief What the transport layer knows about the request
 */
struct AuthenticationRequest {
    bool channelSecured = false;
    std::optional<std::vector<uint8_t>> clientCertificate;  ///< DER; empty counts as absent
    std::map<std::string, std::string> context;             ///< Passed through to hooks
};

/**
 * @brief Certificate authentication engine
 *
 * Stateless between attempts; safe to share across threads as long as the
 * validator and hooks are.
 */
class CertificateAuthenticationEngine {
public:
    /// Interval at which hook futures are re-checked against the cancellation token
    static constexpr std::chrono::milliseconds HOOK_POLL_INTERVAL{20};

    /**
     * @brief Constructor
     * @param options Options source, read once per attempt
     * @param validator Chain validator (non-owning)
     * @param events Hooks (default: none)
     * @throws std::invalid_argument if options or validator is nullptr
     */
    CertificateAuthenticationEngine(std::shared_ptr<OptionsMonitor> options,
                                    const validation::IChainValidator* validator,
                                    CertificateAuthenticationEvents events = {});

    /**
     * @brief Constructor with a fixed options snapshot
     * @throws common::ConfigException if options are inconsistent
     * @throws std::invalid_argument if validator is nullptr
     */
    CertificateAuthenticationEngine(CertificateAuthenticationOptions options,
                                    const validation::IChainValidator* validator,
                                    CertificateAuthenticationEvents events = {});

    /**
     * @brief Run one authentication attempt
     *
     * Never throws for failures inside the attempt; they come back as a
     * fatal AuthenticateResult carrying the original exception.
     */
    AuthenticateResult authenticate(
        const AuthenticationRequest& request,
        const validation::CancellationToken& token = validation::CancellationToken::none()) const;

private:
    ValidationOutcome decide(const AuthenticationRequest& request,
                             const std::shared_ptr<const CertificateAuthenticationOptions>& options,
                             const validation::CancellationToken& token) const;

    AuthenticateResult handleFailure(std::exception_ptr error,
                                     const AuthenticationRequest& request,
                                     const std::shared_ptr<const CertificateAuthenticationOptions>& options,
                                     const validation::CancellationToken& token) const;

    std::shared_ptr<OptionsMonitor> options_;
    const validation::IChainValidator* validator_;
    CertificateAuthenticationEvents events_;
};

/**
 * @brief Classify an exception into failure details
 * @param error Non-null exception
 */
FailureInfo describeFailure(std::exception_ptr error);

} // namespace auth
} // namespace certauth
