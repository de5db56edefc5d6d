/**
 * @file chain_validator.h
 * @brief Certificate path validation on top of OpenSSL X509_verify_cert
 *
 * Builds a per-attempt X509_STORE from the trust anchor provider, the
 * policy's supplemental store and (when revocation is checked) the CRL
 * provider, then interprets every status the primitive reports.
 *
 * Exactly one build attempt per call; nothing is retried or cached.
 */

#pragma once

#include <openssl/x509.h>

#include "certauth/validation/types.h"
#include "certauth/validation/chain_policy.h"
#include "certauth/validation/providers.h"
#include "certauth/validation/cancellation.h"
#include "certauth/x509/certificate.h"

namespace certauth {
namespace validation {

/**
 * @brief Path validation interface
 *
 * The decision engine only depends on this interface, so hosting
 * applications (and tests) can substitute their own primitive.
 */
class IChainValidator {
public:
    virtual ~IChainValidator() = default;

    /**
     * @brief Validate the path from cert to a trust anchor under policy
     *
     * @param cert Client certificate
     * @param policy Policy for this attempt
     * @param token Cancellation signal; a cancelled build reports CANCELLED
     * @return Result; valid == false carries every reported status
     * @throws common::ChainEngineException on internal primitive failure
     */
    virtual ChainValidationResult validate(const x509::Certificate& cert,
                                           const ChainPolicy& policy,
                                           const CancellationToken& token) const = 0;
};

/**
 * @brief OpenSSL-backed chain validator
 *
 * Usage:
 * @code
 *   auto anchors = StaticTrustAnchorProvider::fromPemBundle("/etc/certauth/ca.pem");
 *   ChainValidator validator(&anchors);
 *   ChainValidationResult result = validator.validate(cert, policy, token);
 * @endcode
 */
class ChainValidator : public IChainValidator {
public:
    /**
     * @brief Constructor
     * @param trustProvider Trust anchor provider (non-owning)
     * @param crlProvider CRL provider (non-owning, may be nullptr: revocation
     *        data is then never available)
     * @throws std::invalid_argument if trustProvider is nullptr
     */
    explicit ChainValidator(const ITrustAnchorProvider* trustProvider,
                            const ICrlProvider* crlProvider = nullptr);

    ChainValidationResult validate(const x509::Certificate& cert,
                                   const ChainPolicy& policy,
                                   const CancellationToken& token) const override;

    /**
     * @brief Map an X509_V_ERR_* code onto a chain status
     * @param error OpenSSL verification error
     * @param mode Revocation mode in effect (Offline reports missing CRLs as OFFLINE_REVOCATION)
     */
    static ChainStatusFlag mapVerifyError(int error, RevocationMode mode);

private:
    const ITrustAnchorProvider* trustProvider_;
    const ICrlProvider* crlProvider_;
};

} // namespace validation
} // namespace certauth
