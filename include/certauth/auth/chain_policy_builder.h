/**
 * @file chain_policy_builder.h
 * @brief Builds the per-attempt chain policy from configuration
 */

#pragma once

#include "certauth/auth/options.h"
#include "certauth/validation/chain_policy.h"
#include "certauth/validation/types.h"
#include "certauth/x509/certificate.h"

#include <string>

namespace certauth {
namespace auth {

/**
 * @brief Build the chain policy for one certificate
 *
 * Starts from the configured revocation flag and mode. Self-signed
 * certificates get revocation mode NO_CHECK, flag ENTIRE_CHAIN, the
 * unknown-authority and end-revocation-unknown relaxations, and themselves
 * as the only supplemental trust anchor. ValidateCertificateUse adds the
 * client authentication OID; ValidateValidityPeriod == false adds
 * IGNORE_NOT_TIME_VALID.
 *
 * @param cert Client certificate
 * @param type Classification of cert
 * @param options Options snapshot for this attempt
 * @return Policy
 */
validation::ChainPolicy buildChainPolicy(const x509::Certificate& cert,
                                         validation::CertificateType type,
                                         const CertificateAuthenticationOptions& options);

/**
 * @brief One-line summary of a policy for decision logging
 *
 * e.g. "mode=NoCheck, flag=EntireChain, relax=[AllowUnknownCertificateAuthority,IgnoreEndRevocationUnknown]"
 */
std::string describeChainPolicy(const validation::ChainPolicy& policy);

} // namespace auth
} // namespace certauth
