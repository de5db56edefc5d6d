/**
 * @file chain_policy.h
 * @brief Chain validation policy for a single authentication attempt
 */

#pragma once

#include <set>
#include <string>
#include <vector>

#include "certauth/validation/types.h"
#include "certauth/x509/certificate.h"

namespace certauth {
namespace validation {

/// @brief Client authentication extended key usage (id-kp-clientAuth)
constexpr const char* CLIENT_AUTHENTICATION_OID = "1.3.6.1.5.5.7.3.2";

/**
 * @brief Parameters handed to the chain validator
 *
 * Built fresh per attempt and discarded afterwards.
 */
struct ChainPolicy {
    RevocationFlag revocationFlag = RevocationFlag::EXCLUDE_ROOT;
    RevocationMode revocationMode = RevocationMode::ONLINE_REQUIRED;
    std::set<VerificationFlag> verificationFlags;

    /// Dotted OIDs that must be permitted along the path
    std::vector<std::string> applicationPolicy;

    /// Certificates treated as trust anchors for this validation only
    std::vector<x509::Certificate> extraStore;

    bool hasFlag(VerificationFlag flag) const {
        return verificationFlags.count(flag) > 0;
    }
};

} // namespace validation
} // namespace certauth
