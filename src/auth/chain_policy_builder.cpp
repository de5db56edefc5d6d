/**
 * @file chain_policy_builder.cpp
 * @brief Chain policy construction
 */

#include "certauth/auth/chain_policy_builder.h"

namespace certauth {
namespace auth {

using validation::VerificationFlag;

validation::ChainPolicy buildChainPolicy(const x509::Certificate& cert,
                                         validation::CertificateType type,
                                         const CertificateAuthenticationOptions& options) {
    validation::ChainPolicy policy;
    policy.revocationFlag = options.revocationFlag;
    policy.revocationMode = options.revocationMode;

    if (type == validation::CertificateType::SELF_SIGNED) {
        policy.revocationMode = validation::RevocationMode::NO_CHECK;
        policy.revocationFlag = validation::RevocationFlag::ENTIRE_CHAIN;
        policy.verificationFlags.insert(VerificationFlag::ALLOW_UNKNOWN_CERTIFICATE_AUTHORITY);
        policy.verificationFlags.insert(VerificationFlag::IGNORE_END_REVOCATION_UNKNOWN);
        policy.extraStore.push_back(cert);
    }

    if (options.validateCertificateUse) {
        policy.applicationPolicy.push_back(validation::CLIENT_AUTHENTICATION_OID);
    }

    if (!options.validateValidityPeriod) {
        policy.verificationFlags.insert(VerificationFlag::IGNORE_NOT_TIME_VALID);
    }

    return policy;
}

std::string describeChainPolicy(const validation::ChainPolicy& policy) {
    std::string relax;
    for (VerificationFlag flag : policy.verificationFlags) {
        if (!relax.empty()) relax += ",";
        relax += validation::verificationFlagToString(flag);
    }
    return "mode=" + validation::revocationModeToString(policy.revocationMode) +
           ", flag=" + validation::revocationFlagToString(policy.revocationFlag) +
           ", relax=[" + relax + "]";
}

} // namespace auth
} // namespace certauth
