/**
 * @file certificate_classifier.h
 * @brief Self-signed / chained classification
 */

#pragma once

#include "certauth/validation/types.h"
#include "certauth/x509/certificate.h"

namespace certauth {
namespace validation {

/**
 * @brief Classify a certificate for the policy gate
 *
 * SELF_SIGNED requires matching subject/issuer names AND a signature that
 * verifies with the certificate's own public key. Matching names with a
 * foreign signature classify as CHAINED, so full chain and revocation
 * checks still apply.
 *
 * @param cert Certificate
 * @return Certificate category
 */
CertificateType classifyCertificate(const x509::Certificate& cert);

/// @brief Shorthand for classifyCertificate(cert) == SELF_SIGNED
bool isSelfSigned(const x509::Certificate& cert);

} // namespace validation
} // namespace certauth
