/**
 * @file certificate_classifier.cpp
 * @brief Self-signed / chained classification implementation
 */

#include "certauth/validation/certificate_classifier.h"
#include "certauth/validation/cert_ops.h"

namespace certauth {
namespace validation {

CertificateType classifyCertificate(const x509::Certificate& cert) {
    return isSelfSigned(cert.get()) ? CertificateType::SELF_SIGNED
                                    : CertificateType::CHAINED;
}

bool isSelfSigned(const x509::Certificate& cert) {
    return classifyCertificate(cert) == CertificateType::SELF_SIGNED;
}

} // namespace validation
} // namespace certauth
