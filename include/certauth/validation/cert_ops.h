/**
 * @file cert_ops.h
 * @brief Pure X.509 certificate operations (no I/O, no logging)
 *
 * All functions in this module are idempotent and side-effect free.
 * They operate only on OpenSSL X509 structures passed as arguments.
 *
 * RFC 5280 Section 4.2.1.12 (Extended Key Usage) and
 * Section 6.1 (Basic Path Validation) utilities.
 */

#pragma once

#include <string>
#include <openssl/x509.h>
#include <openssl/asn1.h>

namespace certauth {
namespace validation {

/// @name Signature Verification
/// @{

/**
 * @brief Verify certificate signature using issuer's public key
 *
 * @param cert Certificate to verify (non-owning)
 * @param issuerCert Issuer certificate containing public key (non-owning)
 * @return true if signature is cryptographically valid
 */
bool verifyCertificateSignature(X509* cert, X509* issuerCert);

/// @}

/// @name Certificate Status Checks
/// @{

/**
 * @brief Check if certificate has expired (notAfter < now)
 * @param cert Certificate to check (non-owning)
 * @return true if expired
 */
bool isCertificateExpired(X509* cert);

/**
 * @brief Check if certificate is not yet valid (notBefore > now)
 * @param cert Certificate to check (non-owning)
 * @return true if not yet valid
 */
bool isCertificateNotYetValid(X509* cert);

/**
 * @brief Check if subject and issuer names are equal
 *
 * Compares the canonical encodings (X509_NAME_cmp), not display strings.
 * Matching names alone do NOT make a certificate self-signed.
 *
 * @param cert Certificate to check (non-owning)
 * @return true if subject == issuer
 */
bool hasMatchingSubjectAndIssuer(X509* cert);

/**
 * @brief Check if certificate is genuinely self-signed
 *
 * Requires BOTH subject == issuer AND a signature that verifies against
 * the certificate's own public key. A certificate with matching names but
 * a foreign signature is not self-signed.
 *
 * @param cert Certificate to check (non-owning)
 * @return true if self-signed
 */
bool isSelfSigned(X509* cert);

/// @}

/// @name Extended Key Usage
/// @{

/**
 * @brief Result of an extendedKeyUsage lookup
 */
enum class KeyUsagePermission {
    PERMITTED,      ///< Extension lists the purpose (or anyExtendedKeyUsage when allowed)
    NOT_PERMITTED,  ///< Extension present but purpose missing, or extension malformed
    UNCONSTRAINED   ///< No extendedKeyUsage extension
};

/**
 * @brief Check whether the extendedKeyUsage extension permits a purpose
 *
 * @param cert Certificate (non-owning)
 * @param purposeOid Dotted OID (e.g. "1.3.6.1.5.5.7.3.2")
 * @param acceptAnyExtendedKeyUsage Treat anyExtendedKeyUsage as a match
 * @return Permission; NOT_PERMITTED if purposeOid is not a valid OID
 */
KeyUsagePermission checkExtendedKeyUsage(X509* cert, const std::string& purposeOid,
                                         bool acceptAnyExtendedKeyUsage);

/// @}

/// @name DN Extraction
/// @{

/**
 * @brief Extract Subject DN from certificate
 * @param cert Certificate (non-owning)
 * @return Subject DN in OpenSSL oneline format (e.g., "/C=US/O=Example/CN=alice")
 */
std::string getSubjectDn(X509* cert);

/**
 * @brief Extract Issuer DN from certificate
 * @param cert Certificate (non-owning)
 * @return Issuer DN in OpenSSL oneline format
 */
std::string getIssuerDn(X509* cert);

/// @}

/// @name Fingerprint
/// @{

/**
 * @brief Calculate SHA-256 fingerprint of certificate
 * @param cert Certificate (non-owning)
 * @return 64-char lowercase hex string, or empty on error
 */
std::string getCertificateFingerprint(X509* cert);

/// @}

/// @name Time Utilities
/// @{

/**
 * @brief Convert ASN1_TIME to ISO 8601 string
 * @param t ASN.1 time structure (non-owning)
 * @return ISO 8601 formatted string (e.g., "2026-02-16T12:00:00Z"), or empty on error
 */
std::string asn1TimeToIso8601(const ASN1_TIME* t);

/// @}

} // namespace validation
} // namespace certauth
