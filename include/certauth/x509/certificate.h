/**
 * @file certificate.h
 * @brief Immutable X.509 certificate value
 *
 * Holds the raw DER bytes exactly as received together with the decoded
 * OpenSSL structure. Copies share the same decoded certificate.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <openssl/x509.h>

namespace certauth {
namespace x509 {

/**
 * @brief Name forms extractable from a certificate
 */
enum class NameType {
    DNS_NAME,     ///< First SAN dNSName, falling back to subject CN
    SIMPLE_NAME,  ///< Subject CN, OU, O or email, then first SAN email/DNS
    EMAIL_NAME,   ///< Subject emailAddress, falling back to SAN rfc822Name
    UPN_NAME,     ///< SAN otherName Microsoft UPN (1.3.6.1.4.1.311.20.2.3)
    URL_NAME      ///< First SAN uniformResourceIdentifier
};

/// @brief Microsoft User Principal Name otherName OID
constexpr const char* UPN_OTHER_NAME_OID = "1.3.6.1.4.1.311.20.2.3";

class Certificate {
public:
    /**
     * @brief Decode a DER-encoded certificate
     * @param der Raw certificate bytes; kept verbatim
     * @return Certificate
     * @throws common::ParsingException if the bytes are not exactly one certificate
     */
    static Certificate fromDer(const std::vector<uint8_t>& der);

    /**
     * @brief Wrap an existing OpenSSL certificate (takes an additional reference)
     * @param cert Certificate (non-owning; caller keeps its own reference)
     * @throws std::invalid_argument if cert is nullptr
     * @throws common::ParsingException if the certificate cannot be re-encoded
     */
    static Certificate fromX509(X509* cert);

    /// @brief Decoded certificate (never nullptr). Treat as read-only.
    X509* get() const { return cert_.get(); }

    /// @brief Raw DER bytes as received
    const std::vector<uint8_t>& rawData() const { return der_; }

    /// @brief Uppercase hex encoding of rawData()
    std::string rawDataString() const;

    /// @brief Subject DN (RFC 2253, e.g. "CN=alice,O=Example,C=US")
    std::string subjectName() const;

    /// @brief Issuer DN (RFC 2253)
    std::string issuerName() const;

    /// @brief Serial number as uppercase hex, empty if missing
    std::string serialNumber() const;

    /// @brief SHA-1 digest of the DER encoding, uppercase hex
    std::string thumbprint() const;

    /// @brief SHA-256 digest of the DER encoding, lowercase hex
    std::string sha256Fingerprint() const;

    /// @brief Validity window bounds (ISO 8601), empty on error
    std::string notBefore() const;
    std::string notAfter() const;

    /**
     * @brief Extract a name of the given form
     * @return Name, or empty string if the certificate carries none
     */
    std::string nameInfo(NameType type) const;

private:
    Certificate(std::shared_ptr<X509> cert, std::vector<uint8_t> der);

    std::shared_ptr<X509> cert_;
    std::vector<uint8_t> der_;
};

/**
 * @brief Reverse of Certificate::rawDataString()
 * @throws common::ParsingException on malformed input
 */
std::vector<uint8_t> rawDataFromString(const std::string& encoded);

} // namespace x509
} // namespace certauth
