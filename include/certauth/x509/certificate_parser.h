/**
 * @file certificate_parser.h
 * @brief Certificate and CRL format detection and loading
 *
 * Used to load trust bundles, revocation lists and the command-line
 * tool's input certificate. The decision engine itself only ever
 * receives DER bytes.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <openssl/x509.h>

#include "certauth/x509/certificate.h"

namespace certauth {
namespace x509 {

/**
 * @brief Certificate format enumeration
 */
enum class CertificateFormat {
    UNKNOWN,  ///< Format not recognized
    PEM,      ///< Base64-encoded with BEGIN/END markers
    DER       ///< Binary DER encoding
};

/// RAII wrapper for X509_CRL
struct CrlDeleter { void operator()(X509_CRL* p) const { X509_CRL_free(p); } };
using UniqueCrl = std::unique_ptr<X509_CRL, CrlDeleter>;

/**
 * @brief Detect certificate/CRL encoding from leading bytes
 */
CertificateFormat detectCertificateFormat(const std::vector<uint8_t>& data);

/**
 * @brief Parse a single certificate from PEM or DER data
 *
 * PEM input is converted to DER, so Certificate::rawData() is always DER.
 *
 * @throws common::ParsingException if no certificate can be decoded
 */
Certificate parseCertificate(const std::vector<uint8_t>& data);

/**
 * @brief Parse every certificate in a PEM bundle (or a single DER certificate)
 * @throws common::ParsingException if the data contains no certificate
 */
std::vector<Certificate> parseCertificateBundle(const std::vector<uint8_t>& data);

/**
 * @brief Parse every CRL in PEM data (or a single DER CRL)
 * @throws common::ParsingException if the data contains no CRL
 */
std::vector<UniqueCrl> parseCrls(const std::vector<uint8_t>& data);

/**
 * @brief Read a whole file into memory
 * @throws common::CertAuthException if the file cannot be read
 */
std::vector<uint8_t> readFileBytes(const std::string& path);

} // namespace x509
} // namespace certauth
