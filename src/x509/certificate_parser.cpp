/**
 * @file certificate_parser.cpp
 * @brief Certificate and CRL format detection and loading implementation
 */

#include "certauth/x509/certificate_parser.h"
#include "certauth/common/exceptions.h"

#include <cctype>
#include <cstring>
#include <fstream>
#include <iterator>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>

namespace certauth {
namespace x509 {

namespace {

struct BioDeleter { void operator()(BIO* p) const { BIO_free(p); } };
using UniqueBio = std::unique_ptr<BIO, BioDeleter>;

struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
using UniqueX509 = std::unique_ptr<X509, X509Deleter>;

/**
 * @brief Check if data starts with a PEM marker (leading whitespace allowed)
 */
bool isPemFormat(const std::vector<uint8_t>& data) {
    static const char* pemMarker = "-----BEGIN ";
    const size_t markerLen = std::strlen(pemMarker);

    size_t start = 0;
    while (start < data.size() && std::isspace(static_cast<unsigned char>(data[start]))) {
        ++start;
    }
    if (data.size() - start < markerLen) {
        return false;
    }
    return std::memcmp(data.data() + start, pemMarker, markerLen) == 0;
}

/**
 * @brief Check if data starts with DER SEQUENCE tag
 */
bool isDerFormat(const std::vector<uint8_t>& data) {
    return data.size() >= 2 && data[0] == 0x30;
}

UniqueBio memoryBio(const std::vector<uint8_t>& data) {
    UniqueBio bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
    if (!bio) {
        throw common::ParsingException("Cannot allocate memory BIO");
    }
    return bio;
}

std::vector<Certificate> readPemCertificates(const std::vector<uint8_t>& data) {
    std::vector<Certificate> certificates;
    UniqueBio bio = memoryBio(data);

    while (true) {
        UniqueX509 cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if (!cert) break;
        certificates.push_back(Certificate::fromX509(cert.get()));
    }
    // PEM_read_bio_X509 reports end-of-input as an error
    ERR_clear_error();
    return certificates;
}

} // namespace

CertificateFormat detectCertificateFormat(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return CertificateFormat::UNKNOWN;
    }
    if (isPemFormat(data)) {
        return CertificateFormat::PEM;
    }
    if (isDerFormat(data)) {
        return CertificateFormat::DER;
    }
    return CertificateFormat::UNKNOWN;
}

Certificate parseCertificate(const std::vector<uint8_t>& data) {
    switch (detectCertificateFormat(data)) {
        case CertificateFormat::PEM: {
            auto certificates = readPemCertificates(data);
            if (certificates.empty()) {
                throw common::ParsingException("No certificate found in PEM data");
            }
            return certificates.front();
        }
        case CertificateFormat::DER:
            return Certificate::fromDer(data);
        case CertificateFormat::UNKNOWN:
            break;
    }
    throw common::ParsingException("Certificate format not recognized");
}

std::vector<Certificate> parseCertificateBundle(const std::vector<uint8_t>& data) {
    switch (detectCertificateFormat(data)) {
        case CertificateFormat::PEM: {
            auto certificates = readPemCertificates(data);
            if (certificates.empty()) {
                throw common::ParsingException("No certificate found in PEM bundle");
            }
            return certificates;
        }
        case CertificateFormat::DER:
            return {Certificate::fromDer(data)};
        case CertificateFormat::UNKNOWN:
            break;
    }
    throw common::ParsingException("Certificate bundle format not recognized");
}

std::vector<UniqueCrl> parseCrls(const std::vector<uint8_t>& data) {
    std::vector<UniqueCrl> crls;

    switch (detectCertificateFormat(data)) {
        case CertificateFormat::PEM: {
            UniqueBio bio = memoryBio(data);
            while (true) {
                UniqueCrl crl(PEM_read_bio_X509_CRL(bio.get(), nullptr, nullptr, nullptr));
                if (!crl) break;
                crls.push_back(std::move(crl));
            }
            ERR_clear_error();
            break;
        }
        case CertificateFormat::DER: {
            const unsigned char* p = data.data();
            UniqueCrl crl(d2i_X509_CRL(nullptr, &p, static_cast<long>(data.size())));
            if (crl) {
                crls.push_back(std::move(crl));
            } else {
                ERR_clear_error();
            }
            break;
        }
        case CertificateFormat::UNKNOWN:
            break;
    }

    if (crls.empty()) {
        throw common::ParsingException("No CRL found in data");
    }
    return crls;
}

std::vector<uint8_t> readFileBytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw common::CertAuthException("Cannot open file: " + path);
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw common::CertAuthException("Failed to read file: " + path);
    }
    return data;
}

} // namespace x509
} // namespace certauth
