/**
 * @file certificate.cpp
 * @brief Immutable X.509 certificate value implementation
 */

#include "certauth/x509/certificate.h"
#include "certauth/common/exceptions.h"
#include "certauth/common/string_utils.h"
#include "certauth/validation/cert_ops.h"

#include <initializer_list>
#include <stdexcept>
#include <vector>
#include <openssl/bio.h>
#include <openssl/asn1.h>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/x509v3.h>

namespace certauth {
namespace x509 {

namespace {

struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };

std::string nameToString(const X509_NAME* name) {
    if (!name) return "";

    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) return "";

    // RFC 2253 without escaping of multi-byte characters
    unsigned long flags = XN_FLAG_RFC2253 & ~ASN1_STRFLGS_ESC_MSB;
    if (X509_NAME_print_ex(bio, name, 0, flags) < 0) {
        BIO_free(bio);
        return "";
    }

    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string result = (len > 0 && data) ? std::string(data, len) : "";
    BIO_free(bio);
    return result;
}

std::string asn1StringToUtf8(const ASN1_STRING* str) {
    if (!str) return "";
    unsigned char* utf8 = nullptr;
    int len = ASN1_STRING_to_UTF8(&utf8, str);
    if (len < 0 || !utf8) {
        ERR_clear_error();
        return "";
    }
    std::string result(reinterpret_cast<char*>(utf8), len);
    OPENSSL_free(utf8);
    return result;
}

std::string subjectAttribute(X509* cert, int nid) {
    X509_NAME* subject = X509_get_subject_name(cert);
    int idx = X509_NAME_get_index_by_NID(subject, nid, -1);
    if (idx < 0) return "";
    X509_NAME_ENTRY* entry = X509_NAME_get_entry(subject, idx);
    return asn1StringToUtf8(X509_NAME_ENTRY_get_data(entry));
}

/// First subjectAltName entry of the given GEN_* type (otherName filtered by OID)
std::string subjectAltName(X509* cert, int type, const char* otherNameOid = nullptr) {
    GENERAL_NAMES* names = static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
    if (!names) return "";

    ASN1_OBJECT* wantedOid = otherNameOid ? OBJ_txt2obj(otherNameOid, 1) : nullptr;
    std::string result;

    for (int i = 0; i < sk_GENERAL_NAME_num(names) && result.empty(); i++) {
        const GENERAL_NAME* name = sk_GENERAL_NAME_value(names, i);
        if (name->type != type) continue;

        switch (type) {
            case GEN_DNS:
                result = asn1StringToUtf8(name->d.dNSName);
                break;
            case GEN_EMAIL:
                result = asn1StringToUtf8(name->d.rfc822Name);
                break;
            case GEN_URI:
                result = asn1StringToUtf8(name->d.uniformResourceIdentifier);
                break;
            case GEN_OTHERNAME: {
                const OTHERNAME* other = name->d.otherName;
                if (wantedOid && other && OBJ_cmp(other->type_id, wantedOid) == 0 &&
                    other->value && other->value->type == V_ASN1_UTF8STRING) {
                    result = asn1StringToUtf8(other->value->value.utf8string);
                }
                break;
            }
            default:
                break;
        }
    }

    ASN1_OBJECT_free(wantedOid);
    GENERAL_NAMES_free(names);
    return result;
}

std::string digestHex(X509* cert, const EVP_MD* md, bool uppercase) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (X509_digest(cert, md, digest, &digestLen) != 1) {
        ERR_clear_error();
        return "";
    }
    return common::bytesToHex(digest, digestLen, uppercase);
}

} // namespace

Certificate::Certificate(std::shared_ptr<X509> cert, std::vector<uint8_t> der)
    : cert_(std::move(cert)), der_(std::move(der)) {}

Certificate Certificate::fromDer(const std::vector<uint8_t>& der) {
    if (der.empty()) {
        throw common::ParsingException("Certificate data is empty");
    }

    const unsigned char* p = der.data();
    X509* cert = d2i_X509(nullptr, &p, static_cast<long>(der.size()));
    if (!cert) {
        ERR_clear_error();
        throw common::ParsingException("Certificate is not valid DER");
    }

    std::shared_ptr<X509> owned(cert, X509Deleter());
    if (p != der.data() + der.size()) {
        throw common::ParsingException("Trailing data after certificate ("
            + std::to_string(der.data() + der.size() - p) + " bytes)");
    }

    return Certificate(std::move(owned), der);
}

Certificate Certificate::fromX509(X509* cert) {
    if (!cert) {
        throw std::invalid_argument("Certificate::fromX509: cert cannot be nullptr");
    }

    int derLen = i2d_X509(cert, nullptr);
    if (derLen <= 0) {
        ERR_clear_error();
        throw common::ParsingException("Certificate cannot be DER-encoded");
    }
    std::vector<uint8_t> der(derLen);
    unsigned char* p = der.data();
    if (i2d_X509(cert, &p) != derLen) {
        ERR_clear_error();
        throw common::ParsingException("Certificate DER encoding length mismatch");
    }

    X509_up_ref(cert);
    return Certificate(std::shared_ptr<X509>(cert, X509Deleter()), std::move(der));
}

std::string Certificate::rawDataString() const {
    return common::bytesToHex(der_.data(), der_.size(), true);
}

std::string Certificate::subjectName() const {
    return nameToString(X509_get_subject_name(cert_.get()));
}

std::string Certificate::issuerName() const {
    return nameToString(X509_get_issuer_name(cert_.get()));
}

std::string Certificate::serialNumber() const {
    const ASN1_INTEGER* serial = X509_get0_serialNumber(cert_.get());
    if (!serial) return "";

    // Content octets of the DER INTEGER, so a leading 00 sign byte is kept
    int derLen = i2d_ASN1_INTEGER(serial, nullptr);
    if (derLen <= 0) {
        ERR_clear_error();
        return "";
    }
    std::vector<unsigned char> der(static_cast<size_t>(derLen));
    unsigned char* out = der.data();
    i2d_ASN1_INTEGER(serial, &out);

    const unsigned char* content = der.data();
    long contentLen = 0;
    int tag = 0;
    int xclass = 0;
    if (ASN1_get_object(&content, &contentLen, &tag, &xclass, derLen) & 0x80) {
        ERR_clear_error();
        return "";
    }
    return common::bytesToHex(content, static_cast<size_t>(contentLen), true);
}

std::string Certificate::thumbprint() const {
    return digestHex(cert_.get(), EVP_sha1(), true);
}

std::string Certificate::sha256Fingerprint() const {
    return validation::getCertificateFingerprint(cert_.get());
}

std::string Certificate::notBefore() const {
    return validation::asn1TimeToIso8601(X509_get0_notBefore(cert_.get()));
}

std::string Certificate::notAfter() const {
    return validation::asn1TimeToIso8601(X509_get0_notAfter(cert_.get()));
}

std::string Certificate::nameInfo(NameType type) const {
    X509* cert = cert_.get();
    std::string value;

    switch (type) {
        case NameType::DNS_NAME:
            value = subjectAltName(cert, GEN_DNS);
            if (common::isBlank(value)) value = subjectAttribute(cert, NID_commonName);
            break;

        case NameType::SIMPLE_NAME:
            for (int nid : {NID_commonName, NID_organizationalUnitName,
                            NID_organizationName, NID_pkcs9_emailAddress}) {
                value = subjectAttribute(cert, nid);
                if (!common::isBlank(value)) break;
            }
            if (common::isBlank(value)) value = subjectAltName(cert, GEN_EMAIL);
            if (common::isBlank(value)) value = subjectAltName(cert, GEN_DNS);
            break;

        case NameType::EMAIL_NAME:
            value = subjectAttribute(cert, NID_pkcs9_emailAddress);
            if (common::isBlank(value)) value = subjectAltName(cert, GEN_EMAIL);
            break;

        case NameType::UPN_NAME:
            value = subjectAltName(cert, GEN_OTHERNAME, UPN_OTHER_NAME_OID);
            break;

        case NameType::URL_NAME:
            value = subjectAltName(cert, GEN_URI);
            break;
    }

    return value;
}

std::vector<uint8_t> rawDataFromString(const std::string& encoded) {
    try {
        return common::hexToBytes(encoded);
    } catch (const std::invalid_argument& e) {
        throw common::ParsingException(std::string("Raw certificate string: ") + e.what());
    }
}

} // namespace x509
} // namespace certauth
