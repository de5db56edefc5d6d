/**
 * @file cert_ops.cpp
 * @brief Pure X.509 certificate operations implementation
 *
 * All functions are idempotent, with no I/O or logging side effects.
 */

#include "certauth/validation/cert_ops.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/x509v3.h>
#include <openssl/err.h>

namespace certauth {
namespace validation {

// --- Signature Verification ---

bool verifyCertificateSignature(X509* cert, X509* issuerCert) {
    if (!cert || !issuerCert) return false;

    EVP_PKEY* issuerPubKey = X509_get_pubkey(issuerCert);
    if (!issuerPubKey) {
        ERR_clear_error();
        return false;
    }

    int result = X509_verify(cert, issuerPubKey);
    EVP_PKEY_free(issuerPubKey);

    // Clear OpenSSL error queue to prevent stale errors from leaking
    if (result != 1) {
        ERR_clear_error();
    }

    return (result == 1);
}

// --- Certificate Status Checks ---

bool isCertificateExpired(X509* cert) {
    if (!cert) return true;
    time_t now = time(nullptr);
    return (X509_cmp_time(X509_get0_notAfter(cert), &now) < 0);
}

bool isCertificateNotYetValid(X509* cert) {
    if (!cert) return true;
    time_t now = time(nullptr);
    return (X509_cmp_time(X509_get0_notBefore(cert), &now) > 0);
}

bool hasMatchingSubjectAndIssuer(X509* cert) {
    if (!cert) return false;
    return X509_NAME_cmp(X509_get_subject_name(cert), X509_get_issuer_name(cert)) == 0;
}

bool isSelfSigned(X509* cert) {
    if (!cert) return false;

    // Name equality is spoofable; the signature must verify with the cert's own key
    return hasMatchingSubjectAndIssuer(cert) && verifyCertificateSignature(cert, cert);
}

// --- Extended Key Usage ---

KeyUsagePermission checkExtendedKeyUsage(X509* cert, const std::string& purposeOid,
                                         bool acceptAnyExtendedKeyUsage) {
    if (!cert) return KeyUsagePermission::NOT_PERMITTED;

    int critical = -1;
    EXTENDED_KEY_USAGE* eku = static_cast<EXTENDED_KEY_USAGE*>(
        X509_get_ext_d2i(cert, NID_ext_key_usage, &critical, nullptr));
    if (!eku) {
        // critical == -1: extension absent; anything else: duplicate or undecodable
        ERR_clear_error();
        return critical == -1 ? KeyUsagePermission::UNCONSTRAINED
                              : KeyUsagePermission::NOT_PERMITTED;
    }

    ASN1_OBJECT* wanted = OBJ_txt2obj(purposeOid.c_str(), 1);
    if (!wanted) {
        ERR_clear_error();
        EXTENDED_KEY_USAGE_free(eku);
        return KeyUsagePermission::NOT_PERMITTED;
    }

    bool found = false;
    for (int i = 0; i < sk_ASN1_OBJECT_num(eku) && !found; i++) {
        const ASN1_OBJECT* usage = sk_ASN1_OBJECT_value(eku, i);
        if (OBJ_cmp(usage, wanted) == 0) {
            found = true;
        } else if (acceptAnyExtendedKeyUsage && OBJ_obj2nid(usage) == NID_anyExtendedKeyUsage) {
            found = true;
        }
    }

    ASN1_OBJECT_free(wanted);
    EXTENDED_KEY_USAGE_free(eku);
    return found ? KeyUsagePermission::PERMITTED : KeyUsagePermission::NOT_PERMITTED;
}

// --- DN Extraction ---

std::string getSubjectDn(X509* cert) {
    if (!cert) return "";

    char* dn = X509_NAME_oneline(X509_get_subject_name(cert), nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

std::string getIssuerDn(X509* cert) {
    if (!cert) return "";

    char* dn = X509_NAME_oneline(X509_get_issuer_name(cert), nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

// --- Fingerprint ---

std::string getCertificateFingerprint(X509* cert) {
    if (!cert) return "";

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;

    if (X509_digest(cert, EVP_sha256(), md, &mdLen) != 1) {
        ERR_clear_error();
        return "";
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < mdLen; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
    }
    return oss.str();
}

// --- Time Utilities ---

std::string asn1TimeToIso8601(const ASN1_TIME* t) {
    if (!t) return "";
    struct tm tm_val;
    if (ASN1_TIME_to_tm(t, &tm_val) == 1) {
        char buf[32];
        strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_val);
        return std::string(buf);
    }
    return "";
}

} // namespace validation
} // namespace certauth
