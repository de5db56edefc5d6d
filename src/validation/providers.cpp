/**
 * @file providers.cpp
 * @brief In-memory trust anchor and CRL providers
 */

#include "certauth/validation/providers.h"
#include "certauth/validation/cert_ops.h"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace certauth {
namespace validation {

namespace {

std::string crlIssuerDn(X509_CRL* crl) {
    char* dn = X509_NAME_oneline(X509_CRL_get_issuer(crl), nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

} // namespace

StaticTrustAnchorProvider StaticTrustAnchorProvider::fromPemBundle(const std::string& path) {
    StaticTrustAnchorProvider provider;
    auto certificates = x509::parseCertificateBundle(x509::readFileBytes(path));

    for (const auto& cert : certificates) {
        if (isSelfSigned(cert.get())) {
            provider.addRoot(cert);
        } else {
            provider.addIntermediate(cert);
        }
    }

    spdlog::info("Trust bundle loaded: path={}, roots={}, intermediates={}",
                 path, provider.roots_.size(), provider.intermediates_.size());
    return provider;
}

StaticCrlProvider StaticCrlProvider::fromFile(const std::string& path) {
    StaticCrlProvider provider;
    for (auto& crl : x509::parseCrls(x509::readFileBytes(path))) {
        provider.add(std::move(crl));
    }
    spdlog::info("CRL file loaded: path={}, crls={}", path, provider.size());
    return provider;
}

void StaticCrlProvider::add(x509::UniqueCrl crl) {
    if (!crl) {
        throw std::invalid_argument("StaticCrlProvider::add: crl cannot be nullptr");
    }
    crls_.push_back(std::move(crl));
}

std::vector<x509::UniqueCrl> StaticCrlProvider::findCrls(const std::string& issuerDn,
                                                         bool /*allowNetwork*/) const {
    std::vector<x509::UniqueCrl> matches;
    for (const auto& crl : crls_) {
        if (crlIssuerDn(crl.get()) == issuerDn) {
            X509_CRL_up_ref(crl.get());
            matches.emplace_back(crl.get());
        }
    }
    return matches;
}

} // namespace validation
} // namespace certauth
