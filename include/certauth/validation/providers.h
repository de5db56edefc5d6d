/**
 * @file providers.h
 * @brief Provider interfaces for infrastructure abstraction
 *
 * These interfaces decouple the chain validator from specific data sources.
 * Shipped adapters keep everything in memory:
 *   - StaticTrustAnchorProvider: roots/intermediates added in code or loaded from a PEM bundle
 *   - StaticCrlProvider: CRLs added in code or loaded from a PEM/DER file
 * Hosting applications may supply their own (e.g. a network CRL fetcher).
 */

#pragma once

#include <string>
#include <vector>
#include <openssl/x509.h>

#include "certauth/x509/certificate.h"
#include "certauth/x509/certificate_parser.h"

namespace certauth {
namespace validation {

/**
 * @brief Trust anchor and intermediate lookup interface
 *
 * Implementations must be safe to call from concurrent authentication
 * attempts.
 */
class ITrustAnchorProvider {
public:
    virtual ~ITrustAnchorProvider() = default;

    /**
     * @brief Certificates trusted as path anchors
     * @return Owned certificates (may be empty)
     */
    virtual std::vector<x509::Certificate> trustedRoots() const = 0;

    /**
     * @brief Untrusted certificates available for path building
     * @return Owned certificates (may be empty)
     */
    virtual std::vector<x509::Certificate> intermediates() const = 0;
};

/**
 * @brief CRL lookup interface
 *
 * Memory ownership: returned CRLs are owned by the caller.
 */
class ICrlProvider {
public:
    virtual ~ICrlProvider() = default;

    /**
     * @brief Find CRLs issued by the given DN
     * @param issuerDn Issuer DN in OpenSSL oneline format (see getIssuerDn)
     * @param allowNetwork False in Offline revocation mode; implementations
     *        must then answer from locally cached data only
     * @return CRLs (empty if none are known)
     */
    virtual std::vector<x509::UniqueCrl> findCrls(const std::string& issuerDn,
                                                  bool allowNetwork) const = 0;
};

/**
 * @brief In-memory trust anchor provider
 */
class StaticTrustAnchorProvider : public ITrustAnchorProvider {
public:
    StaticTrustAnchorProvider() = default;

    /**
     * @brief Load every certificate of a PEM bundle (or a single DER file)
     *
     * Self-signed entries become roots, the rest intermediates.
     *
     * @throws common::CertAuthException if the file cannot be read
     * @throws common::ParsingException if it contains no certificate
     */
    static StaticTrustAnchorProvider fromPemBundle(const std::string& path);

    void addRoot(const x509::Certificate& cert) { roots_.push_back(cert); }
    void addIntermediate(const x509::Certificate& cert) { intermediates_.push_back(cert); }

    std::vector<x509::Certificate> trustedRoots() const override { return roots_; }
    std::vector<x509::Certificate> intermediates() const override { return intermediates_; }

private:
    std::vector<x509::Certificate> roots_;
    std::vector<x509::Certificate> intermediates_;
};

/**
 * @brief In-memory CRL provider (never performs network I/O)
 */
class StaticCrlProvider : public ICrlProvider {
public:
    StaticCrlProvider() = default;
    StaticCrlProvider(const StaticCrlProvider&) = delete;
    StaticCrlProvider& operator=(const StaticCrlProvider&) = delete;
    StaticCrlProvider(StaticCrlProvider&&) = default;
    StaticCrlProvider& operator=(StaticCrlProvider&&) = default;

    /**
     * @brief Load every CRL from a PEM or DER file
     * @throws common::CertAuthException if the file cannot be read
     * @throws common::ParsingException if it contains no CRL
     */
    static StaticCrlProvider fromFile(const std::string& path);

    /// @brief Takes ownership of crl
    void add(x509::UniqueCrl crl);

    std::vector<x509::UniqueCrl> findCrls(const std::string& issuerDn,
                                          bool allowNetwork) const override;

    size_t size() const { return crls_.size(); }

private:
    std::vector<x509::UniqueCrl> crls_;
};

} // namespace validation
} // namespace certauth
