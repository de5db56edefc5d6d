/**
 * @file options.h
 * @brief Certificate authentication configuration
 *
 * Loaded once (from code or environment variables) and read-only thereafter.
 * Live reload goes through OptionsMonitor, which swaps whole immutable
 * snapshots.
 */

#pragma once

#include <string>
#include <memory>

#include "certauth/validation/types.h"

namespace certauth {
namespace auth {

/// @brief Authentication scheme name (also the default claims issuer)
constexpr const char* AUTHENTICATION_SCHEME = "Certificate";

/**
 * @brief Engine configuration
 *
 * Environment variables (all optional):
 *   CERTAUTH_ALLOWED_TYPES              Chained | SelfSigned | All | comma list
 *   CERTAUTH_REVOCATION_FLAG            EndCertificateOnly | EntireChain | ExcludeRoot
 *   CERTAUTH_REVOCATION_MODE            NoCheck | Online | OnlineBestEffort | Offline
 *   CERTAUTH_VALIDATE_CERTIFICATE_USE   true | false
 *   CERTAUTH_VALIDATE_VALIDITY_PERIOD   true | false
 *   CERTAUTH_CLAIMS_ISSUER              issuer label on every claim
 */
struct CertificateAuthenticationOptions {
    validation::AllowedCertificateTypes allowedCertificateTypes =
        validation::AllowedCertificateTypes::chained();
    bool validateCertificateUse = true;
    bool validateValidityPeriod = true;
    validation::RevocationFlag revocationFlag = validation::RevocationFlag::EXCLUDE_ROOT;
    validation::RevocationMode revocationMode = validation::RevocationMode::ONLINE_REQUIRED;
    std::string claimsIssuer = AUTHENTICATION_SCHEME;

    /**
     * @brief Defaults overridden by CERTAUTH_* environment variables
     * @throws common::ConfigException on an unparsable or inconsistent value
     */
    static CertificateAuthenticationOptions fromEnvironment();

    /**
     * @brief Check consistency
     * @throws common::ConfigException if no certificate type is allowed
     *         or the claims issuer is blank
     */
    void validate() const;
};

/// @name Parsing helpers (case-insensitive; '-' and '_' ignored)
/// @{

/// @throws common::ConfigException on unknown names
validation::AllowedCertificateTypes parseAllowedCertificateTypes(const std::string& value);
validation::RevocationFlag parseRevocationFlag(const std::string& value);
validation::RevocationMode parseRevocationMode(const std::string& value);

/**
 * @brief Parse true/false, yes/no, 1/0, on/off
 * @param name Setting name for the error message
 * @throws common::ConfigException on anything else
 */
bool parseBool(const std::string& name, const std::string& value);

/// @brief "Chained", "SelfSigned", "All" or "None"
std::string allowedCertificateTypesToString(const validation::AllowedCertificateTypes& types);

/// @}

/**
 * @brief Holder of the current options snapshot
 *
 * update() publishes a new snapshot; current() returns whichever snapshot is
 * published at the time of the call. Attempts already running keep the
 * snapshot they started with.
 */
class OptionsMonitor {
public:
    /// @throws common::ConfigException if initial is inconsistent
    explicit OptionsMonitor(CertificateAuthenticationOptions initial);

    std::shared_ptr<const CertificateAuthenticationOptions> current() const;

    /// @throws common::ConfigException if next is inconsistent (current snapshot kept)
    void update(CertificateAuthenticationOptions next);

private:
    std::shared_ptr<const CertificateAuthenticationOptions> current_;
};

} // namespace auth
} // namespace certauth
