/**
 * @file options.cpp
 * @brief Certificate authentication configuration implementation
 */

#include "certauth/auth/options.h"
#include "certauth/common/exceptions.h"
#include "certauth/common/string_utils.h"

#include <atomic>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace certauth {
namespace auth {

namespace {

/// Lowercase, trimmed, without '-' and '_'
std::string normalize(const std::string& value) {
    std::string result;
    for (char c : common::toLower(common::trim(value))) {
        if (c != '-' && c != '_' && c != ' ') result += c;
    }
    return result;
}

} // namespace

validation::AllowedCertificateTypes parseAllowedCertificateTypes(const std::string& value) {
    validation::AllowedCertificateTypes types;

    for (const auto& part : common::split(value, ',')) {
        std::string name = normalize(part);
        if (name.empty()) continue;

        if (name == "chained") {
            types.add(validation::CertificateType::CHAINED);
        } else if (name == "selfsigned") {
            types.add(validation::CertificateType::SELF_SIGNED);
        } else if (name == "all") {
            types = validation::AllowedCertificateTypes::all();
        } else if (name == "none") {
            // explicit empty set; rejected by validate()
        } else {
            throw common::ConfigException("Unknown certificate type: " + common::trim(part));
        }
    }
    return types;
}

validation::RevocationFlag parseRevocationFlag(const std::string& value) {
    std::string name = normalize(value);
    if (name == "endcertificateonly") return validation::RevocationFlag::END_CERTIFICATE_ONLY;
    if (name == "entirechain") return validation::RevocationFlag::ENTIRE_CHAIN;
    if (name == "excluderoot") return validation::RevocationFlag::EXCLUDE_ROOT;
    throw common::ConfigException("Unknown revocation flag: " + value);
}

validation::RevocationMode parseRevocationMode(const std::string& value) {
    std::string name = normalize(value);
    if (name == "nocheck") return validation::RevocationMode::NO_CHECK;
    if (name == "online" || name == "onlinerequired") return validation::RevocationMode::ONLINE_REQUIRED;
    if (name == "onlinebesteffort" || name == "besteffort") return validation::RevocationMode::ONLINE_BEST_EFFORT;
    if (name == "offline") return validation::RevocationMode::OFFLINE;
    throw common::ConfigException("Unknown revocation mode: " + value);
}

bool parseBool(const std::string& name, const std::string& value) {
    std::string v = common::toLower(common::trim(value));
    if (v == "true" || v == "yes" || v == "1" || v == "on") return true;
    if (v == "false" || v == "no" || v == "0" || v == "off") return false;
    throw common::ConfigException(name + " must be true or false, got '" + value + "'");
}

std::string allowedCertificateTypesToString(const validation::AllowedCertificateTypes& types) {
    bool chained = types.contains(validation::CertificateType::CHAINED);
    bool selfSigned = types.contains(validation::CertificateType::SELF_SIGNED);
    if (chained && selfSigned) return "All";
    if (chained) return "Chained";
    if (selfSigned) return "SelfSigned";
    return "None";
}

CertificateAuthenticationOptions CertificateAuthenticationOptions::fromEnvironment() {
    CertificateAuthenticationOptions options;

    if (auto val = std::getenv("CERTAUTH_ALLOWED_TYPES")) {
        options.allowedCertificateTypes = parseAllowedCertificateTypes(val);
    }
    if (auto val = std::getenv("CERTAUTH_REVOCATION_FLAG")) {
        options.revocationFlag = parseRevocationFlag(val);
    }
    if (auto val = std::getenv("CERTAUTH_REVOCATION_MODE")) {
        options.revocationMode = parseRevocationMode(val);
    }
    if (auto val = std::getenv("CERTAUTH_VALIDATE_CERTIFICATE_USE")) {
        options.validateCertificateUse = parseBool("CERTAUTH_VALIDATE_CERTIFICATE_USE", val);
    }
    if (auto val = std::getenv("CERTAUTH_VALIDATE_VALIDITY_PERIOD")) {
        options.validateValidityPeriod = parseBool("CERTAUTH_VALIDATE_VALIDITY_PERIOD", val);
    }
    if (auto val = std::getenv("CERTAUTH_CLAIMS_ISSUER")) {
        options.claimsIssuer = val;
    }

    options.validate();

    spdlog::debug("Certificate authentication options: allowed={}, revocationFlag={}, "
                  "revocationMode={}, validateUse={}, validatePeriod={}, issuer={}",
                  allowedCertificateTypesToString(options.allowedCertificateTypes),
                  validation::revocationFlagToString(options.revocationFlag),
                  validation::revocationModeToString(options.revocationMode),
                  options.validateCertificateUse, options.validateValidityPeriod,
                  options.claimsIssuer);
    return options;
}

void CertificateAuthenticationOptions::validate() const {
    if (allowedCertificateTypes.empty()) {
        throw common::ConfigException("At least one certificate type must be allowed");
    }
    if (common::isBlank(claimsIssuer)) {
        throw common::ConfigException("Claims issuer must not be blank");
    }
}

// --- OptionsMonitor ---

OptionsMonitor::OptionsMonitor(CertificateAuthenticationOptions initial) {
    initial.validate();
    current_ = std::make_shared<const CertificateAuthenticationOptions>(std::move(initial));
}

std::shared_ptr<const CertificateAuthenticationOptions> OptionsMonitor::current() const {
    return std::atomic_load(&current_);
}

void OptionsMonitor::update(CertificateAuthenticationOptions next) {
    next.validate();
    auto snapshot = std::make_shared<const CertificateAuthenticationOptions>(std::move(next));
    std::atomic_store(&current_, std::move(snapshot));
    spdlog::info("Certificate authentication options updated");
}

} // namespace auth
} // namespace certauth
