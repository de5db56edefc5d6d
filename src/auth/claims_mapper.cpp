/**
 * @file claims_mapper.cpp
 * @brief Certificate to claims mapping implementation
 */

#include "certauth/auth/claims_mapper.h"
#include "certauth/auth/options.h"
#include "certauth/common/string_utils.h"

namespace certauth {
namespace auth {

namespace {

void addIfPresent(std::vector<Claim>& claims, const char* type, const std::string& value,
                  const std::string& issuer, const char* valueType = claim_value_types::STRING) {
    if (common::isBlank(value)) return;
    claims.push_back({type, value, valueType, issuer});
}

} // namespace

std::vector<Claim> mapClaims(const x509::Certificate& cert, const std::string& claimsIssuer) {
    std::vector<Claim> claims;

    addIfPresent(claims, claim_types::ISSUER, cert.issuerName(), claimsIssuer);
    addIfPresent(claims, claim_types::THUMBPRINT, cert.thumbprint(), claimsIssuer,
                 claim_value_types::BASE64_BINARY);
    addIfPresent(claims, claim_types::X500_DISTINGUISHED_NAME, cert.subjectName(), claimsIssuer);
    addIfPresent(claims, claim_types::SERIAL_NUMBER, cert.serialNumber(), claimsIssuer);
    addIfPresent(claims, claim_types::DNS, cert.nameInfo(x509::NameType::DNS_NAME), claimsIssuer);
    addIfPresent(claims, claim_types::NAME, cert.nameInfo(x509::NameType::SIMPLE_NAME), claimsIssuer);
    addIfPresent(claims, claim_types::EMAIL, cert.nameInfo(x509::NameType::EMAIL_NAME), claimsIssuer);
    addIfPresent(claims, claim_types::UPN, cert.nameInfo(x509::NameType::UPN_NAME), claimsIssuer);
    addIfPresent(claims, claim_types::URI, cert.nameInfo(x509::NameType::URL_NAME), claimsIssuer);

    return claims;
}

ClaimsPrincipal createPrincipal(const x509::Certificate& cert, const std::string& claimsIssuer) {
    return ClaimsPrincipal(AUTHENTICATION_SCHEME, mapClaims(cert, claimsIssuer));
}

} // namespace auth
} // namespace certauth
