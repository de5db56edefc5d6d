/**
 * @file claims_mapper.h
 * @brief Certificate to claims mapping
 */

#pragma once

#include <string>
#include <vector>

#include "certauth/auth/claims.h"
#include "certauth/x509/certificate.h"

namespace certauth {
namespace auth {

/**
 * @brief Map certificate fields to claims
 *
 * Order: issuer, thumbprint, subject DN, serial number, DNS name,
 * simple name, email, UPN, URI. Blank fields are skipped.
 *
 * @param cert Validated certificate
 * @param claimsIssuer Issuer label set on every claim
 * @return Ordered claims
 */
std::vector<Claim> mapClaims(const x509::Certificate& cert, const std::string& claimsIssuer);

/**
 * @brief Principal with authentication type "Certificate" and mapClaims() output
 */
ClaimsPrincipal createPrincipal(const x509::Certificate& cert, const std::string& claimsIssuer);

} // namespace auth
} // namespace certauth
