/**
 * @file claims.h
 * @brief Identity claims and principal
 */

#pragma once

#include <string>
#include <vector>
#include <json/json.h>

namespace certauth {
namespace auth {

/// @brief Well-known claim type URIs
namespace claim_types {
constexpr const char* ISSUER = "issuer";
constexpr const char* THUMBPRINT = "http://schemas.microsoft.com/ws/2008/06/identity/claims/thumbprint";
constexpr const char* X500_DISTINGUISHED_NAME = "http://schemas.microsoft.com/ws/2008/06/identity/claims/x500distinguishedname";
constexpr const char* SERIAL_NUMBER = "http://schemas.microsoft.com/ws/2008/06/identity/claims/serialnumber";
constexpr const char* DNS = "http://schemas.xmlsoap.org/ws/2005/05/identity/claims/dns";
constexpr const char* NAME = "http://schemas.xmlsoap.org/ws/2005/05/identity/claims/name";
constexpr const char* EMAIL = "http://schemas.xmlsoap.org/ws/2005/05/identity/claims/emailaddress";
constexpr const char* UPN = "http://schemas.xmlsoap.org/ws/2005/05/identity/claims/upn";
constexpr const char* URI = "http://schemas.xmlsoap.org/ws/2005/05/identity/claims/uri";
} // namespace claim_types

/// @brief Claim value kinds (XML Schema datatypes)
namespace claim_value_types {
constexpr const char* STRING = "http://www.w3.org/2001/XMLSchema#string";
constexpr const char* BASE64_BINARY = "http://www.w3.org/2001/XMLSchema#base64Binary";
} // namespace claim_value_types

/**
 * @brief Single identity claim
 */
struct Claim {
    std::string type;
    std::string value;
    std::string valueType = claim_value_types::STRING;
    std::string issuer;

    bool operator==(const Claim& other) const {
        return type == other.type && value == other.value &&
               valueType == other.valueType && issuer == other.issuer;
    }
};

/**
 * @brief Authenticated identity: authentication type plus ordered claims
 */
class ClaimsPrincipal {
public:
    ClaimsPrincipal() = default;
    ClaimsPrincipal(std::string authenticationType, std::vector<Claim> claims)
        : authenticationType_(std::move(authenticationType)), claims_(std::move(claims)) {}

    const std::string& authenticationType() const { return authenticationType_; }
    const std::vector<Claim>& claims() const { return claims_; }

    /// @brief True if an authentication type is set
    bool isAuthenticated() const { return !authenticationType_.empty(); }

    /**
     * @brief First claim of the given type
     * @return Pointer into claims(), or nullptr
     */
    const Claim* findFirst(const std::string& type) const;

    /// @brief Value of the first claim of the given type, empty if none
    std::string findFirstValue(const std::string& type) const;

    Json::Value toJson() const;

private:
    std::string authenticationType_;
    std::vector<Claim> claims_;
};

} // namespace auth
} // namespace certauth
