/**
 * @file claims.cpp
 * @brief Identity claims and principal implementation
 */

#include "certauth/auth/claims.h"

namespace certauth {
namespace auth {

const Claim* ClaimsPrincipal::findFirst(const std::string& type) const {
    for (const auto& claim : claims_) {
        if (claim.type == type) return &claim;
    }
    return nullptr;
}

std::string ClaimsPrincipal::findFirstValue(const std::string& type) const {
    const Claim* claim = findFirst(type);
    return claim ? claim->value : "";
}

Json::Value ClaimsPrincipal::toJson() const {
    Json::Value json;
    json["authenticationType"] = authenticationType_;
    json["claims"] = Json::arrayValue;

    for (const auto& claim : claims_) {
        Json::Value item;
        item["type"] = claim.type;
        item["value"] = claim.value;
        item["valueType"] = claim.valueType;
        item["issuer"] = claim.issuer;
        json["claims"].append(item);
    }
    return json;
}

} // namespace auth
} // namespace certauth
