/**
 * @file test_claims_mapper.cpp
 * @brief Unit tests for certificate-to-claims mapping
 */

#include <gtest/gtest.h>
#include "certauth/auth/claims_mapper.h"
#include "certauth/auth/options.h"
#include "test_helpers.h"

using namespace certauth;
using namespace certauth::auth;
using namespace test_helpers;

class ClaimsMapperTest : public ::testing::Test {
protected:
    UniqueKey rootKey_;
    UniqueKey clientKey_;
    UniqueCert rootCa_;

    void SetUp() override {
        rootKey_ = generateEcKey();
        clientKey_ = generateEcKey();
        rootCa_ = createRootCa(rootKey_.get());
    }
};

TEST_F(ClaimsMapperTest, FullCertificate_AllClaimsInOrder) {
    auto client = createClientCert(clientKey_.get(), rootKey_.get(), rootCa_.get(), "alice");
    auto cert = toCertificate(client.get());

    auto claims = mapClaims(cert, "corp-mtls");
    ASSERT_EQ(claims.size(), 9u);

    EXPECT_EQ(claims[0].type, claim_types::ISSUER);
    EXPECT_EQ(claims[0].value, cert.issuerName());
    EXPECT_EQ(claims[1].type, claim_types::THUMBPRINT);
    EXPECT_EQ(claims[1].value, cert.thumbprint());
    EXPECT_EQ(claims[1].valueType, claim_value_types::BASE64_BINARY);
    EXPECT_EQ(claims[2].type, claim_types::X500_DISTINGUISHED_NAME);
    EXPECT_EQ(claims[2].value, cert.subjectName());
    EXPECT_EQ(claims[3].type, claim_types::SERIAL_NUMBER);
    EXPECT_EQ(claims[3].value, "64");
    EXPECT_EQ(claims[4].type, claim_types::DNS);
    EXPECT_EQ(claims[4].value, "alice.example.com");
    EXPECT_EQ(claims[5].type, claim_types::NAME);
    EXPECT_EQ(claims[5].value, "alice");
    EXPECT_EQ(claims[6].type, claim_types::EMAIL);
    EXPECT_EQ(claims[6].value, "alice@example.com");
    EXPECT_EQ(claims[7].type, claim_types::UPN);
    EXPECT_EQ(claims[7].value, "alice@corp.example.com");
    EXPECT_EQ(claims[8].type, claim_types::URI);
    EXPECT_EQ(claims[8].value, "https://example.com/users/alice");

    for (const auto& claim : claims) {
        EXPECT_EQ(claim.issuer, "corp-mtls");
        if (claim.type != claim_types::THUMBPRINT) {
            EXPECT_EQ(claim.valueType, claim_value_types::STRING);
        }
    }
}

TEST_F(ClaimsMapperTest, MinimalCertificate_BlankClaimsSkipped) {
    CertSpec spec;
    spec.cn = "device-17";
    auto minimal = createCertificate(spec, clientKey_.get(), rootKey_.get(), rootCa_.get());

    auto claims = mapClaims(toCertificate(minimal.get()), AUTHENTICATION_SCHEME);
    ASSERT_EQ(claims.size(), 6u);
    EXPECT_EQ(claims[4].type, claim_types::DNS);
    EXPECT_EQ(claims[4].value, "device-17");
    EXPECT_EQ(claims[5].type, claim_types::NAME);

    for (const auto& claim : claims) {
        EXPECT_NE(claim.type, claim_types::EMAIL);
        EXPECT_NE(claim.type, claim_types::UPN);
        EXPECT_NE(claim.type, claim_types::URI);
    }
}

TEST_F(ClaimsMapperTest, CreatePrincipal) {
    auto client = createClientCert(clientKey_.get(), rootKey_.get(), rootCa_.get(), "bob");
    auto cert = toCertificate(client.get());

    ClaimsPrincipal principal = createPrincipal(cert, "Certificate");
    EXPECT_TRUE(principal.isAuthenticated());
    EXPECT_EQ(principal.authenticationType(), "Certificate");
    EXPECT_EQ(principal.findFirstValue(claim_types::NAME), "bob");
    EXPECT_EQ(principal.findFirstValue("http://example.com/unknown"), "");
    EXPECT_EQ(principal.findFirst("http://example.com/unknown"), nullptr);
}

TEST_F(ClaimsMapperTest, PrincipalJson) {
    auto client = createClientCert(clientKey_.get(), rootKey_.get(), rootCa_.get(), "carol");
    ClaimsPrincipal principal = createPrincipal(toCertificate(client.get()), "Certificate");

    Json::Value json = principal.toJson();
    EXPECT_EQ(json["authenticationType"].asString(), "Certificate");
    ASSERT_EQ(json["claims"].size(), principal.claims().size());
    EXPECT_EQ(json["claims"][0]["type"].asString(), claim_types::ISSUER);
    EXPECT_EQ(json["claims"][0]["issuer"].asString(), "Certificate");
}

TEST(ClaimsPrincipalTest, DefaultIsAnonymous) {
    ClaimsPrincipal anonymous;
    EXPECT_FALSE(anonymous.isAuthenticated());
    EXPECT_TRUE(anonymous.claims().empty());
}
