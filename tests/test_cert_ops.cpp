/**
 * @file test_cert_ops.cpp
 * @brief Unit tests for cert_ops pure X.509 operations
 *
 * Tests idempotency: identical inputs must produce identical outputs across
 * repeated invocations (no hidden state, no side effects).
 */

#include <gtest/gtest.h>
#include "certauth/validation/cert_ops.h"
#include "test_helpers.h"

using namespace certauth::validation;
using namespace test_helpers;

class CertOpsTest : public ::testing::Test {
protected:
    UniqueKey rootKey_;
    UniqueKey clientKey_;
    UniqueCert rootCa_;
    UniqueCert client_;

    void SetUp() override {
        rootKey_ = generateRsaKey(2048);
        clientKey_ = generateEcKey();
        rootCa_ = createRootCa(rootKey_.get(), "Test Root CA");
        client_ = createClientCert(clientKey_.get(), rootKey_.get(), rootCa_.get(), "alice");
    }
};

// ============================================================================
// verifyCertificateSignature
// ============================================================================

TEST_F(CertOpsTest, VerifySignature_ValidChain) {
    EXPECT_TRUE(verifyCertificateSignature(client_.get(), rootCa_.get()));
}

TEST_F(CertOpsTest, VerifySignature_SelfSigned) {
    EXPECT_TRUE(verifyCertificateSignature(rootCa_.get(), rootCa_.get()));
}

TEST_F(CertOpsTest, VerifySignature_WrongIssuer) {
    auto otherKey = generateEcKey();
    auto otherCa = createRootCa(otherKey.get(), "Other Root CA");
    EXPECT_FALSE(verifyCertificateSignature(client_.get(), otherCa.get()));
}

TEST_F(CertOpsTest, VerifySignature_NullCert) {
    EXPECT_FALSE(verifyCertificateSignature(nullptr, rootCa_.get()));
    EXPECT_FALSE(verifyCertificateSignature(client_.get(), nullptr));
    EXPECT_FALSE(verifyCertificateSignature(nullptr, nullptr));
}

// ============================================================================
// isCertificateExpired / isCertificateNotYetValid
// ============================================================================

TEST_F(CertOpsTest, Expired_ValidCert) {
    EXPECT_FALSE(isCertificateExpired(client_.get()));
}

TEST_F(CertOpsTest, Expired_ExpiredCert) {
    auto expired = createExpiredClientCert(clientKey_.get(), rootKey_.get(), rootCa_.get());
    EXPECT_TRUE(isCertificateExpired(expired.get()));
}

TEST_F(CertOpsTest, Expired_NullReturnsTrue) {
    EXPECT_TRUE(isCertificateExpired(nullptr));
}

TEST_F(CertOpsTest, NotYetValid_FutureCert) {
    CertSpec spec = clientSpec("future");
    spec.notBeforeOffset = 30 * ONE_DAY;
    auto future = createCertificate(spec, clientKey_.get(), rootKey_.get(), rootCa_.get());
    EXPECT_TRUE(isCertificateNotYetValid(future.get()));
    EXPECT_FALSE(isCertificateNotYetValid(client_.get()));
}

// ============================================================================
// isSelfSigned / hasMatchingSubjectAndIssuer
// ============================================================================

TEST_F(CertOpsTest, SelfSigned_Root) {
    EXPECT_TRUE(isSelfSigned(rootCa_.get()));
}

TEST_F(CertOpsTest, SelfSigned_IssuedCertIsNot) {
    EXPECT_FALSE(hasMatchingSubjectAndIssuer(client_.get()));
    EXPECT_FALSE(isSelfSigned(client_.get()));
}

TEST_F(CertOpsTest, SelfSigned_MatchingNamesForeignSignature) {
    auto foreignKey = generateEcKey();
    auto forged = createForgedSelfIssued(clientKey_.get(), foreignKey.get());

    EXPECT_TRUE(hasMatchingSubjectAndIssuer(forged.get()));
    EXPECT_FALSE(isSelfSigned(forged.get()));
}

TEST_F(CertOpsTest, SelfSigned_Null) {
    EXPECT_FALSE(isSelfSigned(nullptr));
}

// ============================================================================
// checkExtendedKeyUsage
// ============================================================================

TEST_F(CertOpsTest, Eku_ClientAuthPermitted) {
    EXPECT_EQ(checkExtendedKeyUsage(client_.get(), "1.3.6.1.5.5.7.3.2", false),
              KeyUsagePermission::PERMITTED);
}

TEST_F(CertOpsTest, Eku_OtherPurposeNotPermitted) {
    CertSpec spec = clientSpec("server");
    spec.extendedKeyUsage = "serverAuth";
    auto server = createCertificate(spec, clientKey_.get(), rootKey_.get(), rootCa_.get());

    EXPECT_EQ(checkExtendedKeyUsage(server.get(), "1.3.6.1.5.5.7.3.2", false),
              KeyUsagePermission::NOT_PERMITTED);
}

TEST_F(CertOpsTest, Eku_AbsentIsUnconstrained) {
    EXPECT_EQ(checkExtendedKeyUsage(rootCa_.get(), "1.3.6.1.5.5.7.3.2", true),
              KeyUsagePermission::UNCONSTRAINED);
}

TEST_F(CertOpsTest, Eku_AnyExtendedKeyUsageOnlyWhenAccepted) {
    CertSpec spec = clientSpec("any");
    spec.extendedKeyUsage = "anyExtendedKeyUsage";
    auto any = createCertificate(spec, clientKey_.get(), rootKey_.get(), rootCa_.get());

    EXPECT_EQ(checkExtendedKeyUsage(any.get(), "1.3.6.1.5.5.7.3.2", true),
              KeyUsagePermission::PERMITTED);
    EXPECT_EQ(checkExtendedKeyUsage(any.get(), "1.3.6.1.5.5.7.3.2", false),
              KeyUsagePermission::NOT_PERMITTED);
}

TEST_F(CertOpsTest, Eku_InvalidOid) {
    EXPECT_EQ(checkExtendedKeyUsage(client_.get(), "not-an-oid", false),
              KeyUsagePermission::NOT_PERMITTED);
}

// ============================================================================
// DN, fingerprint, time
// ============================================================================

TEST_F(CertOpsTest, SubjectAndIssuerDn) {
    std::string subject = getSubjectDn(client_.get());
    EXPECT_NE(subject.find("CN=alice"), std::string::npos);
    EXPECT_EQ(getIssuerDn(client_.get()), getSubjectDn(rootCa_.get()));
    EXPECT_EQ(getSubjectDn(nullptr), "");
}

TEST_F(CertOpsTest, Fingerprint_Sha256Hex) {
    std::string fp = getCertificateFingerprint(client_.get());
    EXPECT_EQ(fp.size(), 64u);
    EXPECT_EQ(fp, getCertificateFingerprint(client_.get()));
    EXPECT_NE(fp, getCertificateFingerprint(rootCa_.get()));
}

TEST_F(CertOpsTest, Asn1TimeToIso8601_Format) {
    std::string iso = asn1TimeToIso8601(X509_get0_notAfter(client_.get()));
    ASSERT_EQ(iso.size(), 20u);
    EXPECT_EQ(iso[4], '-');
    EXPECT_EQ(iso[10], 'T');
    EXPECT_EQ(iso.back(), 'Z');
    EXPECT_EQ(asn1TimeToIso8601(nullptr), "");
}
