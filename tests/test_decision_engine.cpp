/**
 * @file test_decision_engine.cpp
 * @brief Unit tests for the authentication decision engine and its hooks
 */

#include <gtest/gtest.h>
#include <future>
#include <memory>
#include <stdexcept>
#include "certauth/auth/decision_engine.h"
#include "certauth/auth/claims.h"
#include "certauth/common/exceptions.h"
#include "test_helpers.h"

using namespace certauth;
using namespace certauth::auth;
using namespace certauth::validation;
using namespace test_helpers;

namespace {

/// Records every call and answers with a configured result
class FakeChainValidator : public IChainValidator {
public:
    ChainValidationResult result;
    bool failWithEngineError = false;

    mutable int calls = 0;
    mutable ChainPolicy lastPolicy;

    FakeChainValidator() {
        result.valid = true;
        result.depth = 2;
        result.path = "Leaf -> Root";
    }

    ChainValidationResult validate(const x509::Certificate& /*cert*/,
                                   const ChainPolicy& policy,
                                   const CancellationToken& /*token*/) const override {
        calls++;
        lastPolicy = policy;
        if (failWithEngineError) {
            throw common::ChainEngineException("X509_STORE_new failed");
        }
        return result;
    }
};

AuthenticationRequest securedRequest(const std::vector<uint8_t>& der) {
    AuthenticationRequest request;
    request.channelSecured = true;
    request.clientCertificate = der;
    return request;
}

} // namespace

class DecisionEngineTest : public ::testing::Test {
protected:
    UniqueKey rootKey_;
    UniqueKey clientKey_;
    UniqueCert rootCa_;
    UniqueCert client_;
    UniqueCert selfSigned_;

    FakeChainValidator validator_;
    CertificateAuthenticationOptions options_;

    void SetUp() override {
        rootKey_ = generateEcKey();
        clientKey_ = generateEcKey();
        rootCa_ = createRootCa(rootKey_.get());
        client_ = createClientCert(clientKey_.get(), rootKey_.get(), rootCa_.get(), "alice");
        selfSigned_ = createSelfSignedClient(clientKey_.get());
    }

    AuthenticateResult run(const AuthenticationRequest& request,
                           CertificateAuthenticationEvents events = {},
                           const CancellationToken& token = CancellationToken::none()) {
        CertificateAuthenticationEngine engine(options_, &validator_, std::move(events));
        return engine.authenticate(request, token);
    }

    std::vector<uint8_t> clientDer() const { return toDer(client_.get()); }
    std::vector<uint8_t> selfSignedDer() const { return toDer(selfSigned_.get()); }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(DecisionEngineTest, NullArgumentsThrow) {
    EXPECT_THROW(CertificateAuthenticationEngine(std::shared_ptr<OptionsMonitor>(), &validator_),
                 std::invalid_argument);
    EXPECT_THROW(CertificateAuthenticationEngine(options_, nullptr), std::invalid_argument);
}

TEST_F(DecisionEngineTest, InconsistentOptionsThrow) {
    options_.allowedCertificateTypes = AllowedCertificateTypes();
    EXPECT_THROW(CertificateAuthenticationEngine(options_, &validator_), common::ConfigException);
}

// ============================================================================
// No result
// ============================================================================

TEST_F(DecisionEngineTest, InsecureChannel_NoResult) {
    AuthenticationRequest request = securedRequest(clientDer());
    request.channelSecured = false;

    auto result = run(request);
    ASSERT_FALSE(result.isFatal());
    EXPECT_TRUE(result.outcome().isNoResult());
    EXPECT_EQ(validator_.calls, 0);
    EXPECT_EQ(responseStatusFor(result), 0);
}

TEST_F(DecisionEngineTest, MissingCertificate_NoResult) {
    AuthenticationRequest request;
    request.channelSecured = true;

    auto result = run(request);
    EXPECT_TRUE(result.outcome().isNoResult());
    EXPECT_EQ(validator_.calls, 0);
}

TEST_F(DecisionEngineTest, EmptyCertificate_NoResult) {
    auto result = run(securedRequest({}));
    EXPECT_TRUE(result.outcome().isNoResult());
}

// ============================================================================
// Policy gate
// ============================================================================

TEST_F(DecisionEngineTest, SelfSignedRejectedByDefault) {
    auto result = run(securedRequest(selfSignedDer()));
    ASSERT_FALSE(result.isFatal());
    EXPECT_EQ(result.outcome().kind, OutcomeKind::REJECTED);
    EXPECT_EQ(result.outcome().failureMessage, "self-signed not permitted");
    EXPECT_EQ(validator_.calls, 0);
    EXPECT_EQ(responseStatusFor(result), 403);
}

TEST_F(DecisionEngineTest, ChainedRejectedWhenOnlySelfSignedAllowed) {
    options_.allowedCertificateTypes = AllowedCertificateTypes::selfSigned();
    auto result = run(securedRequest(clientDer()));
    EXPECT_EQ(result.outcome().kind, OutcomeKind::REJECTED);
    EXPECT_EQ(result.outcome().failureMessage, "chained not permitted");
    EXPECT_EQ(validator_.calls, 0);
}

TEST_F(DecisionEngineTest, SelfSignedAllowedUsesRelaxedPolicy) {
    options_.allowedCertificateTypes = AllowedCertificateTypes::all();
    options_.revocationMode = RevocationMode::ONLINE_REQUIRED;

    auto result = run(securedRequest(selfSignedDer()));
    EXPECT_TRUE(result.outcome().isValid());
    EXPECT_EQ(validator_.calls, 1);
    EXPECT_EQ(validator_.lastPolicy.revocationMode, RevocationMode::NO_CHECK);
    EXPECT_EQ(validator_.lastPolicy.extraStore.size(), 1u);
    EXPECT_TRUE(validator_.lastPolicy.hasFlag(VerificationFlag::ALLOW_UNKNOWN_CERTIFICATE_AUTHORITY));
}

// ============================================================================
// Chain outcome
// ============================================================================

TEST_F(DecisionEngineTest, ValidChain_DefaultPrincipal) {
    options_.claimsIssuer = "corp-mtls";
    auto result = run(securedRequest(clientDer()));

    ASSERT_FALSE(result.isFatal());
    const ValidationOutcome& outcome = result.outcome();
    ASSERT_TRUE(outcome.isValid());
    ASSERT_TRUE(outcome.principal.has_value());
    EXPECT_EQ(outcome.principal->authenticationType(), "Certificate");
    EXPECT_EQ(outcome.principal->findFirstValue(claim_types::NAME), "alice");
    EXPECT_EQ(outcome.principal->findFirst(claim_types::NAME)->issuer, "corp-mtls");
    EXPECT_EQ(responseStatusFor(result), 200);

    EXPECT_EQ(validator_.lastPolicy.revocationMode, RevocationMode::ONLINE_REQUIRED);
    EXPECT_EQ(validator_.lastPolicy.revocationFlag, RevocationFlag::EXCLUDE_ROOT);
    ASSERT_EQ(validator_.lastPolicy.applicationPolicy.size(), 1u);
}

TEST_F(DecisionEngineTest, ValidChain_RawCertificateProperty) {
    auto result = run(securedRequest(clientDer()));
    EXPECT_EQ(decodeRawCertificateProperty(result.outcome().properties), clientDer());
}

TEST_F(DecisionEngineTest, InvalidChain_CarriesStatuses) {
    validator_.result.valid = false;
    validator_.result.statuses = {
        {ChainStatusFlag::REVOKED, "depth 0 (/CN=alice): certificate revoked"},
        {ChainStatusFlag::NOT_TIME_VALID, "depth 0 (/CN=alice): certificate has expired"}
    };

    auto result = run(securedRequest(clientDer()));
    ASSERT_FALSE(result.isFatal());
    EXPECT_EQ(result.outcome().kind, OutcomeKind::CHAIN_INVALID);
    EXPECT_EQ(result.outcome().failureMessage, CHAIN_INVALID_MESSAGE);
    EXPECT_EQ(result.outcome().chainStatus, validator_.result.statuses);
    EXPECT_FALSE(result.outcome().principal.has_value());
}

TEST_F(DecisionEngineTest, EndToEndWithOpenSslValidator) {
    StaticTrustAnchorProvider anchors;
    anchors.addRoot(toCertificate(rootCa_.get()));
    ChainValidator chainValidator(&anchors);

    options_.revocationMode = RevocationMode::NO_CHECK;
    CertificateAuthenticationEngine engine(options_, &chainValidator);

    auto valid = engine.authenticate(securedRequest(clientDer()));
    EXPECT_TRUE(valid.outcome().isValid());

    auto expired = createExpiredClientCert(clientKey_.get(), rootKey_.get(), rootCa_.get());
    auto invalid = engine.authenticate(securedRequest(toDer(expired.get())));
    ASSERT_EQ(invalid.outcome().kind, OutcomeKind::CHAIN_INVALID);
    EXPECT_EQ(invalid.outcome().chainStatus[0].status, ChainStatusFlag::NOT_TIME_VALID);
}

TEST_F(DecisionEngineTest, SnapshotFollowsMonitorUpdates) {
    auto monitor = std::make_shared<OptionsMonitor>(options_);
    CertificateAuthenticationEngine engine(monitor, &validator_);

    EXPECT_EQ(engine.authenticate(securedRequest(selfSignedDer())).outcome().kind, OutcomeKind::REJECTED);

    CertificateAuthenticationOptions next = options_;
    next.allowedCertificateTypes = AllowedCertificateTypes::all();
    monitor->update(next);

    EXPECT_TRUE(engine.authenticate(securedRequest(selfSignedDer())).outcome().isValid());
}

// ============================================================================
// Fatal failures
// ============================================================================

TEST_F(DecisionEngineTest, MalformedDer_Fatal) {
    auto result = run(securedRequest({0x30, 0x82, 0x01}));
    ASSERT_TRUE(result.isFatal());
    EXPECT_EQ(result.failure().code, common::ErrorCode::PARSE_DER_ERROR);
    EXPECT_EQ(responseStatusFor(result), 500);
    EXPECT_THROW(result.rethrowIfFatal(), common::ParsingException);
}

TEST_F(DecisionEngineTest, ChainEngineError_Fatal) {
    validator_.failWithEngineError = true;
    auto result = run(securedRequest(clientDer()));
    ASSERT_TRUE(result.isFatal());
    EXPECT_EQ(result.failure().code, common::ErrorCode::CHAIN_ENGINE_FAILURE);
    EXPECT_THROW(result.rethrowIfFatal(), common::ChainEngineException);
}

TEST(DescribeFailureTest, MapsExceptionTypes) {
    EXPECT_EQ(describeFailure(std::make_exception_ptr(common::ConfigException("x"))).code,
              common::ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_EQ(describeFailure(std::make_exception_ptr(common::HookException("x"))).code,
              common::ErrorCode::HOOK_INVALID_RESULT);
    EXPECT_EQ(describeFailure(std::make_exception_ptr(common::OperationCancelledException("x"))).code,
              common::ErrorCode::OPERATION_CANCELLED);
    EXPECT_EQ(describeFailure(std::make_exception_ptr(std::runtime_error("boom"))).code,
              common::ErrorCode::SYSTEM_INTERNAL_ERROR);
    EXPECT_EQ(describeFailure(std::make_exception_ptr(42)).message, "Unknown exception");
}

// ============================================================================
// Validate certificate hook
// ============================================================================

TEST_F(DecisionEngineTest, ValidateHook_CustomPrincipal) {
    CertificateAuthenticationEvents events;
    events.onValidateCertificate = ValidateHook::fromFunction(
        [](const ValidateCertificateContext& context) -> HookResult {
            std::vector<Claim> claims = {{claim_types::NAME, "custom-" + context.clientCertificate.nameInfo(x509::NameType::SIMPLE_NAME)}};
            return context.success(ClaimsPrincipal("Certificate", claims));
        });

    auto result = run(securedRequest(clientDer()), std::move(events));
    ASSERT_TRUE(result.outcome().isValid());
    EXPECT_EQ(result.outcome().principal->findFirstValue(claim_types::NAME), "custom-alice");
    EXPECT_EQ(result.outcome().principal->claims().size(), 1u);
    EXPECT_EQ(decodeRawCertificateProperty(result.outcome().properties), clientDer());
}

TEST_F(DecisionEngineTest, ValidateHook_Rejects) {
    CertificateAuthenticationEvents events;
    events.onValidateCertificate = ValidateHook::fromFunction(
        [](const ValidateCertificateContext& context) -> HookResult {
            return context.fail("certificate not on allow list");
        });

    auto result = run(securedRequest(clientDer()), std::move(events));
    EXPECT_EQ(result.outcome().kind, OutcomeKind::REJECTED);
    EXPECT_EQ(result.outcome().failureMessage, "certificate not on allow list");
    EXPECT_TRUE(result.outcome().properties.empty());
}

TEST_F(DecisionEngineTest, ValidateHook_DefersToDefault) {
    int invoked = 0;
    CertificateAuthenticationEvents events;
    events.onValidateCertificate = ValidateHook::fromFunction(
        [&invoked](const ValidateCertificateContext&) -> HookResult {
            invoked++;
            return ValidationOutcome::noResult();
        });

    auto result = run(securedRequest(clientDer()), std::move(events));
    EXPECT_EQ(invoked, 1);
    ASSERT_TRUE(result.outcome().isValid());
    EXPECT_EQ(result.outcome().principal->findFirstValue(claim_types::NAME), "alice");
}

TEST_F(DecisionEngineTest, ValidateHook_SeesRequestContextAndOptions) {
    options_.claimsIssuer = "edge";
    std::string seenTenant;
    std::string seenIssuer;

    CertificateAuthenticationEvents events;
    events.onValidateCertificate = ValidateHook::fromFunction(
        [&](const ValidateCertificateContext& context) -> HookResult {
            seenTenant = context.requestContext.at("tenant");
            seenIssuer = context.options->claimsIssuer;
            return std::nullopt;
        });

    AuthenticationRequest request = securedRequest(clientDer());
    request.context["tenant"] = "acme";
    run(request, std::move(events));

    EXPECT_EQ(seenTenant, "acme");
    EXPECT_EQ(seenIssuer, "edge");
}

TEST_F(DecisionEngineTest, ValidateHook_NotCalledForInvalidChain) {
    validator_.result.valid = false;
    validator_.result.statuses = {{ChainStatusFlag::UNTRUSTED_ROOT, "depth 1 (/CN=Test Root CA): self-signed certificate in certificate chain"}};

    bool invoked = false;
    CertificateAuthenticationEvents events;
    events.onValidateCertificate = ValidateHook::fromFunction(
        [&invoked](const ValidateCertificateContext&) -> HookResult {
            invoked = true;
            return std::nullopt;
        });

    auto result = run(securedRequest(clientDer()), std::move(events));
    EXPECT_FALSE(invoked);
    EXPECT_EQ(result.outcome().kind, OutcomeKind::CHAIN_INVALID);
}

TEST_F(DecisionEngineTest, ValidateHook_DeferredFuture) {
    CertificateAuthenticationEvents events;
    events.onValidateCertificate = ValidateHook([](ValidateCertificateContext context) {
        return std::async(std::launch::deferred, [context]() -> HookResult {
            return context.fail("deferred rejection");
        });
    });

    auto result = run(securedRequest(clientDer()), std::move(events));
    EXPECT_EQ(result.outcome().failureMessage, "deferred rejection");
}

TEST_F(DecisionEngineTest, ValidateHook_InvalidFuture) {
    CertificateAuthenticationEvents events;
    events.onValidateCertificate = ValidateHook([](ValidateCertificateContext) {
        return std::future<HookResult>();
    });

    auto result = run(securedRequest(clientDer()), std::move(events));
    ASSERT_TRUE(result.isFatal());
    EXPECT_EQ(result.failure().code, common::ErrorCode::HOOK_INVALID_RESULT);
}

TEST_F(DecisionEngineTest, ValidateHook_CancelledWhileWaiting) {
    auto neverFulfilled = std::make_shared<std::promise<HookResult>>();
    CertificateAuthenticationEvents events;
    events.onValidateCertificate = ValidateHook([neverFulfilled](ValidateCertificateContext) {
        return neverFulfilled->get_future();
    });

    auto token = CancellationToken::none().withTimeout(std::chrono::milliseconds(50));
    auto result = run(securedRequest(clientDer()), std::move(events), token);

    ASSERT_TRUE(result.isFatal());
    EXPECT_EQ(result.failure().code, common::ErrorCode::OPERATION_CANCELLED);
    EXPECT_THROW(result.rethrowIfFatal(), common::OperationCancelledException);
}

TEST_F(DecisionEngineTest, ValidateHook_Throws) {
    CertificateAuthenticationEvents events;
    events.onValidateCertificate = ValidateHook::fromFunction(
        [](const ValidateCertificateContext&) -> HookResult {
            throw std::runtime_error("directory unavailable");
        });

    auto result = run(securedRequest(clientDer()), std::move(events));
    ASSERT_TRUE(result.isFatal());
    EXPECT_EQ(result.failure().code, common::ErrorCode::SYSTEM_INTERNAL_ERROR);
    EXPECT_EQ(result.failure().message, "directory unavailable");
}

TEST_F(DecisionEngineTest, ValidateHook_ValidWithoutPrincipal) {
    CertificateAuthenticationEvents events;
    events.onValidateCertificate = ValidateHook::fromFunction(
        [](const ValidateCertificateContext&) -> HookResult {
            ValidationOutcome outcome;
            outcome.kind = OutcomeKind::VALID;
            return outcome;
        });

    auto result = run(securedRequest(clientDer()), std::move(events));
    ASSERT_TRUE(result.isFatal());
    EXPECT_EQ(result.failure().code, common::ErrorCode::HOOK_INVALID_RESULT);
    EXPECT_THROW(result.rethrowIfFatal(), common::HookException);
}

TEST_F(DecisionEngineTest, ValidateHook_ValidWithoutPrincipalReachesFailureHook) {
    common::ErrorCode seenCode = common::ErrorCode::SUCCESS;
    CertificateAuthenticationEvents events;
    events.onValidateCertificate = ValidateHook::fromFunction(
        [](const ValidateCertificateContext&) -> HookResult {
            ValidationOutcome outcome;
            outcome.kind = OutcomeKind::VALID;
            return outcome;
        });
    events.onAuthenticationFailed = FailureHook::fromFunction(
        [&seenCode](const AuthenticationFailedContext& context) -> HookResult {
            seenCode = context.failure.code;
            return context.fail("hook misconfigured");
        });

    auto result = run(securedRequest(clientDer()), std::move(events));
    EXPECT_EQ(seenCode, common::ErrorCode::HOOK_INVALID_RESULT);
    ASSERT_FALSE(result.isFatal());
    EXPECT_EQ(result.outcome().failureMessage, "hook misconfigured");
}

// ============================================================================
// Authentication failed hook
// ============================================================================

TEST_F(DecisionEngineTest, FailureHook_Recovers) {
    common::ErrorCode seenCode = common::ErrorCode::SUCCESS;
    CertificateAuthenticationEvents events;
    events.onAuthenticationFailed = FailureHook::fromFunction(
        [&seenCode](const AuthenticationFailedContext& context) -> HookResult {
            seenCode = context.failure.code;
            return context.fail("certificate could not be read");
        });

    auto result = run(securedRequest({0x01, 0x02}), std::move(events));
    EXPECT_EQ(seenCode, common::ErrorCode::PARSE_DER_ERROR);
    ASSERT_FALSE(result.isFatal());
    EXPECT_EQ(result.outcome().kind, OutcomeKind::REJECTED);
    EXPECT_EQ(result.outcome().failureMessage, "certificate could not be read");
}

TEST_F(DecisionEngineTest, FailureHook_DeclinesKeepsOriginal) {
    CertificateAuthenticationEvents events;
    events.onAuthenticationFailed = FailureHook::fromFunction(
        [](const AuthenticationFailedContext&) -> HookResult { return std::nullopt; });

    auto result = run(securedRequest({0x01, 0x02}), std::move(events));
    ASSERT_TRUE(result.isFatal());
    EXPECT_EQ(result.failure().code, common::ErrorCode::PARSE_DER_ERROR);
    EXPECT_THROW(result.rethrowIfFatal(), common::ParsingException);
}

TEST_F(DecisionEngineTest, FailureHook_Throws) {
    CertificateAuthenticationEvents events;
    events.onAuthenticationFailed = FailureHook::fromFunction(
        [](const AuthenticationFailedContext&) -> HookResult {
            throw std::runtime_error("audit sink down");
        });

    auto result = run(securedRequest({0x01, 0x02}), std::move(events));
    ASSERT_TRUE(result.isFatal());
    EXPECT_EQ(result.failure().code, common::ErrorCode::HOOK_FAILED);
    EXPECT_THROW(result.rethrowIfFatal(), std::runtime_error);
}

TEST_F(DecisionEngineTest, FailureHook_NoResultAdopted) {
    CertificateAuthenticationEvents events;
    events.onAuthenticationFailed = FailureHook::fromFunction(
        [](const AuthenticationFailedContext& context) -> HookResult { return context.noResult(); });

    validator_.failWithEngineError = true;
    auto result = run(securedRequest(clientDer()), std::move(events));
    ASSERT_FALSE(result.isFatal());
    EXPECT_TRUE(result.outcome().isNoResult());
}

TEST_F(DecisionEngineTest, FailureHook_CancelledKeepsOriginal) {
    auto neverFulfilled = std::make_shared<std::promise<HookResult>>();
    CertificateAuthenticationEvents events;
    events.onAuthenticationFailed = FailureHook([neverFulfilled](AuthenticationFailedContext) {
        return neverFulfilled->get_future();
    });

    CancellationSource source;
    source.cancel();
    auto result = run(securedRequest({0x01, 0x02}), std::move(events), source.token());

    ASSERT_TRUE(result.isFatal());
    EXPECT_EQ(result.failure().code, common::ErrorCode::PARSE_DER_ERROR);
}

// ============================================================================
// Hook wrappers
// ============================================================================

TEST(HooksTest, UnsetHooksDefer) {
    ValidateHook validate;
    FailureHook failure;
    EXPECT_FALSE(validate.isSet());
    EXPECT_FALSE(failure.isSet());
    EXPECT_FALSE(ValidateHook::fromFunction(nullptr).isSet());

    AuthenticationFailedContext context;
    EXPECT_FALSE(failure.tryRecover(context).get().has_value());
}

TEST(HooksTest, ReadyHookResult) {
    auto future = readyHookResult(ValidationOutcome::rejected("x"));
    ASSERT_EQ(future.wait_for(std::chrono::milliseconds(0)), std::future_status::ready);
    EXPECT_EQ(future.get()->failureMessage, "x");
}
