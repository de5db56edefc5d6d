/**
 * @file chain_validator.cpp
 * @brief OpenSSL-backed chain validator implementation
 *
 * Relaxation flags and revocation scope are enforced in the verify
 * callback: it returns 1 for every error so the primitive keeps going,
 * records the errors that are not relaxed, and returns 0 only to abort a
 * cancelled build. Required application policies are checked on the
 * built path afterwards.
 */

#include "certauth/validation/chain_validator.h"
#include "certauth/validation/cert_ops.h"
#include "certauth/common/exceptions.h"

#include <memory>
#include <set>
#include <stdexcept>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/x509_vfy.h>

namespace certauth {
namespace validation {

namespace {

struct StoreDeleter { void operator()(X509_STORE* p) const { X509_STORE_free(p); } };
struct StoreCtxDeleter { void operator()(X509_STORE_CTX* p) const { X509_STORE_CTX_free(p); } };
struct StackDeleter { void operator()(STACK_OF(X509)* p) const { sk_X509_free(p); } };

using UniqueStore = std::unique_ptr<X509_STORE, StoreDeleter>;
using UniqueStoreCtx = std::unique_ptr<X509_STORE_CTX, StoreCtxDeleter>;
using UniqueStack = std::unique_ptr<STACK_OF(X509), StackDeleter>;

/// Per-build state shared with the verify callback through ex_data
struct VerifyState {
    const ChainPolicy* policy = nullptr;
    const CancellationToken* token = nullptr;
    std::vector<ChainStatusEntry> statuses;
    bool cancelled = false;
    std::string cancelReason;
};

int verifyStateIndex() {
    static const int index =
        X509_STORE_CTX_get_ex_new_index(0, nullptr, nullptr, nullptr, nullptr);
    return index;
}

std::string openSslErrorString() {
    unsigned long err = ERR_get_error();
    ERR_clear_error();
    if (err == 0) return "unknown error";
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return buf;
}

bool isTimeError(int error) {
    switch (error) {
        case X509_V_ERR_CERT_HAS_EXPIRED:
        case X509_V_ERR_CERT_NOT_YET_VALID:
        case X509_V_ERR_ERROR_IN_CERT_NOT_BEFORE_FIELD:
        case X509_V_ERR_ERROR_IN_CERT_NOT_AFTER_FIELD:
            return true;
        default:
            return false;
    }
}

bool isUnknownAuthorityError(int error) {
    switch (error) {
        case X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT:
        case X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN:
        case X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT:
        case X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT_LOCALLY:
        case X509_V_ERR_UNABLE_TO_VERIFY_LEAF_SIGNATURE:
        case X509_V_ERR_CERT_UNTRUSTED:
            return true;
        default:
            return false;
    }
}

/// Revocation status could not be determined (the certificate is not known to be revoked)
bool isRevocationUnknownError(int error) {
    switch (error) {
        case X509_V_ERR_UNABLE_TO_GET_CRL:
        case X509_V_ERR_UNABLE_TO_GET_CRL_ISSUER:
        case X509_V_ERR_CRL_HAS_EXPIRED:
        case X509_V_ERR_CRL_NOT_YET_VALID:
        case X509_V_ERR_CRL_SIGNATURE_FAILURE:
        case X509_V_ERR_UNABLE_TO_DECRYPT_CRL_SIGNATURE:
        case X509_V_ERR_ERROR_IN_CRL_LAST_UPDATE_FIELD:
        case X509_V_ERR_ERROR_IN_CRL_NEXT_UPDATE_FIELD:
        case X509_V_ERR_KEYUSAGE_NO_CRL_SIGN:
        case X509_V_ERR_DIFFERENT_CRL_SCOPE:
        case X509_V_ERR_UNHANDLED_CRITICAL_CRL_EXTENSION:
            return true;
        default:
            return false;
    }
}

bool isRevocationError(int error) {
    return error == X509_V_ERR_CERT_REVOKED || isRevocationUnknownError(error);
}

/**
 * @brief Decide whether the policy tolerates an error reported at depth
 */
bool isRelaxed(int error, int depth, bool atSelfSignedTop, const ChainPolicy& policy) {
    if (policy.hasFlag(VerificationFlag::IGNORE_NOT_TIME_VALID) && isTimeError(error)) {
        return true;
    }
    if (policy.hasFlag(VerificationFlag::ALLOW_UNKNOWN_CERTIFICATE_AUTHORITY) &&
        isUnknownAuthorityError(error)) {
        return true;
    }
    if (!isRevocationError(error)) {
        return false;
    }

    if (policy.revocationMode == RevocationMode::NO_CHECK) {
        return true;
    }
    if (policy.revocationFlag == RevocationFlag::EXCLUDE_ROOT && atSelfSignedTop) {
        return true;
    }
    if (policy.revocationFlag == RevocationFlag::END_CERTIFICATE_ONLY && depth > 0) {
        return true;
    }
    if (policy.revocationMode == RevocationMode::ONLINE_BEST_EFFORT &&
        (error == X509_V_ERR_UNABLE_TO_GET_CRL || error == X509_V_ERR_UNABLE_TO_GET_CRL_ISSUER)) {
        return true;
    }
    if (policy.hasFlag(VerificationFlag::IGNORE_END_REVOCATION_UNKNOWN) && depth == 0 &&
        isRevocationUnknownError(error)) {
        return true;
    }
    return false;
}

std::string formatDetail(int depth, X509* cert, const std::string& message) {
    return "depth " + std::to_string(depth) + " (" + getSubjectDn(cert) + "): " + message;
}

int verifyCallback(int ok, X509_STORE_CTX* ctx) {
    auto* state = static_cast<VerifyState*>(X509_STORE_CTX_get_ex_data(ctx, verifyStateIndex()));
    if (!state) {
        return ok;
    }

    if (state->token->isCancelled()) {
        if (!state->cancelled) {
            state->cancelled = true;
            state->cancelReason = state->token->reason();
        }
        X509_STORE_CTX_set_error(ctx, X509_V_ERR_APPLICATION_VERIFICATION);
        return 0;
    }

    if (ok) {
        return 1;
    }

    int error = X509_STORE_CTX_get_error(ctx);
    int depth = X509_STORE_CTX_get_error_depth(ctx);
    X509* current = X509_STORE_CTX_get_current_cert(ctx);

    STACK_OF(X509)* chain = X509_STORE_CTX_get0_chain(ctx);
    int top = chain ? sk_X509_num(chain) - 1 : -1;
    bool atSelfSignedTop = (depth == top && isSelfSigned(current));

    if (!isRelaxed(error, depth, atSelfSignedTop, *state->policy)) {
        state->statuses.push_back({
            ChainValidator::mapVerifyError(error, state->policy->revocationMode),
            formatDetail(depth, current, X509_verify_cert_error_string(error))
        });
    }

    // Keep building so every status is collected
    return 1;
}

unsigned long revocationVerifyFlags(const ChainPolicy& policy) {
    if (policy.revocationMode == RevocationMode::NO_CHECK) {
        return 0;
    }
    switch (policy.revocationFlag) {
        case RevocationFlag::END_CERTIFICATE_ONLY:
            return X509_V_FLAG_CRL_CHECK;
        case RevocationFlag::ENTIRE_CHAIN:
        case RevocationFlag::EXCLUDE_ROOT:
            return X509_V_FLAG_CRL_CHECK | X509_V_FLAG_CRL_CHECK_ALL;
    }
    return 0;
}

void addTrustAnchor(X509_STORE* store, const x509::Certificate& cert) {
    if (X509_STORE_add_cert(store, cert.get()) != 1) {
        throw common::ChainEngineException("Failed to add trust anchor " +
            getSubjectDn(cert.get()) + ": " + openSslErrorString());
    }
}

void requireValidOids(const std::vector<std::string>& oids) {
    for (const auto& oid : oids) {
        ASN1_OBJECT* obj = OBJ_txt2obj(oid.c_str(), 1);
        if (!obj) {
            ERR_clear_error();
            throw common::ChainEngineException("Invalid application policy OID: " + oid);
        }
        ASN1_OBJECT_free(obj);
    }
}

/**
 * @brief Check required application policies along the built path
 *
 * The leaf must list every OID explicitly. Issuers carrying an
 * extendedKeyUsage extension must list it or anyExtendedKeyUsage.
 */
void checkApplicationPolicy(STACK_OF(X509)* chain, const std::vector<std::string>& oids,
                            std::vector<ChainStatusEntry>& statuses) {
    for (int i = 0; i < sk_X509_num(chain); i++) {
        X509* cert = sk_X509_value(chain, i);
        bool isLeaf = (i == 0);

        for (const auto& oid : oids) {
            KeyUsagePermission permission = checkExtendedKeyUsage(cert, oid, !isLeaf);
            bool permitted = (permission == KeyUsagePermission::PERMITTED) ||
                             (!isLeaf && permission == KeyUsagePermission::UNCONSTRAINED);
            if (!permitted) {
                statuses.push_back({
                    ChainStatusFlag::NOT_VALID_FOR_USAGE,
                    formatDetail(i, cert, "certificate is not valid for application policy " + oid)
                });
            }
        }
    }
}

std::string describePath(STACK_OF(X509)* chain) {
    std::string path;
    for (int i = 0; i < sk_X509_num(chain); i++) {
        X509* cert = sk_X509_value(chain, i);
        if (i == 0) {
            path = "Leaf";
        } else if (isSelfSigned(cert)) {
            path += " -> Root";
        } else {
            path += " -> Intermediate";
        }
    }
    return path;
}

} // namespace

ChainValidator::ChainValidator(const ITrustAnchorProvider* trustProvider,
                               const ICrlProvider* crlProvider)
    : trustProvider_(trustProvider)
    , crlProvider_(crlProvider)
{
    if (!trustProvider_) {
        throw std::invalid_argument("ChainValidator: trustProvider cannot be nullptr");
    }
}

ChainStatusFlag ChainValidator::mapVerifyError(int error, RevocationMode mode) {
    if (isTimeError(error)) {
        return ChainStatusFlag::NOT_TIME_VALID;
    }
    if (error == X509_V_ERR_UNABLE_TO_GET_CRL && mode == RevocationMode::OFFLINE) {
        return ChainStatusFlag::OFFLINE_REVOCATION;
    }
    if (isRevocationUnknownError(error)) {
        return ChainStatusFlag::REVOCATION_STATUS_UNKNOWN;
    }

    switch (error) {
        case X509_V_ERR_CERT_REVOKED:
            return ChainStatusFlag::REVOKED;

        case X509_V_ERR_CERT_SIGNATURE_FAILURE:
        case X509_V_ERR_UNABLE_TO_DECRYPT_CERT_SIGNATURE:
        case X509_V_ERR_UNABLE_TO_DECODE_ISSUER_PUBLIC_KEY:
            return ChainStatusFlag::NOT_SIGNATURE_VALID;

        case X509_V_ERR_INVALID_PURPOSE:
            return ChainStatusFlag::NOT_VALID_FOR_USAGE;

        case X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT:
        case X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN:
        case X509_V_ERR_CERT_UNTRUSTED:
        case X509_V_ERR_CERT_REJECTED:
            return ChainStatusFlag::UNTRUSTED_ROOT;

        case X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT:
        case X509_V_ERR_UNABLE_TO_GET_ISSUER_CERT_LOCALLY:
        case X509_V_ERR_UNABLE_TO_VERIFY_LEAF_SIGNATURE:
            return ChainStatusFlag::PARTIAL_CHAIN;

        case X509_V_ERR_INVALID_CA:
        case X509_V_ERR_PATH_LENGTH_EXCEEDED:
            return ChainStatusFlag::INVALID_BASIC_CONSTRAINTS;

        case X509_V_ERR_UNHANDLED_CRITICAL_EXTENSION:
        case X509_V_ERR_INVALID_EXTENSION:
        case X509_V_ERR_KEYUSAGE_NO_CERTSIGN:
            return ChainStatusFlag::INVALID_EXTENSION;

        default:
            return ChainStatusFlag::OTHER;
    }
}

ChainValidationResult ChainValidator::validate(const x509::Certificate& cert,
                                               const ChainPolicy& policy,
                                               const CancellationToken& token) const {
    ChainValidationResult result;

    if (token.isCancelled()) {
        result.statuses.push_back({ChainStatusFlag::CANCELLED,
            std::string("chain build not started: ") + token.reason()});
        return result;
    }

    requireValidOids(policy.applicationPolicy);

    // Step 1: Per-validation store with trust anchors
    UniqueStore store(X509_STORE_new());
    if (!store) {
        throw common::ChainEngineException("X509_STORE_new failed: " + openSslErrorString());
    }

    std::vector<x509::Certificate> roots = trustProvider_->trustedRoots();
    for (const auto& root : roots) {
        addTrustAnchor(store.get(), root);
    }
    for (const auto& extra : policy.extraStore) {
        addTrustAnchor(store.get(), extra);
    }

    // Step 2: Untrusted intermediates (kept alive by the vector below)
    std::vector<x509::Certificate> intermediates = trustProvider_->intermediates();
    UniqueStack untrusted(sk_X509_new_null());
    if (!untrusted) {
        throw common::ChainEngineException("sk_X509_new_null failed: " + openSslErrorString());
    }
    for (const auto& intermediate : intermediates) {
        if (!sk_X509_push(untrusted.get(), intermediate.get())) {
            throw common::ChainEngineException("Failed to stage intermediate: " + openSslErrorString());
        }
    }

    // Step 3: Revocation data for every issuer that may appear in the path
    if (policy.revocationMode != RevocationMode::NO_CHECK && crlProvider_) {
        bool allowNetwork = (policy.revocationMode != RevocationMode::OFFLINE);

        std::set<std::string> issuerDns;
        issuerDns.insert(getIssuerDn(cert.get()));
        for (const auto& intermediate : intermediates) {
            issuerDns.insert(getIssuerDn(intermediate.get()));
        }
        for (const auto& root : roots) {
            issuerDns.insert(getSubjectDn(root.get()));
        }

        for (const auto& issuerDn : issuerDns) {
            for (auto& crl : crlProvider_->findCrls(issuerDn, allowNetwork)) {
                if (X509_STORE_add_crl(store.get(), crl.get()) != 1) {
                    throw common::ChainEngineException("Failed to add CRL for " + issuerDn +
                        ": " + openSslErrorString());
                }
            }
        }
    }

    // Step 4: Store context
    UniqueStoreCtx ctx(X509_STORE_CTX_new());
    if (!ctx) {
        throw common::ChainEngineException("X509_STORE_CTX_new failed: " + openSslErrorString());
    }
    if (X509_STORE_CTX_init(ctx.get(), store.get(), cert.get(), untrusted.get()) != 1) {
        throw common::ChainEngineException("X509_STORE_CTX_init failed: " + openSslErrorString());
    }

    unsigned long flags = revocationVerifyFlags(policy);
    if (flags != 0) {
        X509_VERIFY_PARAM_set_flags(X509_STORE_CTX_get0_param(ctx.get()), flags);
    }

    VerifyState state;
    state.policy = &policy;
    state.token = &token;
    X509_STORE_CTX_set_ex_data(ctx.get(), verifyStateIndex(), &state);
    X509_STORE_CTX_set_verify_cb(ctx.get(), verifyCallback);

    // Step 5: Single build attempt
    int rc = X509_verify_cert(ctx.get());

    if (state.cancelled) {
        ERR_clear_error();
        result.statuses.push_back({ChainStatusFlag::CANCELLED,
            "chain build aborted: " + state.cancelReason});
        return result;
    }

    if (rc <= 0 && state.statuses.empty()) {
        int error = X509_STORE_CTX_get_error(ctx.get());
        std::string reason = (error != X509_V_OK) ? X509_verify_cert_error_string(error)
                                                  : openSslErrorString();
        ERR_clear_error();
        throw common::ChainEngineException("X509_verify_cert failed: " + reason);
    }

    // Step 6: Application policy over the built path (even a partial one)
    STACK_OF(X509)* chain = X509_STORE_CTX_get0_chain(ctx.get());
    if (chain) {
        if (!policy.applicationPolicy.empty()) {
            checkApplicationPolicy(chain, policy.applicationPolicy, state.statuses);
        }
        result.depth = sk_X509_num(chain);
        result.path = describePath(chain);
    }

    ERR_clear_error();

    result.statuses = std::move(state.statuses);
    result.valid = result.statuses.empty();
    return result;
}

} // namespace validation
} // namespace certauth
