/**
 * @file hooks.h
 * @brief Caller-supplied override points
 *
 * Hooks are strategy values wrapping a callable that returns a future, so a
 * hook may complete later (e.g. after calling another service). A
 * default-constructed hook is a no-op that defers to built-in behavior.
 *
 * Contexts hold copies, never references into the engine, so a hook
 * completing on another thread cannot observe dangling state. Long-running
 * hooks should poll cancellationToken: the engine stops waiting once it
 * fires, but it cannot stop the hook's own work.
 *
 * Usage:
 * @code
 *   CertificateAuthenticationEvents events;
 *   events.onValidateCertificate = ValidateHook::fromFunction(
 *       [](const ValidateCertificateContext& ctx) -> std::optional<ValidationOutcome> {
 *           if (isBlocked(ctx.clientCertificate.thumbprint())) {
 *               return ctx.fail("certificate is blocked");
 *           }
 *           return std::nullopt;  // default claims
 *       });
 * @endcode
 */

#pragma once

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "certauth/auth/options.h"
#include "certauth/auth/outcome.h"
#include "certauth/validation/cancellation.h"
#include "certauth/x509/certificate.h"

namespace certauth {
namespace auth {

/// @brief Result of a hook: an outcome to adopt, or nullopt to defer
using HookResult = std::optional<ValidationOutcome>;

/**
 * @brief Context of the validate-certificate hook (after a successful chain build)
 */
struct ValidateCertificateContext {
    x509::Certificate clientCertificate;
    std::map<std::string, std::string> requestContext;
    std::shared_ptr<const CertificateAuthenticationOptions> options;
    validation::CancellationToken cancellationToken;

    /// @brief Authenticate with a custom principal
    ValidationOutcome success(ClaimsPrincipal principal) const {
        return ValidationOutcome::success(std::move(principal));
    }

    /// @brief Reject with a reason
    ValidationOutcome fail(std::string reason) const {
        return ValidationOutcome::rejected(std::move(reason));
    }
};

/**
 * @brief Context of the authentication-failed hook
 */
struct AuthenticationFailedContext {
    FailureInfo failure;
    std::map<std::string, std::string> requestContext;
    std::shared_ptr<const CertificateAuthenticationOptions> options;
    validation::CancellationToken cancellationToken;

    ValidationOutcome success(ClaimsPrincipal principal) const {
        return ValidationOutcome::success(std::move(principal));
    }

    ValidationOutcome fail(std::string reason) const {
        return ValidationOutcome::rejected(std::move(reason));
    }

    ValidationOutcome noResult() const { return ValidationOutcome::noResult(); }
};

/// @brief Ready future holding value
std::future<HookResult> readyHookResult(HookResult value);

/**
 * @brief Override point invoked after a successful chain build
 *
 * VALID adopts the hook's principal, REJECTED/CHAIN_INVALID adopt the
 * rejection, NO_RESULT or nullopt fall through to the default claims.
 */
class ValidateHook {
public:
    using Function = std::function<std::future<HookResult>(ValidateCertificateContext)>;
    using SyncFunction = std::function<HookResult(const ValidateCertificateContext&)>;

    ValidateHook() = default;
    explicit ValidateHook(Function fn) : fn_(std::move(fn)) {}

    /// @brief Wrap a synchronous callable
    static ValidateHook fromFunction(SyncFunction fn);

    bool isSet() const { return static_cast<bool>(fn_); }

    /**
     * @brief Invoke the hook
     * @return Future of the hook's result (ready nullopt when unset)
     */
    std::future<HookResult> tryValidate(ValidateCertificateContext context) const;

private:
    Function fn_;
};

/**
 * @brief Override point invoked for unexpected failures
 *
 * Any outcome replaces the failure; nullopt leaves it fatal.
 */
class FailureHook {
public:
    using Function = std::function<std::future<HookResult>(AuthenticationFailedContext)>;
    using SyncFunction = std::function<HookResult(const AuthenticationFailedContext&)>;

    FailureHook() = default;
    explicit FailureHook(Function fn) : fn_(std::move(fn)) {}

    static FailureHook fromFunction(SyncFunction fn);

    bool isSet() const { return static_cast<bool>(fn_); }

    std::future<HookResult> tryRecover(AuthenticationFailedContext context) const;

private:
    Function fn_;
};

/**
 * @brief Hooks handed to the engine
 */
struct CertificateAuthenticationEvents {
    ValidateHook onValidateCertificate;
    FailureHook onAuthenticationFailed;
};

} // namespace auth
} // namespace certauth
