/**
 * @file hooks.cpp
 * @brief Caller-supplied override points implementation
 */

#include "certauth/auth/hooks.h"

namespace certauth {
namespace auth {

std::future<HookResult> readyHookResult(HookResult value) {
    std::promise<HookResult> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

ValidateHook ValidateHook::fromFunction(SyncFunction fn) {
    if (!fn) return ValidateHook();
    return ValidateHook([fn](ValidateCertificateContext context) {
        return readyHookResult(fn(context));
    });
}

std::future<HookResult> ValidateHook::tryValidate(ValidateCertificateContext context) const {
    if (!fn_) {
        return readyHookResult(std::nullopt);
    }
    return fn_(std::move(context));
}

FailureHook FailureHook::fromFunction(SyncFunction fn) {
    if (!fn) return FailureHook();
    return FailureHook([fn](AuthenticationFailedContext context) {
        return readyHookResult(fn(context));
    });
}

std::future<HookResult> FailureHook::tryRecover(AuthenticationFailedContext context) const {
    if (!fn_) {
        return readyHookResult(std::nullopt);
    }
    return fn_(std::move(context));
}

} // namespace auth
} // namespace certauth
