/**
 * @file cancellation.cpp
 * @brief Cooperative cancellation implementation
 */

#include "certauth/validation/cancellation.h"

namespace certauth {
namespace validation {

CancellationToken CancellationToken::withTimeout(std::chrono::milliseconds timeout) const {
    CancellationToken copy(*this);
    Clock::time_point candidate = Clock::now() + timeout;
    if (!copy.hasDeadline_ || candidate < copy.deadline_) {
        copy.deadline_ = candidate;
        copy.hasDeadline_ = true;
    }
    return copy;
}

const char* CancellationToken::reason() const {
    if (isCancellationRequested()) return "cancelled by caller";
    if (isDeadlineExceeded()) return "deadline exceeded";
    return "";
}

} // namespace validation
} // namespace certauth
