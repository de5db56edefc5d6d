/**
 * @file cancellation.h
 * @brief Cooperative cancellation with optional deadline
 *
 * Usage:
 * @code
 *   CancellationSource source;
 *   CancellationToken token = source.token().withTimeout(std::chrono::milliseconds(5000));
 *   auto result = engine.authenticate(request, token);
 *   // from another thread: source.cancel();
 * @endcode
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace certauth {
namespace validation {

/**
 * @brief Read-only view of a cancellation flag plus optional deadline
 *
 * Cheap to copy; copies observe the same flag.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    /// @brief Token that is never cancelled
    static CancellationToken none() { return CancellationToken(); }

    CancellationToken() = default;

    /// @brief True if the owning source called cancel()
    bool isCancellationRequested() const {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

    /// @brief True if a deadline is set and has passed
    bool isDeadlineExceeded() const {
        return hasDeadline_ && Clock::now() >= deadline_;
    }

    /// @brief Either of the above
    bool isCancelled() const {
        return isCancellationRequested() || isDeadlineExceeded();
    }

    /**
     * @brief Copy of this token that additionally expires after timeout
     *
     * An earlier existing deadline is kept.
     */
    CancellationToken withTimeout(std::chrono::milliseconds timeout) const;

    /// @brief Human-readable reason ("cancelled by caller", "deadline exceeded"), empty if not cancelled
    const char* reason() const;

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
    bool hasDeadline_ = false;
    Clock::time_point deadline_{};
};

/**
 * @brief Owner of a cancellation flag
 */
class CancellationSource {
public:
    CancellationSource()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(flag_); }

    void cancel() { flag_->store(true, std::memory_order_release); }

    bool isCancellationRequested() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace validation
} // namespace certauth
