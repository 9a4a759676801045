#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace vidup {

/**
 * @brief Cooperative cancellation signal for one unit of work
 *
 * A token is cancelled when cancel() was called on it, when its deadline
 * has passed, or when its parent is cancelled. The HTTP layer creates one
 * token per request as a child of the server-wide shutdown token.
 *
 * Thread safety: cancel() and is_cancelled() may be called concurrently.
 */
class CancellationToken {
public:
    using clock = std::chrono::steady_clock;

    CancellationToken() = default;

    explicit CancellationToken(std::shared_ptr<const CancellationToken> parent,
                               std::optional<clock::time_point> deadline = std::nullopt)
        : parent_(std::move(parent))
        , deadline_(deadline) {
    }

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    static std::shared_ptr<CancellationToken> with_timeout(std::shared_ptr<const CancellationToken> parent,
                                                           clock::duration timeout) {
        return std::make_shared<CancellationToken>(std::move(parent), clock::now() + timeout);
    }

    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const noexcept {
        if (cancelled_.load(std::memory_order_acquire)) {
            return true;
        }
        if (deadline_ && clock::now() >= *deadline_) {
            return true;
        }
        return parent_ && parent_->is_cancelled();
    }

    /**
     * @brief A token that is never cancelled, for callers without a deadline
     */
    static const CancellationToken& none() {
        static const CancellationToken token;
        return token;
    }

private:
    std::atomic<bool> cancelled_{false};
    std::shared_ptr<const CancellationToken> parent_;
    std::optional<clock::time_point> deadline_;
};

} // namespace vidup
