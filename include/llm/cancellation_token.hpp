#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace nugget {

/**
 * @brief Caller-owned cancellation flag with an interruptible wait
 *
 * One thread (a UI, a signal handler, a test) calls cancel(); the extraction
 * thread polls is_cancelled() and sleeps through wait_for(), which returns
 * as soon as cancel() is called instead of finishing the full delay.
 *
 * A token may also be linked to a parent token and a deadline. It then
 * reports cancelled once the parent is cancelled or the deadline passes,
 * which lets one provider call observe both the caller's token and the
 * per-call timeout.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    /**
     * @brief Token cancelled by cancel(), by the parent, or at the deadline
     *
     * @param parent Caller token, may be nullptr; must outlive this token
     * @param deadline Point after which the token reads as cancelled
     */
    CancellationToken(const CancellationToken* parent, Clock::time_point deadline)
        : parent_(parent), deadline_(deadline) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool is_cancelled() const {
        if (cancelled_.load()) return true;
        if (parent_ && parent_->is_cancelled()) return true;
        return deadline_passed();
    }

    bool deadline_passed() const {
        return deadline_ && Clock::now() >= *deadline_;
    }

    /**
     * @brief Time left before the deadline, nullopt when there is none
     *
     * Includes the parent's deadline when it is earlier.
     */
    std::optional<std::chrono::milliseconds> remaining() const {
        std::optional<std::chrono::milliseconds> left;
        if (deadline_) {
            auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
            left = std::max(diff, std::chrono::milliseconds(0));
        }
        if (parent_) {
            auto parent_left = parent_->remaining();
            if (parent_left && (!left || *parent_left < *left)) {
                left = parent_left;
            }
        }
        return left;
    }

    /**
     * @brief Sleep for the given duration unless cancelled first
     *
     * A linked token cannot be woken by its parent's cancel(), so it waits
     * in short slices and checks the parent between them.
     *
     * @return true if the token was cancelled before or during the wait
     */
    bool wait_for(std::chrono::milliseconds duration) const {
        const auto until = Clock::now() + duration;
        const auto slice = std::chrono::milliseconds(parent_ ? 10 : 0);

        std::unique_lock<std::mutex> lock(mutex_);
        while (!is_cancelled()) {
            auto now = Clock::now();
            if (now >= until) return false;

            auto wake = until;
            if (deadline_ && *deadline_ < wake) wake = *deadline_;
            if (parent_ && now + slice < wake) wake = now + slice;
            cv_.wait_until(lock, wake, [this] { return cancelled_.load(); });
        }
        return true;
    }

private:
    const CancellationToken* parent_ = nullptr;
    std::optional<Clock::time_point> deadline_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
};

} // namespace nugget
