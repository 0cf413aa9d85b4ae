// -*- c++ -*-
//
// Cooperative cancellation for long-running searches

#ifndef BN_CANCELLATION__H
#define BN_CANCELLATION__H

#include <atomic>
#include <chrono>

namespace Bn {

// The search polls a token between initial states; another thread may call
// cancel() at any time. The deadline must be set before the search starts.
class CancellationToken {
   public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_relaxed);
    }

    void set_deadline(Clock::time_point deadline) {
        deadline_ = deadline;
        has_deadline_ = true;
    }

    void set_timeout(std::chrono::milliseconds timeout) {
        set_deadline(Clock::now() + timeout);
    }

    [[nodiscard]] bool cancelled() const {
        if (cancelled_.load(std::memory_order_relaxed)) {
            return true;
        }
        return has_deadline_ && Clock::now() >= deadline_;
    }

   private:
    std::atomic<bool> cancelled_{false};
    bool has_deadline_ = false;
    Clock::time_point deadline_;
};

}  // namespace Bn

#endif  // BN_CANCELLATION__H
