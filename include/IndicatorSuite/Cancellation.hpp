#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace indicators {

// Shared between the caller and every matching call it starts. Copies observe
// the same flag, so cancelling one copy cancels them all.
class CancellationToken {
  public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() : flag(std::make_shared<std::atomic<bool>>(false)) {}

    static CancellationToken withTimeout(Clock::duration timeout) {
        CancellationToken token;
        token.deadline = Clock::now() + timeout;
        return token;
    }

    void cancel() const { flag->store(true); }

    bool isCancelled() const {
        if (flag->load()) {
            return true;
        }
        return deadline.has_value() && Clock::now() >= *deadline;
    }

    // Time left before the deadline, if one was set. Never negative.
    std::optional<Clock::duration> remaining() const {
        if (!deadline) {
            return std::nullopt;
        }
        const auto now = Clock::now();
        if (now >= *deadline) {
            return Clock::duration::zero();
        }
        return *deadline - now;
    }

  private:
    std::shared_ptr<std::atomic<bool>> flag;
    std::optional<Clock::time_point> deadline;
};

} // namespace indicators
