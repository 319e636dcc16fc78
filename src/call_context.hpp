#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace refyne {

/// Cancellation and deadline shared between a caller and one logical call
/// (including its retries). Copies share the same state, so a caller can keep
/// one copy and cancel() it from another thread.
class CallContext {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    CallContext();

    /// A context that expires at @p deadline.
    static CallContext withDeadline(TimePoint deadline);
    static CallContext withTimeout(std::chrono::milliseconds timeout);

    /// Abort the call: wakes any pending sleep and stops the in-flight attempt.
    void cancel() const;
    bool isCancelled() const;

    std::optional<TimePoint> deadline() const;

    /// True once cancelled or past the deadline.
    bool isDone() const;

    /// Sleep for @p duration unless cancelled or the deadline arrives first.
    /// @return true if the full duration elapsed.
    bool sleepFor(std::chrono::milliseconds duration) const;

    /// The earlier of now + timeout and this context's deadline.
    TimePoint attemptDeadline(std::chrono::milliseconds timeout) const;

private:
    struct State {
        mutable std::mutex       mutex;
        std::condition_variable  wakeup;
        bool                     cancelled = false;
        std::optional<TimePoint> deadline;
    };

    std::shared_ptr<State> mState;
};

} // namespace refyne
