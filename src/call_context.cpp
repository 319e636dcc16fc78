#include "call_context.hpp"

#include <algorithm>

namespace refyne {

namespace {

// Longest span added to the clock. Far enough to mean "never", near enough
// that neither the addition nor the condition variable's clock conversion
// overflows.
constexpr std::chrono::milliseconds kFarFuture =
    std::chrono::hours(24 * 365 * 100);

CallContext::TimePoint fromNow(std::chrono::milliseconds duration) {
    return CallContext::Clock::now() + std::min(duration, kFarFuture);
}

} // namespace

CallContext::CallContext()
    : mState(std::make_shared<State>()) {}

CallContext CallContext::withDeadline(TimePoint deadline) {
    CallContext ctx;
    ctx.mState->deadline = deadline;
    return ctx;
}

CallContext CallContext::withTimeout(std::chrono::milliseconds timeout) {
    return withDeadline(fromNow(timeout));
}

void CallContext::cancel() const {
    {
        std::lock_guard<std::mutex> lock(mState->mutex);
        mState->cancelled = true;
    }
    mState->wakeup.notify_all();
}

bool CallContext::isCancelled() const {
    std::lock_guard<std::mutex> lock(mState->mutex);
    return mState->cancelled;
}

std::optional<CallContext::TimePoint> CallContext::deadline() const {
    std::lock_guard<std::mutex> lock(mState->mutex);
    return mState->deadline;
}

bool CallContext::isDone() const {
    std::lock_guard<std::mutex> lock(mState->mutex);
    return mState->cancelled ||
           (mState->deadline && Clock::now() >= *mState->deadline);
}

bool CallContext::sleepFor(std::chrono::milliseconds duration) const {
    TimePoint wakeAt = fromNow(duration);

    std::unique_lock<std::mutex> lock(mState->mutex);
    const bool cutShort = mState->deadline && *mState->deadline < wakeAt;
    if (cutShort) wakeAt = *mState->deadline;

    const bool cancelled = mState->wakeup.wait_until(
        lock, wakeAt, [this] { return mState->cancelled; });
    return !cancelled && !cutShort;
}

CallContext::TimePoint
CallContext::attemptDeadline(std::chrono::milliseconds timeout) const {
    const TimePoint perAttempt = fromNow(timeout);
    const auto overall = deadline();
    return overall ? std::min(perAttempt, *overall) : perAttempt;
}

} // namespace refyne
