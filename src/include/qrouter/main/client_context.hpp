#pragma once

#include "qrouter/common/common.hpp"

#include <atomic>
#include <chrono>

namespace qrouter {

//! Per-call cancellation and deadline state carried from the caller down to the engine.
//! Cancellation is cooperative: engines poll it, nothing is aborted forcibly.
class ClientContext {
public:
    using clock = std::chrono::steady_clock;

    ClientContext() = default;
    explicit ClientContext(std::chrono::milliseconds timeout);

    ClientContext(const ClientContext &) = delete;
    ClientContext &operator=(const ClientContext &) = delete;

    //! Marks the context as cancelled; safe to call from any thread
    void Interrupt();
    //! Sets the deadline to now + timeout; a zero timeout clears it
    void SetTimeout(std::chrono::milliseconds timeout);

    bool IsCancelled() const {
        return interrupted.load(std::memory_order_acquire);
    }
    bool HasDeadline() const {
        return deadline_ns.load(std::memory_order_acquire) != NO_DEADLINE;
    }
    bool IsExpired() const;
    //! True when the context was cancelled or its deadline has passed
    bool IsInterrupted() const {
        return IsCancelled() || IsExpired();
    }
    //! Remaining time before the deadline, clamped at zero. Only meaningful when HasDeadline()
    std::chrono::milliseconds RemainingTime() const;

    //! Throws CancellationException when interrupted; `where` names the checkpoint in the message
    void CheckInterrupted(const string &where) const;

private:
    static constexpr int64_t NO_DEADLINE = -1;

    std::atomic<bool> interrupted{false};
    std::atomic<int64_t> deadline_ns{NO_DEADLINE};
};

} // namespace qrouter
