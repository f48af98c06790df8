#include "qrouter/main/client_context.hpp"
#include "qrouter/common/exception.hpp"

namespace qrouter {

constexpr int64_t ClientContext::NO_DEADLINE;

ClientContext::ClientContext(std::chrono::milliseconds timeout) {
    SetTimeout(timeout);
}

void ClientContext::Interrupt() {
    interrupted.store(true, std::memory_order_release);
}

void ClientContext::SetTimeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        deadline_ns.store(NO_DEADLINE, std::memory_order_release);
        return;
    }
    auto deadline = clock::now() + timeout;
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(deadline.time_since_epoch()).count();
    deadline_ns.store(ns, std::memory_order_release);
}

bool ClientContext::IsExpired() const {
    auto deadline = deadline_ns.load(std::memory_order_acquire);
    if (deadline == NO_DEADLINE) {
        return false;
    }
    auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now().time_since_epoch()).count();
    return now >= deadline;
}

std::chrono::milliseconds ClientContext::RemainingTime() const {
    auto deadline = deadline_ns.load(std::memory_order_acquire);
    if (deadline == NO_DEADLINE) {
        return std::chrono::milliseconds(0);
    }
    auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now().time_since_epoch()).count();
    if (now >= deadline) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds(deadline - now));
}

void ClientContext::CheckInterrupted(const string &where) const {
    if (IsCancelled()) {
        throw CancellationException("query cancelled " + where);
    }
    if (IsExpired()) {
        throw CancellationException("query deadline expired " + where);
    }
}

} // namespace qrouter
