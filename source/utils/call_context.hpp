#ifndef MCPLINK_CALL_CONTEXT_HPP
#define MCPLINK_CALL_CONTEXT_HPP

// Per-call deadline and cancellation flag.
// Every blocking operation (HTTP exchange, stream read, child process I/O)
// polls in short slices and stops as soon as the context is done.

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace call_context {

using Clock = std::chrono::steady_clock;

class CallContext {
public:
    // A context that expires timeout from now.
    static CallContext with_timeout(std::chrono::milliseconds timeout);

    explicit CallContext(Clock::time_point deadline,
                         std::shared_ptr<std::atomic<bool>> cancel_flag = nullptr);

    // Returns a copy that shares the cancellation flag but expires no later
    // than timeout from now.
    CallContext narrowed(std::chrono::milliseconds timeout) const;

    bool is_cancelled() const;
    bool is_expired() const;
    bool is_done() const;

    // Milliseconds until the deadline, clamped to [0, maximum_slice].
    int next_slice_milliseconds(int maximum_slice) const;

    // "cancelled" or "deadline exceeded"; empty while the context is live.
    std::string done_reason() const;

    Clock::time_point deadline() const { return deadline_; }

    // Flip the shared flag; every copy of this context observes it.
    void cancel() const;

private:
    Clock::time_point deadline_;
    std::shared_ptr<std::atomic<bool>> cancel_flag_;
};

} // namespace call_context

#endif // MCPLINK_CALL_CONTEXT_HPP
