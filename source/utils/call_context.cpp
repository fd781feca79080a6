#include "utils/call_context.hpp"

#include <algorithm>
#include <utility>

namespace call_context {

CallContext CallContext::with_timeout(std::chrono::milliseconds timeout) {
    return CallContext(Clock::now() + timeout, std::make_shared<std::atomic<bool>>(false));
}

CallContext::CallContext(Clock::time_point deadline, std::shared_ptr<std::atomic<bool>> cancel_flag)
    : deadline_(deadline), cancel_flag_(std::move(cancel_flag)) {
    if (!cancel_flag_) {
        cancel_flag_ = std::make_shared<std::atomic<bool>>(false);
    }
}

CallContext CallContext::narrowed(std::chrono::milliseconds timeout) const {
    return CallContext(std::min(deadline_, Clock::now() + timeout), cancel_flag_);
}

bool CallContext::is_cancelled() const {
    return cancel_flag_->load();
}

bool CallContext::is_expired() const {
    return Clock::now() >= deadline_;
}

bool CallContext::is_done() const {
    return is_cancelled() || is_expired();
}

int CallContext::next_slice_milliseconds(int maximum_slice) const {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now()).count();
    if (remaining <= 0) {
        return 0;
    }
    return static_cast<int>(std::min<long long>(remaining, maximum_slice));
}

std::string CallContext::done_reason() const {
    if (is_cancelled()) {
        return "cancelled";
    }
    if (is_expired()) {
        return "deadline exceeded";
    }
    return "";
}

void CallContext::cancel() const {
    cancel_flag_->store(true);
}

} // namespace call_context
