#include "code_sentinel/schedule/task_token.hpp"
#include "code_sentinel/core/errors.hpp"
#include <algorithm>
#include <thread>

namespace code_sentinel {
namespace schedule {

namespace {
constexpr std::chrono::milliseconds SLEEP_SLICE{10};
}

TaskToken::TaskToken(Clock::time_point deadline, const std::atomic<bool>* cancel_flag)
    : deadline_(deadline), cancel_flag_(cancel_flag) {}

TaskToken TaskToken::unbounded() {
    return TaskToken();
}

TaskToken TaskToken::withTimeout(std::chrono::milliseconds timeout) {
    return TaskToken(Clock::now() + timeout, nullptr);
}

bool TaskToken::expired() const {
    return deadline_ && Clock::now() >= *deadline_;
}

bool TaskToken::cancelled() const {
    return cancel_flag_ && cancel_flag_->load(std::memory_order_acquire);
}

void TaskToken::checkpoint() const {
    if (cancelled()) {
        throw core::TaskCancelled("Run cancelled");
    }
    if (expired()) {
        throw core::TaskTimeout("Task deadline exceeded");
    }
}

std::chrono::milliseconds TaskToken::remaining() const {
    if (!deadline_) {
        return std::chrono::milliseconds::max();
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

void TaskToken::sleepFor(std::chrono::milliseconds duration) const {
    auto until = Clock::now() + duration;
    while (true) {
        checkpoint();
        auto now = Clock::now();
        if (now >= until) {
            return;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
        std::this_thread::sleep_for(std::min(left, SLEEP_SLICE));
    }
}

}}
