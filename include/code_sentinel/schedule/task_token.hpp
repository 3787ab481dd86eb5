#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace code_sentinel {
namespace schedule {

// Carried by every task. Work is never interrupted; long-running code calls
// checkpoint() and the token raises TaskTimeout or TaskCancelled there.
class TaskToken {
public:
    using Clock = std::chrono::steady_clock;

    TaskToken(Clock::time_point deadline, const std::atomic<bool>* cancel_flag);

    static TaskToken unbounded();
    static TaskToken withTimeout(std::chrono::milliseconds timeout);

    bool expired() const;
    bool cancelled() const;
    void checkpoint() const;

    std::chrono::milliseconds remaining() const;
    std::optional<Clock::time_point> deadline() const { return deadline_; }

    // Sleeps in short slices, checking the token between them.
    void sleepFor(std::chrono::milliseconds duration) const;

private:
    TaskToken() = default;

    std::optional<Clock::time_point> deadline_;
    const std::atomic<bool>* cancel_flag_ = nullptr;
};

}}
