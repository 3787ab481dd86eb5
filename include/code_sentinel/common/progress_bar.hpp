#pragma once

#include <string>
#include <chrono>
#include <ostream>

namespace code_sentinel {
namespace common {

class ProgressBarRenderer {
public:
    explicit ProgressBarRenderer(const std::string& label, bool use_colors = true);

    void update(size_t settled_tasks, size_t total_tasks, size_t failed_tasks, size_t findings);
    void complete();
    void clear(std::ostream& out);

    // Draws only when stderr is a terminal.
    void render(std::ostream& out);

    // At most one redraw per interval, plus the final one.
    bool renderDue() const;

    std::string formatLine() const;

    bool isComplete() const { return completed_; }

private:
    std::string label_;
    bool use_colors_;
    bool completed_;

    size_t settled_tasks_;
    size_t total_tasks_;
    size_t failed_tasks_;
    size_t findings_;

    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_render_;

    std::string formatRate(double tasks_per_sec) const;
    int getTerminalWidth() const;
};

}}
