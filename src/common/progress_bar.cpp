#include "code_sentinel/common/progress_bar.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <sys/ioctl.h>
#include <unistd.h>

namespace code_sentinel {
namespace common {

namespace {
constexpr std::chrono::milliseconds RENDER_INTERVAL{100};
}

ProgressBarRenderer::ProgressBarRenderer(const std::string& label, bool use_colors)
    : label_(label),
      use_colors_(use_colors),
      completed_(false),
      settled_tasks_(0),
      total_tasks_(0),
      failed_tasks_(0),
      findings_(0) {
    start_time_ = std::chrono::steady_clock::now();
}

void ProgressBarRenderer::update(size_t settled_tasks, size_t total_tasks, size_t failed_tasks, size_t findings) {
    settled_tasks_ = settled_tasks;
    total_tasks_ = total_tasks;
    failed_tasks_ = failed_tasks;
    findings_ = findings;
}

void ProgressBarRenderer::complete() {
    completed_ = true;
}

void ProgressBarRenderer::clear(std::ostream& out) {
    if (!isatty(STDERR_FILENO)) return;
    out << "\r\033[K" << std::flush;
}

void ProgressBarRenderer::render(std::ostream& out) {
    if (!isatty(STDERR_FILENO)) {
        return;
    }

    if (completed_) {
        out << "\r\033[K" << std::flush;
        return;
    }

    std::string line = formatLine();
    size_t width = static_cast<size_t>(getTerminalWidth());
    if (line.size() > width + 16) {
        line.resize(width + 16);
    }
    out << "\r" << line << std::flush;
    last_render_ = std::chrono::steady_clock::now();
}

bool ProgressBarRenderer::renderDue() const {
    if (completed_ || (total_tasks_ > 0 && settled_tasks_ >= total_tasks_)) {
        return true;
    }
    return std::chrono::steady_clock::now() - last_render_ >= RENDER_INTERVAL;
}

std::string ProgressBarRenderer::formatLine() const {
    std::ostringstream oss;

    double progress = total_tasks_ > 0
        ? static_cast<double>(settled_tasks_) / total_tasks_
        : 0.0;
    int percent = static_cast<int>(progress * 100);

    int bar_width = 20;
    int filled = static_cast<int>(bar_width * progress);

    if (use_colors_) {
        oss << "\033[36m";
    }

    oss << label_ << ": [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < filled) {
            oss << "=";
        } else if (i == filled) {
            oss << ">";
        } else {
            oss << " ";
        }
    }
    oss << "] " << percent << "% ";

    if (use_colors_) {
        oss << "\033[0m";
    }

    oss << "(" << settled_tasks_ << "/" << total_tasks_ << " tasks";
    if (failed_tasks_ > 0) {
        oss << ", " << failed_tasks_ << " failed";
    }
    oss << ", " << findings_ << " findings)";

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);
    if (elapsed.count() > 0 && settled_tasks_ > 0) {
        oss << " @ " << formatRate(settled_tasks_ / (elapsed.count() / 1000.0));
    }

    return oss.str();
}

std::string ProgressBarRenderer::formatRate(double tasks_per_sec) const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(tasks_per_sec < 10 ? 1 : 0) << tasks_per_sec << " tasks/s";
    return oss.str();
}

int ProgressBarRenderer::getTerminalWidth() const {
    struct winsize w;
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return 80;
}

}}
