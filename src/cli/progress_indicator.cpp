#include <clawdesk/cli/progress_indicator.h>
#include <clawdesk/cli/ui_helpers.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace clawdesk::cli {

ProgressIndicator::ProgressIndicator(Style style, std::ostream* out)
    : style_(style), out_(out ? out : &std::cerr) {
    isTty_ = (out_ == &std::cerr) && ui::stderr_is_tty();
    if (!isTty_) {
        updateIntervalMs_ = 1000;
    }
}

ProgressIndicator::~ProgressIndicator() {
    if (active_) {
        stop();
    }
}

void ProgressIndicator::start(const std::string& message) {
    if (active_)
        return;

    message_ = message;
    active_ = true;
    current_ = 0;
    total_ = 0;
    spinnerIndex_ = 0;
    lastUpdate_ = std::chrono::steady_clock::now();

    render();
}

void ProgressIndicator::update(std::uint64_t current, std::uint64_t total) {
    if (!active_)
        return;

    current_ = current;
    total_ = total;

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastUpdate_).count();
    const bool finished = total_ > 0 && current_ >= total_;

    if (elapsed >= updateIntervalMs_ || finished) {
        ++spinnerIndex_;
        lastUpdate_ = now;
        render();
    }
}

void ProgressIndicator::stop() {
    if (!active_)
        return;

    if (isTty_) {
        *out_ << "\r\033[K" << std::flush;
    }
    active_ = false;
}

std::string ProgressIndicator::formatCount(std::uint64_t value) const {
    return showBytes_ ? ui::format_bytes(value) : std::to_string(value);
}

std::string ProgressIndicator::renderLine() const {
    std::ostringstream oss;
    const bool determinate = total_ > 0;
    const int percent =
        determinate ? static_cast<int>(std::min<std::uint64_t>(current_ * 100 / total_, 100)) : 0;

    if (style_ == Style::Spinner || !determinate) {
        oss << ui::Spinner::frame(spinnerIndex_) << " " << message_;
        if (current_ > 0) {
            oss << " (" << formatCount(current_);
            if (determinate) {
                oss << "/" << formatCount(total_);
            }
            oss << ")";
        }
        return oss.str();
    }

    if (style_ == Style::Bar) {
        const double fraction = static_cast<double>(current_) / static_cast<double>(total_);
        oss << ui::progress_bar(fraction, 20) << " ";
    }
    oss << "[" << std::setw(3) << percent << "%] " << message_ << " (" << formatCount(current_)
        << "/" << formatCount(total_) << ")";
    return oss.str();
}

void ProgressIndicator::render() {
    if (!active_)
        return;

    // Not a terminal: one line per render, no carriage returns.
    if (isTty_) {
        *out_ << "\r\033[K" << renderLine() << std::flush;
    } else {
        *out_ << renderLine() << "\n";
    }
}

} // namespace clawdesk::cli
