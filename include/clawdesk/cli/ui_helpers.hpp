#pragma once

// Terminal helpers for the clawdesk CLI
// - TTY and color detection (NO_COLOR, TERM=dumb)
// - Status markers and progress bars
// - Human-readable byte sizes

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

#if defined(_WIN32)
#include <io.h>
#define CLAWDESK_UI_ISATTY _isatty
#define CLAWDESK_UI_FILENO _fileno
#else
#include <unistd.h>
#define CLAWDESK_UI_ISATTY isatty
#define CLAWDESK_UI_FILENO fileno
#endif

namespace clawdesk::cli::ui {

struct Ansi {
    static constexpr const char* RESET = "\x1b[0m";
    static constexpr const char* BOLD = "\x1b[1m";
    static constexpr const char* RED = "\x1b[31m";
    static constexpr const char* GREEN = "\x1b[32m";
    static constexpr const char* YELLOW = "\x1b[33m";
    static constexpr const char* CYAN = "\x1b[36m";
};

inline bool stdout_is_tty() {
    return CLAWDESK_UI_ISATTY(CLAWDESK_UI_FILENO(stdout)) != 0;
}

inline bool stderr_is_tty() {
    return CLAWDESK_UI_ISATTY(CLAWDESK_UI_FILENO(stderr)) != 0;
}

inline bool colors_enabled() {
    if (std::getenv("NO_COLOR") != nullptr)
        return false;
    const char* term = std::getenv("TERM");
    if (term && std::string_view(term) == "dumb")
        return false;
    return stdout_is_tty();
}

inline std::string colorize(std::string_view s, const char* code) {
    if (!colors_enabled() || code == nullptr || *code == '\0') {
        return std::string(s);
    }
    std::string out;
    out.reserve(s.size() + 12);
    out.append(code);
    out.append(s.data(), s.size());
    out.append(Ansi::RESET);
    return out;
}

inline std::string status_ok(std::string_view text) {
    return colorize("OK   " + std::string(text), Ansi::GREEN);
}

inline std::string status_warning(std::string_view text) {
    return colorize("WARN " + std::string(text), Ansi::YELLOW);
}

inline std::string status_error(std::string_view text) {
    return colorize("FAIL " + std::string(text), Ansi::RED);
}

inline std::string format_bytes(std::uint64_t bytes, int precision = 1) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(value < 10.0 ? precision : 0) << value << " "
            << units[unit];
    }
    return oss.str();
}

struct Spinner {
    static constexpr const char* FRAMES[] = {"|", "/", "-", "\\"};
    static constexpr std::size_t FRAME_COUNT = 4;

    static const char* frame(std::size_t index) { return FRAMES[index % FRAME_COUNT]; }
};

inline std::string progress_bar(double fraction, int width = 30) {
    const double clamped = std::clamp(fraction, 0.0, 1.0);
    const int filled = static_cast<int>(std::llround(clamped * static_cast<double>(width)));
    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar.append(static_cast<std::size_t>(width - filled), ' ');
    bar += "]";
    return bar;
}

} // namespace clawdesk::cli::ui
