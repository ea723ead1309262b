#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace clawdesk::cli {

/**
 * @brief Single-line progress display for long-running CLI commands
 *
 * Renders to stderr so machine-readable output on stdout stays clean.
 */
class ProgressIndicator {
public:
    enum class Style {
        Spinner,    // rotating bar with a running count
        Percentage, // [ 45%]
        Bar         // [=========          ]
    };

    explicit ProgressIndicator(Style style = Style::Spinner, std::ostream* out = nullptr);

    /**
     * @brief Destructor - clears the line if still active
     */
    ~ProgressIndicator();

    ProgressIndicator(const ProgressIndicator&) = delete;
    ProgressIndicator& operator=(const ProgressIndicator&) = delete;
    ProgressIndicator(ProgressIndicator&&) = delete;
    ProgressIndicator& operator=(ProgressIndicator&&) = delete;

    void start(const std::string& message);

    /**
     * @brief Update progress
     * @param current Current progress value
     * @param total Total expected value (0 for indeterminate)
     */
    void update(std::uint64_t current, std::uint64_t total = 0);

    void stop();

    /// Show counts as byte sizes (KB, MB) instead of plain numbers.
    void setShowBytes(bool show) { showBytes_ = show; }

    bool isActive() const { return active_; }

    void setUpdateInterval(int ms) { updateIntervalMs_ = ms; }

    /// Render the current line as text without the leading carriage return.
    std::string renderLine() const;

private:
    void render();
    std::string formatCount(std::uint64_t value) const;

    Style style_;
    std::ostream* out_;
    std::string message_;
    std::atomic<bool> active_{false};
    std::uint64_t current_ = 0;
    std::uint64_t total_ = 0;
    std::size_t spinnerIndex_ = 0;
    bool showBytes_ = false;
    bool isTty_ = false;
    int updateIntervalMs_ = 100;

    std::chrono::steady_clock::time_point lastUpdate_;
};

} // namespace clawdesk::cli
