#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <string>

namespace orderpix::cli {

/**
 * @brief Single-line download progress for the terminal
 *
 * Renders "[####......]  3/10 message" (Bar) or "[ 30%] message (3/10)" (Percentage) on
 * one line, redrawn in place with '\r'. Off a terminal the bar degrades to the percentage
 * form so logs stay readable.
 */
class ProgressIndicator {
public:
    enum class Style {
        Percentage, // [ 45%]
        Bar         // [#########...........]
    };

    /**
     * @brief Construct a progress indicator
     * @param style The visual style to use
     * @param out Stream to render on (stderr keeps stdout free for --json)
     */
    explicit ProgressIndicator(Style style = Style::Bar, std::ostream& out = std::cerr);

    /**
     * @brief Destructor - automatically stops if still active
     */
    ~ProgressIndicator();

    ProgressIndicator(const ProgressIndicator&) = delete;
    ProgressIndicator& operator=(const ProgressIndicator&) = delete;
    ProgressIndicator(ProgressIndicator&&) = delete;
    ProgressIndicator& operator=(ProgressIndicator&&) = delete;

    void start(const std::string& message, std::size_t total = 0);

    /**
     * @brief Update progress
     * @param current Completed items
     * @param total Total items (0 keeps the previous total)
     *
     * Redraws at most every update interval, except for the final item which is always drawn.
     */
    void update(std::size_t current, std::size_t total = 0);

    /**
     * @brief Stop and clear the indicator
     */
    void stop();

    bool isActive() const { return active_; }

    void setUpdateInterval(int ms) { updateIntervalMs_ = ms; }
    void setTerminal(bool isTty) { isTty_ = isTty; }

    // Text of the current line, without carriage return or clearing sequence.
    std::string line() const;

private:
    void render();

    Style style_;
    std::ostream& out_;
    std::string message_;
    std::atomic<bool> active_{false};
    std::size_t current_ = 0;
    std::size_t total_ = 0;
    int updateIntervalMs_ = 100;
    bool isTty_ = false;

    std::chrono::steady_clock::time_point lastUpdate_;

    static constexpr int kBarWidth = 30;
};

// True when stderr is attached to a terminal.
bool stderr_is_tty();

} // namespace orderpix::cli
