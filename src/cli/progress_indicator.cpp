#include <iomanip>
#include <sstream>
#include <orderpix/cli/progress_indicator.h>

#if defined(_WIN32)
#include <io.h>
#define ORDERPIX_ISATTY _isatty
#define ORDERPIX_STDERR_FD 2
#else
#include <unistd.h>
#define ORDERPIX_ISATTY ::isatty
#define ORDERPIX_STDERR_FD STDERR_FILENO
#endif

namespace orderpix::cli {

bool stderr_is_tty() {
    return ORDERPIX_ISATTY(ORDERPIX_STDERR_FD) != 0;
}

ProgressIndicator::ProgressIndicator(Style style, std::ostream& out)
    : style_(style), out_(out), isTty_(stderr_is_tty()) {}

ProgressIndicator::~ProgressIndicator() {
    if (active_) {
        stop();
    }
}

void ProgressIndicator::start(const std::string& message, std::size_t total) {
    if (active_)
        return;

    message_ = message;
    active_ = true;
    current_ = 0;
    total_ = total;
    lastUpdate_ = std::chrono::steady_clock::now();

    render();
}

void ProgressIndicator::update(std::size_t current, std::size_t total) {
    if (!active_)
        return;

    current_ = current;
    if (total > 0)
        total_ = total;

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastUpdate_).count();

    if (elapsed >= updateIntervalMs_ || (total_ > 0 && current_ >= total_)) {
        lastUpdate_ = now;
        render();
    }
}

void ProgressIndicator::stop() {
    if (!active_)
        return;

    if (isTty_) {
        // Clear the line
        out_ << "\r\033[K" << std::flush;
    }
    active_ = false;
}

std::string ProgressIndicator::line() const {
    std::ostringstream oss;
    const int percent = total_ > 0 ? static_cast<int>((current_ * 100) / total_) : 0;

    if (style_ == Style::Bar && isTty_ && total_ > 0) {
        const auto filled = static_cast<int>((current_ * kBarWidth) / total_);
        oss << "[";
        for (int i = 0; i < kBarWidth; ++i)
            oss << (i < filled ? '#' : '.');
        oss << "] " << std::setw(3) << percent << "% " << current_ << "/" << total_;
        if (!message_.empty())
            oss << " " << message_;
        return oss.str();
    }

    oss << "[" << std::setw(3) << percent << "%]";
    if (!message_.empty())
        oss << " " << message_;
    oss << " (" << current_ << "/" << total_ << ")";
    return oss.str();
}

void ProgressIndicator::render() {
    if (!active_)
        return;

    if (isTty_) {
        out_ << "\r" << line() << "\033[K" << std::flush;
    } else {
        out_ << line() << "\n" << std::flush;
    }
}

} // namespace orderpix::cli
