#include "progress.hpp"
#include "utils.hpp"

#include <iomanip>
#include <iostream>

ConsoleProgressReporter::ConsoleProgressReporter(std::ostream& out,
                                                 std::chrono::milliseconds min_interval,
                                                 int bar_width)
    : out_(out), min_interval_(min_interval), bar_width_(bar_width) {}

void ConsoleProgressReporter::begin(const std::string& label, std::uint64_t initial_bytes,
                                    std::optional<std::uint64_t> total) {
    label_ = label;
    current_ = initial_bytes;
    total_ = total;
    last_draw_.reset();
    open_ = true;
}

void ConsoleProgressReporter::update(std::uint64_t bytes_delta) {
    if (!open_) return;
    current_ += bytes_delta;

    auto now = Clock::now();
    bool finished = total_ && current_ >= *total_;
    if (finished || !last_draw_ || now - *last_draw_ >= min_interval_) {
        last_draw_ = now;
        draw();
    }
}

void ConsoleProgressReporter::close() {
    if (!open_) return;
    draw();
    out_ << std::endl;
    open_ = false;
}

void ConsoleProgressReporter::draw() {
    out_ << "\r" << COLOR_GREEN << "==> " << COLOR_WHITE << label_ << " ";
    if (total_ && *total_ > 0) {
        double percentage = static_cast<double>(current_) / static_cast<double>(*total_) * 100.0;
        if (percentage > 100.0) percentage = 100.0;
        int pos = static_cast<int>(bar_width_ * percentage / 100.0);
        out_ << "[";
        for (int i = 0; i < bar_width_; ++i) {
            if (i < pos) out_ << "#";
            else if (i == pos) out_ << ">";
            else out_ << "-";
        }
        out_ << "] " << std::fixed << std::setprecision(1) << percentage << "% ("
             << format_bytes(current_) << "/" << format_bytes(*total_) << ")";
    } else {
        // Unknown size: report only what has arrived.
        out_ << format_bytes(current_);
    }
    out_ << COLOR_RESET << std::flush;
}

std::unique_ptr<ProgressReporter> make_progress_reporter(ProgressMode mode) {
    if (mode == ProgressMode::BAR && stdout_is_tty()) {
        return std::make_unique<ConsoleProgressReporter>(std::cout);
    }
    return std::make_unique<SilentProgressReporter>();
}
