#pragma once

#include "config.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

// Observer for byte progress of one attempt. Has no influence on the transfer.
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void begin(const std::string& label, std::uint64_t initial_bytes,
                       std::optional<std::uint64_t> total) = 0;
    virtual void update(std::uint64_t bytes_delta) = 0;
    virtual void close() = 0;
};

class SilentProgressReporter : public ProgressReporter {
public:
    void begin(const std::string&, std::uint64_t, std::optional<std::uint64_t>) override {}
    void update(std::uint64_t) override {}
    void close() override {}
};

// Redraws a single "\r" line, at most once per min_interval. The final state
// is always drawn by close().
class ConsoleProgressReporter : public ProgressReporter {
public:
    using Clock = std::chrono::steady_clock;

    explicit ConsoleProgressReporter(std::ostream& out,
                                     std::chrono::milliseconds min_interval = std::chrono::seconds(1),
                                     int bar_width = 40);

    void begin(const std::string& label, std::uint64_t initial_bytes,
               std::optional<std::uint64_t> total) override;
    void update(std::uint64_t bytes_delta) override;
    void close() override;

    std::uint64_t bytes() const { return current_; }

private:
    void draw();

    std::ostream& out_;
    std::chrono::milliseconds min_interval_;
    int bar_width_;
    std::string label_;
    std::uint64_t current_ = 0;
    std::optional<std::uint64_t> total_;
    std::optional<Clock::time_point> last_draw_;
    bool open_ = false;
};

std::unique_ptr<ProgressReporter> make_progress_reporter(ProgressMode mode);
