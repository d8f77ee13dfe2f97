#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace lanxfer {

inline constexpr std::chrono::milliseconds kDefaultProgressInterval{50};

struct ProgressSnapshot {
    std::string label;
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;
    double fraction = 0.0;
    double throughput = 0.0;                    // bytes per second
    std::optional<std::chrono::seconds> eta;    // nullopt when throughput is zero
    bool finished = false;
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

// Pure accounting: turns byte counts into rate limited snapshots. Never does
// I/O itself, the callback decides what to do with a snapshot.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    ProgressTracker(std::string label, std::uint64_t total,
                    std::chrono::milliseconds interval = kDefaultProgressInterval,
                    ProgressCallback callback = {},
                    Clock::time_point start = Clock::now());

    /**
     * Records the cumulative byte count. Notifies the callback at most once per
     * interval, except that reaching the total always notifies (once).
     *
     * \return true if a notification was emitted.
     */
    bool update(std::uint64_t bytes_so_far);
    bool update(std::uint64_t bytes_so_far, Clock::time_point now);

    ProgressSnapshot snapshot(Clock::time_point now) const;

    std::uint64_t done() const { return done_; }
    std::uint64_t total() const { return total_; }
    std::size_t notifications() const { return notifications_; }

private:
    std::string label_;
    std::uint64_t total_;
    std::chrono::milliseconds interval_;
    ProgressCallback callback_;
    Clock::time_point start_;
    std::optional<Clock::time_point> last_notify_;
    std::uint64_t done_ = 0;
    std::size_t notifications_ = 0;
    bool finished_ = false;
};

} // namespace lanxfer
