#include "lanxfer/progress.hpp"

#include <cmath>

namespace lanxfer {

ProgressTracker::ProgressTracker(std::string label, std::uint64_t total,
                                 std::chrono::milliseconds interval,
                                 ProgressCallback callback,
                                 Clock::time_point start)
    : label_(std::move(label)),
      total_(total),
      interval_(interval),
      callback_(std::move(callback)),
      start_(start) {}

bool ProgressTracker::update(std::uint64_t bytes_so_far) {
    return update(bytes_so_far, Clock::now());
}

bool ProgressTracker::update(std::uint64_t bytes_so_far, Clock::time_point now) {
    done_ = bytes_so_far;
    if (finished_) return false;

    const bool reached_total = done_ >= total_;
    if (!reached_total && last_notify_ && now - *last_notify_ < interval_) {
        return false;
    }

    last_notify_ = now;
    finished_ = reached_total;
    ++notifications_;
    if (callback_) callback_(snapshot(now));
    return true;
}

ProgressSnapshot ProgressTracker::snapshot(Clock::time_point now) const {
    ProgressSnapshot s;
    s.label = label_;
    s.bytes_done = done_;
    s.bytes_total = total_;
    s.finished = done_ >= total_;
    s.fraction = total_ > 0 ? static_cast<double>(done_) / static_cast<double>(total_) : 1.0;
    if (s.fraction > 1.0) s.fraction = 1.0;

    const double elapsed = std::chrono::duration<double>(now - start_).count();
    if (elapsed > 0.0 && done_ > 0) {
        s.throughput = static_cast<double>(done_) / elapsed;
    }

    if (s.finished) {
        s.eta = std::chrono::seconds(0);
    } else if (s.throughput > 0.0) {
        const double remaining = static_cast<double>(total_ - done_);
        s.eta = std::chrono::seconds(static_cast<long long>(std::ceil(remaining / s.throughput)));
    }
    return s;
}

} // namespace lanxfer
