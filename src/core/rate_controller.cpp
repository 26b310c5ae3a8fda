// Request pacing implementation

#include "rate_controller.h"
#include <algorithm>

RateController::RateController(double rate_limit, long delay_ms)
    : interval_(Clock::duration::zero()),
      delay_(std::chrono::milliseconds(std::max(delay_ms, 0L))),
      next_slot_(Clock::now()) {
    if (rate_limit > 0.0) {
        interval_ = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(1.0 / rate_limit));
    }
}

bool RateController::acquire(size_t worker_id, const CancellationToken& cancel) {
    if (!enabled()) return !cancel.cancelled();

    std::unique_lock<std::mutex> lock(mu_);
    const auto now = Clock::now();

    // Stricter of the two constraints wins
    auto start = now;
    if (interval_.count() > 0) start = std::max(start, next_slot_);
    if (delay_.count() > 0) {
        auto it = last_start_.find(worker_id);
        if (it != last_start_.end()) start = std::max(start, it->second + delay_);
    }

    if (interval_.count() > 0) next_slot_ = start + interval_;
    last_start_[worker_id] = start;

    while (Clock::now() < start) {
        if (cancel.cancelled()) return false;
        // Bounded slices so a token flipped from a signal handler is seen
        Clock::time_point slice = Clock::now() + std::chrono::duration_cast<Clock::duration>(
            std::chrono::milliseconds(100));
        cv_.wait_until(lock, std::min(start, slice));
    }
    if (delay_.count() > 0) last_start_[worker_id] = std::max(start, Clock::now());
    return !cancel.cancelled();
}

void RateController::interrupt() {
    std::lock_guard<std::mutex> lock(mu_);
    cv_.notify_all();
}
