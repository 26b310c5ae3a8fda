#pragma once
#include "cancellation.h"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <unordered_map>

// Shared pacing gate passed by every worker right before a probe.
// Two knobs compose: a global requests-per-second ceiling and a minimum gap
// between request starts of the same worker. A caller reserves the earliest
// start time satisfying both, then sleeps until it. Requests are delayed,
// never dropped or reordered.

class RateController {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Create a rate controller
     * @param rate_limit Requests per second across all workers, 0 = unlimited
     * @param delay_ms Minimum gap between starts from one worker, 0 = none
     */
    RateController(double rate_limit, long delay_ms);

    /**
     * @brief Wait for permission to start a request
     * @param worker_id Stable id of the calling worker
     * @param cancel Token checked while waiting
     * @return false if cancelled before the slot was reached
     */
    bool acquire(size_t worker_id, const CancellationToken& cancel);

    /// Wake all waiters so they re-check their cancellation token.
    void interrupt();

    bool enabled() const { return interval_.count() > 0 || delay_.count() > 0; }

private:
    Clock::duration interval_;
    Clock::duration delay_;
    Clock::time_point next_slot_;
    std::unordered_map<size_t, Clock::time_point> last_start_;
    std::mutex mu_;
    std::condition_variable cv_;
};
