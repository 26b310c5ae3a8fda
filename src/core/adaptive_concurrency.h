#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

// Latency-driven worker count control.
// Keeps the last `window` probe latencies; after every `window` completions
// the median decides: fast targets get 20% more workers, slow ones 30% fewer.

class AdaptiveConcurrency {
public:
    struct Options {
        size_t window;
        double fast_ms;       // below: grow
        double slow_ms;       // above: shrink
        int max_workers;

        Options()
            : window(50),
              fast_ms(100.0),
              slow_ms(500.0),
              max_workers(50)
        {}
    };

    /**
     * @brief Create a controller
     * @param initial_workers Starting worker count (clamped to [1, max])
     * @param opts Window size, thresholds and ceiling
     */
    explicit AdaptiveConcurrency(int initial_workers, const Options& opts = Options());

    /**
     * @brief Record one completed probe
     * @param latency_ms Probe latency in milliseconds
     * @return New worker count when this completion triggered a change
     */
    std::optional<int> record(double latency_ms);

    int workers() const;
    double last_median() const;
    size_t adjustments() const;

    /// Grow policy: max(n + 1, n * 120 / 100), capped at max_workers.
    static int grow(int n, int max_workers);

    /// Shrink policy: min(n - 1, n * 70 / 100), floored at 1.
    static int shrink(int n);

private:
    Options opts_;
    int workers_;
    std::deque<double> window_;
    size_t completions_ = 0;
    size_t adjustments_ = 0;
    double last_median_ = 0.0;
    mutable std::mutex mu_;

    double median() const;
};
