// Adaptive concurrency implementation

#include "adaptive_concurrency.h"
#include <algorithm>
#include <vector>

AdaptiveConcurrency::AdaptiveConcurrency(int initial_workers, const Options& opts)
    : opts_(opts),
      workers_(std::max(1, std::min(initial_workers, std::max(opts.max_workers, 1)))) {
    if (opts_.window == 0) opts_.window = 1;
}

int AdaptiveConcurrency::grow(int n, int max_workers) {
    int next = std::max(n + 1, n * 120 / 100);
    return std::min(next, std::max(max_workers, 1));
}

int AdaptiveConcurrency::shrink(int n) {
    int next = std::min(n - 1, n * 70 / 100);
    return std::max(next, 1);
}

double AdaptiveConcurrency::median() const {
    std::vector<double> v(window_.begin(), window_.end());
    if (v.empty()) return 0.0;
    size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + mid, v.end());
    if (v.size() % 2 == 1) return v[mid];
    double upper = v[mid];
    double lower = *std::max_element(v.begin(), v.begin() + mid);
    return (lower + upper) / 2.0;
}

std::optional<int> AdaptiveConcurrency::record(double latency_ms) {
    std::lock_guard<std::mutex> lock(mu_);
    window_.push_back(latency_ms);
    while (window_.size() > opts_.window) window_.pop_front();

    completions_++;
    if (completions_ % opts_.window != 0) return std::nullopt;

    last_median_ = median();
    int next = workers_;
    if (last_median_ < opts_.fast_ms) {
        next = grow(workers_, opts_.max_workers);
    } else if (last_median_ > opts_.slow_ms) {
        next = shrink(workers_);
    }

    if (next == workers_) return std::nullopt;
    workers_ = next;
    adjustments_++;
    return next;
}

int AdaptiveConcurrency::workers() const {
    std::lock_guard<std::mutex> lock(mu_);
    return workers_;
}

double AdaptiveConcurrency::last_median() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_median_;
}

size_t AdaptiveConcurrency::adjustments() const {
    std::lock_guard<std::mutex> lock(mu_);
    return adjustments_;
}
