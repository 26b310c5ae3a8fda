#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>

// Scan-wide counters, updated concurrently by workers and the adaptive
// controller. Every field is an atomic; snapshot() gives a consistent-enough
// plain copy for reporting.

struct MetricsSnapshot {
    size_t candidates = 0;
    size_t requests = 0;
    size_t transport_errors = 0;
    size_t cache_lookups = 0;
    size_t cache_hits = 0;
    size_t baseline_rejections = 0;
    size_t filtered = 0;
    size_t duplicates = 0;
    size_t accepted = 0;
    int current_workers = 0;
    int peak_workers = 0;
    size_t worker_adjustments = 0;
    double elapsed_seconds = 0.0;

    double cache_hit_rate() const {
        return cache_lookups ? static_cast<double>(cache_hits) / static_cast<double>(cache_lookups) : 0.0;
    }
    double requests_per_second() const {
        return elapsed_seconds > 0.0 ? static_cast<double>(requests) / elapsed_seconds : 0.0;
    }

    nlohmann::json to_json() const;
};

class ScanMetrics {
public:
    ScanMetrics();

    std::atomic<size_t> candidates{0};
    std::atomic<size_t> requests{0};
    std::atomic<size_t> transport_errors{0};
    std::atomic<size_t> cache_lookups{0};
    std::atomic<size_t> cache_hits{0};
    std::atomic<size_t> baseline_rejections{0};
    std::atomic<size_t> filtered{0};
    std::atomic<size_t> duplicates{0};
    std::atomic<size_t> accepted{0};
    std::atomic<int> current_workers{0};
    std::atomic<int> peak_workers{0};
    std::atomic<size_t> worker_adjustments{0};

    /// Set the live worker count and track the peak.
    void set_workers(int n);

    /// Restart the elapsed-time clock.
    void start_clock();

    /// Freeze the elapsed time at the current instant.
    void stop_clock();

    double elapsed_seconds() const;
    double current_rps() const;

    MetricsSnapshot snapshot() const;

private:
    using Clock = std::chrono::steady_clock;
    std::atomic<Clock::rep> started_;
    std::atomic<Clock::rep> stopped_;
};
