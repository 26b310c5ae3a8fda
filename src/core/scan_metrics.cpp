// Scan metrics implementation

#include "scan_metrics.h"

nlohmann::json MetricsSnapshot::to_json() const {
    nlohmann::json j;
    j["candidates"] = candidates;
    j["total_requests"] = requests;
    j["transport_errors"] = transport_errors;
    j["cache_lookups"] = cache_lookups;
    j["cache_hits"] = cache_hits;
    j["cache_hit_rate"] = cache_hit_rate();
    j["baseline_rejections"] = baseline_rejections;
    j["filtered"] = filtered;
    j["duplicates"] = duplicates;
    j["accepted"] = accepted;
    j["final_workers"] = current_workers;
    j["peak_workers"] = peak_workers;
    j["worker_adjustments"] = worker_adjustments;
    j["elapsed_seconds"] = elapsed_seconds;
    j["requests_per_second"] = requests_per_second();
    return j;
}

ScanMetrics::ScanMetrics()
    : started_(Clock::now().time_since_epoch().count()),
      stopped_(0) {}

void ScanMetrics::set_workers(int n) {
    current_workers.store(n);
    int peak = peak_workers.load();
    while (n > peak && !peak_workers.compare_exchange_weak(peak, n)) {}
}

void ScanMetrics::start_clock() {
    started_.store(Clock::now().time_since_epoch().count());
    stopped_.store(0);
}

void ScanMetrics::stop_clock() {
    stopped_.store(Clock::now().time_since_epoch().count());
}

double ScanMetrics::elapsed_seconds() const {
    Clock::rep end = stopped_.load();
    if (end == 0) end = Clock::now().time_since_epoch().count();
    Clock::duration d(end - started_.load());
    return std::chrono::duration<double>(d).count();
}

double ScanMetrics::current_rps() const {
    double e = elapsed_seconds();
    return e > 0.0 ? static_cast<double>(requests.load()) / e : 0.0;
}

MetricsSnapshot ScanMetrics::snapshot() const {
    MetricsSnapshot s;
    s.candidates = candidates.load();
    s.requests = requests.load();
    s.transport_errors = transport_errors.load();
    s.cache_lookups = cache_lookups.load();
    s.cache_hits = cache_hits.load();
    s.baseline_rejections = baseline_rejections.load();
    s.filtered = filtered.load();
    s.duplicates = duplicates.load();
    s.accepted = accepted.load();
    s.current_workers = current_workers.load();
    s.peak_workers = peak_workers.load();
    s.worker_adjustments = worker_adjustments.load();
    s.elapsed_seconds = elapsed_seconds();
    return s;
}
