/**
 * @file scan_orchestrator.cpp
 * @brief Worker pool driving one target scan
 */

#include "scan_orchestrator.h"
#include "adaptive_concurrency.h"
#include "candidate_generator.h"
#include "fingerprint_cache.h"
#include "rate_controller.h"
#include "url_utils.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iterator>
#include <optional>
#include <set>
#include <sstream>
#include <tuple>

/// Get current timestamp in ISO8601 format.
static std::string current_utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.';
    ss << std::setw(3) << std::setfill('0') << ms.count() << "Z";
    return ss.str();
}

// Everything shared by the workers of one run.
struct ScanOrchestrator::RunState {
    CandidateGenerator generator;
    std::mutex generator_mu;

    BaselineClassifier& classifier;
    FingerprintCache cache;
    RateController& rate;
    std::optional<AdaptiveConcurrency> adaptive;
    ScanMetrics& metrics;

    std::mutex results_mu;
    std::vector<Leftover> results;
    std::set<std::tuple<std::string, long, size_t>> emitted;

    std::atomic<size_t> processed{0};

    RunState(const TargetUrl& target, const ScanConfig& config, const Catalog& catalog,
             BaselineClassifier& cls, RateController& gate, ScanMetrics& m)
        : generator(target, config, catalog),
          classifier(cls),
          cache(config.cache_capacity),
          rate(gate),
          metrics(m) {}
};

ScanOrchestrator::ScanOrchestrator(const ScanConfig& config,
                                   ProbeExecutor& executor,
                                   const CancellationToken& cancel,
                                   const Catalog& catalog)
    : config_(config), executor_(executor), cancel_(cancel), catalog_(catalog) {}

ScanOrchestrator::~ScanOrchestrator() {
    join_all();
}

ScanReport ScanOrchestrator::run(const std::string& target_url) {
    TargetUrl target;
    if (!parse_target_url(target_url, target)) {
        throw ConfigError("malformed target URL: " + target_url);
    }

    ScanReport report;
    report.target = target.origin() + target.path();
    report.timestamp = current_utc_timestamp();
    report.level = config_.level;

    ScanMetrics metrics;
    metrics.start_clock();

    // One gate for the whole run, sanity probes included
    RateController rate(config_.rate_limit, config_.delay_ms);

    // Baseline first: no candidate is probed before it is settled
    BaselineClassifier classifier(config_);
    if (config_.skip_baseline) {
        classifier.skip();
    } else if (!cancel_.cancelled()) {
        classifier.establish(executor_, target.origin() + target.directory(), [&] {
            if (!rate.acquire(kBaselineWorker, cancel_)) return false;
            metrics.requests++;
            return true;
        });
    }
    report.baseline = classifier.baseline();
    report.baseline_state = classifier.state();
    if (on_baseline_) on_baseline_(report.baseline, report.baseline_state);

    RunState state(target, config_, catalog_, classifier, rate, metrics);
    int initial = config_.threads;
    if (config_.adaptive) {
        AdaptiveConcurrency::Options opts;
        opts.max_workers = config_.max_threads;
        state.adaptive.emplace(config_.threads, opts);
        initial = state.adaptive->workers();
    }

    if (!cancel_.cancelled()) {
        resize_pool(state, initial);

        // Wait for the pool to drain, then reap every thread it ever started
        std::unique_lock<std::mutex> lock(pool_mu_);
        pool_cv_.wait(lock, [this] { return live_workers_ == 0; });
    }
    join_all();

    metrics.set_workers(0);
    metrics.stop_clock();
    report.metrics = metrics.snapshot();
    if (state.adaptive) {
        report.metrics.current_workers = state.adaptive->workers();
    } else {
        report.metrics.current_workers = initial;
    }
    report.cancelled = cancel_.cancelled();

    {
        std::lock_guard<std::mutex> lock(state.results_mu);
        report.results = std::move(state.results);
    }

    if (on_progress_) {
        ScanProgress p;
        p.processed = state.processed.load();
        p.accepted = report.results.size();
        p.workers = 0;
        p.rps = report.metrics.requests_per_second();
        on_progress_(p);
    }
    return report;
}

void ScanOrchestrator::resize_pool(RunState& state, int workers) {
    std::vector<std::thread> exited;
    {
        std::lock_guard<std::mutex> lock(pool_mu_);
        take_exited_locked(exited);
        target_workers_ = std::max(workers, 1);
        while (live_workers_ < target_workers_) {
            spawn_locked(state);
        }
        state.metrics.set_workers(live_workers_);
    }
    // These have already left worker_loop, so joining does not block on the pool
    for (auto& t : exited) t.join();
}

/// Move threads whose worker has returned out of the pool.
void ScanOrchestrator::take_exited_locked(std::vector<std::thread>& out) {
    if (exited_.empty()) return;
    auto done = [this](const std::thread& t) {
        return std::find(exited_.begin(), exited_.end(), t.get_id()) != exited_.end();
    };
    auto split = std::partition(threads_.begin(), threads_.end(),
        [&](const std::thread& t) { return !done(t); });
    std::move(split, threads_.end(), std::back_inserter(out));
    threads_.erase(split, threads_.end());
    exited_.clear();
}

size_t ScanOrchestrator::pool_threads() const {
    std::lock_guard<std::mutex> lock(pool_mu_);
    return threads_.size();
}

void ScanOrchestrator::spawn_locked(RunState& state) {
    size_t id = next_worker_id_++;
    live_workers_++;
    threads_.emplace_back(&ScanOrchestrator::worker_loop, this, std::ref(state), id);
}

/// Leave the pool when it holds more workers than the current target.
bool ScanOrchestrator::should_retire(RunState& state) {
    std::lock_guard<std::mutex> lock(pool_mu_);
    if (live_workers_ <= target_workers_) return false;
    live_workers_--;
    exited_.push_back(std::this_thread::get_id());
    state.metrics.set_workers(live_workers_);
    pool_cv_.notify_all();
    return true;
}

void ScanOrchestrator::worker_loop(RunState& state, size_t worker_id) {
    while (!cancel_.cancelled()) {
        if (should_retire(state)) return;

        std::optional<Candidate> candidate;
        {
            std::lock_guard<std::mutex> lock(state.generator_mu);
            candidate = state.generator.next();
        }
        if (!candidate) break;
        state.metrics.candidates++;

        if (!state.rate.acquire(worker_id, cancel_)) break;
        process(state, *candidate);
    }

    std::lock_guard<std::mutex> lock(pool_mu_);
    live_workers_--;
    exited_.push_back(std::this_thread::get_id());
    state.metrics.set_workers(live_workers_);
    pool_cv_.notify_all();
}

void ScanOrchestrator::process(RunState& state, const Candidate& candidate) {
    ProbeOutcome outcome = executor_.probe(candidate.url);
    state.metrics.requests++;

    if (state.adaptive) {
        if (auto next = state.adaptive->record(outcome.elapsed_ms)) {
            state.metrics.worker_adjustments++;
            resize_pool(state, *next);
        }
    }

    size_t processed = ++state.processed;
    if (on_progress_ && processed % kProgressEvery == 0) {
        ScanProgress p;
        p.processed = processed;
        p.accepted = state.metrics.accepted.load();
        p.workers = state.metrics.current_workers.load();
        p.rps = state.metrics.current_rps();
        on_progress_(p);
    }

    // Transport errors are counted and skipped, never retried
    if (!outcome.ok()) {
        state.metrics.transport_errors++;
        return;
    }

    // The cache only answers for a shape whose stored hash matches this body
    Fingerprint key{FingerprintCache::path_shape(candidate.path), outcome.status};
    state.metrics.cache_lookups++;
    bool baseline_match;
    auto cached = state.cache.get(key);
    if (cached && cached->content_hash == outcome.content_hash) {
        state.metrics.cache_hits++;
        baseline_match = cached->is_baseline_match;
    } else {
        baseline_match = state.classifier.matches_baseline(outcome);
        state.cache.put(key, CachedVerdict{baseline_match, outcome.content_hash});
    }

    Verdict verdict = state.classifier.judge(outcome, baseline_match);
    if (!verdict.accepted) {
        if (verdict.reason == VerdictReason::BASELINE_MATCH) {
            state.metrics.baseline_rejections++;
        } else {
            state.metrics.filtered++;
        }
        if (on_rejected_) on_rejected_(candidate, outcome, verdict.reason);
        return;
    }

    Leftover leftover;
    leftover.candidate = candidate;
    leftover.status = outcome.status;
    leftover.size = outcome.size;
    leftover.content_type = outcome.content_type;
    leftover.content_hash = outcome.content_hash;
    leftover.elapsed_ms = outcome.elapsed_ms;
    leftover.confidence = verdict.confidence;
    leftover.partial_analysis = outcome.partial_analysis;
    leftover.partial_content = outcome.partial_content;
    if (!outcome.effective_url.empty() && outcome.effective_url != candidate.url) {
        leftover.redirected_to = outcome.effective_url;
    }
    leftover.timestamp = current_utc_timestamp();

    {
        std::lock_guard<std::mutex> lock(state.results_mu);
        auto dedup_key = std::make_tuple(normalize_url(candidate.url), outcome.status, outcome.size);
        if (!state.emitted.insert(dedup_key).second) {
            state.metrics.duplicates++;
            return;
        }
        state.results.push_back(leftover);
    }
    state.metrics.accepted++;

    if (on_result_) on_result_(leftover);
}

void ScanOrchestrator::join_all() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(pool_mu_);
        threads.swap(threads_);
        exited_.clear();
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
}
