#pragma once
#include "baseline_classifier.h"
#include "cancellation.h"
#include "catalog.h"
#include "probe_executor.h"
#include "scan_config.h"
#include "scan_metrics.h"
#include <schema/leftover.h>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// One scan per target.
// Establishes the baseline, then runs a resizable worker pool over the
// candidate sequence: rate gate, probe, fingerprint cache, classifier,
// dedup, emit. Stops when candidates run out or the cancellation token is
// set, always draining in-flight probes before returning.

struct ScanProgress {
    size_t processed = 0;
    size_t accepted = 0;
    int workers = 0;
    double rps = 0.0;
};

struct ScanReport {
    std::string target;
    std::string timestamp;
    int level = 0;
    std::vector<Leftover> results;
    MetricsSnapshot metrics;
    Baseline baseline;
    BaselineState baseline_state = BaselineState::UNINITIALIZED;
    bool cancelled = false;
};

class ScanOrchestrator {
public:
    using ResultCallback = std::function<void(const Leftover&)>;
    using ProgressCallback = std::function<void(const ScanProgress&)>;
    using BaselineCallback = std::function<void(const Baseline&, BaselineState)>;
    using RejectCallback = std::function<void(const Candidate&, const ProbeOutcome&, VerdictReason)>;

    /**
     * @brief Create an orchestrator
     * @param config Validated scan configuration
     * @param executor Probe executor shared by all workers
     * @param cancel Cooperative cancellation token
     * @param catalog Candidate catalogs
     */
    ScanOrchestrator(const ScanConfig& config,
                     ProbeExecutor& executor,
                     const CancellationToken& cancel,
                     const Catalog& catalog = Catalog::builtin());

    ~ScanOrchestrator();

    ScanOrchestrator(const ScanOrchestrator&) = delete;
    ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

    /// Called once per accepted leftover, from worker threads.
    void on_result(ResultCallback cb) { on_result_ = std::move(cb); }

    /// Called periodically from worker threads and once at the end.
    void on_progress(ProgressCallback cb) { on_progress_ = std::move(cb); }

    /// Called for every classified candidate that is not reported, from worker threads.
    void on_rejected(RejectCallback cb) { on_rejected_ = std::move(cb); }

    /// Called after the baseline phase, before bulk probing.
    void on_baseline(BaselineCallback cb) { on_baseline_ = std::move(cb); }

    /**
     * @brief Scan one target
     * @param target_url Base URL
     * @return Report with accepted leftovers and metrics; partial if cancelled
     * @throws ConfigError if the target URL is malformed
     */
    ScanReport run(const std::string& target_url);

    /// Worker threads started and not yet joined.
    size_t pool_threads() const;

    static constexpr size_t kProgressEvery = 50;

    /// Rate-gate id used by the sanity probes; pool workers count up from 0.
    static constexpr size_t kBaselineWorker = static_cast<size_t>(-1);

private:
    struct RunState;

    const ScanConfig& config_;
    ProbeExecutor& executor_;
    const CancellationToken& cancel_;
    const Catalog& catalog_;

    ResultCallback on_result_;
    ProgressCallback on_progress_;
    BaselineCallback on_baseline_;
    RejectCallback on_rejected_;

    // Worker pool
    mutable std::mutex pool_mu_;
    std::condition_variable pool_cv_;
    std::vector<std::thread> threads_;
    std::vector<std::thread::id> exited_;   // workers that returned, awaiting join
    int live_workers_ = 0;
    int target_workers_ = 0;
    size_t next_worker_id_ = 0;

    void resize_pool(RunState& state, int workers);
    void spawn_locked(RunState& state);
    void take_exited_locked(std::vector<std::thread>& out);
    void worker_loop(RunState& state, size_t worker_id);
    bool should_retire(RunState& state);
    void process(RunState& state, const Candidate& candidate);
    void join_all();
};
