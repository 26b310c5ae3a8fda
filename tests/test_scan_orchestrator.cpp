/**
 * @file test_scan_orchestrator.cpp
 * @brief End-to-end engine tests against a scripted in-process target
 *
 * Each case wires the full pipeline (baseline, generator, pool, rate gate,
 * cache, classifier) to a FakeTarget and checks what gets reported.
 */

#include <catch2/catch.hpp>
#include "core/scan_orchestrator.h"
#include "helpers/fake_target.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <thread>

static FakeResponse page(long status, const std::string& body,
                         const std::string& type = "text/plain") {
    FakeResponse r;
    r.status = status;
    r.body = body;
    r.content_type = type;
    return r;
}

static bool reported(const ScanReport& report, const std::string& path) {
    return std::any_of(report.results.begin(), report.results.end(),
        [&](const Leftover& l) { return l.candidate.path == path; });
}

static ScanConfig critical_only() {
    ScanConfig config;
    config.level = 0;
    config.threads = 4;
    return config;
}

TEST_CASE("Plain 404 target reports only real files", "[orchestrator]") {
    FakeTarget target;
    target.add("/.env", page(200, "DB_PASSWORD=hunter2\n"));
    target.add("/web.config", page(200, "<configuration/>", "application/xml"));

    ScanConfig config = critical_only();
    CancellationToken cancel;
    ScanOrchestrator orch(config, target, cancel);

    std::atomic<int> callbacks{0};
    bool baseline_seen = false;
    orch.on_baseline([&](const Baseline& b, BaselineState s) {
        baseline_seen = true;
        REQUIRE(s == BaselineState::READY);
        REQUIRE(b.kind == SignatureKind::HASH);
        REQUIRE(b.status == 404);
    });
    orch.on_result([&](const Leftover&) { callbacks++; });

    ScanReport report = orch.run("http://example.com/");

    REQUIRE(baseline_seen);
    REQUIRE_FALSE(report.cancelled);
    REQUIRE(report.results.size() == 2);
    REQUIRE(callbacks == 2);
    REQUIRE(reported(report, "/.env"));
    REQUIRE(reported(report, "/web.config"));
    for (const auto& l : report.results) {
        REQUIRE(l.status == 200);
        REQUIRE(l.confidence == Confidence::HASH);
        REQUIRE_FALSE(l.content_hash.empty());
        REQUIRE_FALSE(l.timestamp.empty());
    }

    // Baseline probes plus one request per candidate
    REQUIRE(report.metrics.candidates == 12);
    REQUIRE(report.metrics.requests == 3 + 12);
    REQUIRE(target.request_count() == 3 + 12);
    REQUIRE(report.metrics.accepted == 2);
    REQUIRE(report.metrics.filtered == 10);
}

TEST_CASE("Soft 404 pages are filtered by the baseline", "[orchestrator]") {
    SECTION("Identical soft 404 body") {
        FakeTarget target(page(200, "<html><body>Welcome to our shop</body></html>", "text/html"));
        target.add("/.env", page(200, "APP_KEY=base64:abc\n"));

        ScanConfig config = critical_only();
        CancellationToken cancel;
        ScanOrchestrator orch(config, target, cancel);
        ScanReport report = orch.run("http://example.com/");

        REQUIRE(report.baseline.kind == SignatureKind::HASH);
        REQUIRE(report.baseline.status == 200);
        REQUIRE(report.results.size() == 1);
        REQUIRE(report.results[0].candidate.path == "/.env");
        REQUIRE(report.metrics.baseline_rejections == 11);
    }

    SECTION("Soft 404 body that echoes the path") {
        FakeTarget target;
        target.set_not_found([](const std::string& path) {
            return page(200, "<html><body><p>Nothing at " + path + "</p>" +
                             std::string(2000, ' ') + "</body></html>", "text/html");
        });
        target.add("/.env", page(200, "APP_KEY=base64:abc\n"));

        ScanConfig config = critical_only();
        CancellationToken cancel;
        ScanOrchestrator orch(config, target, cancel);
        ScanReport report = orch.run("http://example.com/");

        REQUIRE(report.baseline.kind == SignatureKind::SIZE);
        REQUIRE(report.results.size() == 1);
        REQUIRE(report.results[0].candidate.path == "/.env");
        REQUIRE(report.results[0].confidence == Confidence::SIZE);
    }
}

TEST_CASE("Rejected candidates are reported with their reason", "[orchestrator]") {
    FakeTarget target;
    target.add("/.env", page(200, "DB_PASSWORD=hunter2\n"));

    ScanConfig config = critical_only();
    CancellationToken cancel;
    ScanOrchestrator orch(config, target, cancel);

    // Callbacks run on workers, so only record here and check afterwards
    std::mutex mu;
    std::map<std::string, size_t> reasons;
    std::vector<std::string> paths;
    std::set<long> statuses;
    orch.on_rejected([&](const Candidate& c, const ProbeOutcome& o, VerdictReason r) {
        std::lock_guard<std::mutex> lock(mu);
        paths.push_back(c.path);
        statuses.insert(o.status);
        reasons[verdict_reason_name(r)]++;
    });
    ScanReport report = orch.run("http://example.com/");

    REQUIRE(report.results.size() == 1);
    REQUIRE(paths.size() == 11);
    REQUIRE(std::find(paths.begin(), paths.end(), "/.env") == paths.end());
    REQUIRE(statuses == std::set<long>{404});
    REQUIRE(reasons.size() == 1);
    REQUIRE(reasons["ignored_status"] == 11);
}

TEST_CASE("Followed redirects are kept on the result", "[orchestrator]") {
    FakeTarget target;
    FakeResponse moved = page(200, "<configuration/>", "application/xml");
    moved.redirect_to = "http://example.com/legacy/web.config";
    target.add("/web.config", moved);
    target.add("/.env", page(200, "SECRET=1"));

    ScanConfig config = critical_only();
    CancellationToken cancel;
    ScanOrchestrator orch(config, target, cancel);
    ScanReport report = orch.run("http://example.com/");

    REQUIRE(report.results.size() == 2);
    for (const auto& l : report.results) {
        if (l.candidate.path == "/web.config") {
            REQUIRE(l.redirected_to == "http://example.com/legacy/web.config");
        } else {
            REQUIRE(l.redirected_to.empty());
        }
    }
}

TEST_CASE("Status allow list reports forbidden files", "[orchestrator]") {
    FakeTarget target;
    target.add("/.env", page(403, "<html><body><h1>Forbidden</h1></body></html>", "text/html"));
    target.add("/web.config", page(200, "<configuration/>"));

    ScanConfig config = critical_only();
    config.status_allow = {403};
    CancellationToken cancel;
    ScanOrchestrator orch(config, target, cancel);
    ScanReport report = orch.run("http://example.com/");

    REQUIRE(report.results.size() == 1);
    REQUIRE(report.results[0].candidate.path == "/.env");
    REQUIRE(report.results[0].status == 403);
}

TEST_CASE("Skipping the baseline marks results unverified", "[orchestrator]") {
    FakeTarget target;
    target.add("/.env", page(200, "SECRET=1"));

    ScanConfig config = critical_only();
    config.skip_baseline = true;
    CancellationToken cancel;
    ScanOrchestrator orch(config, target, cancel);
    ScanReport report = orch.run("http://example.com/");

    REQUIRE(report.baseline_state == BaselineState::SKIPPED);
    REQUIRE(report.results.size() == 1);
    REQUIRE(report.results[0].confidence == Confidence::UNVERIFIED);

    // No sanity probes were sent
    REQUIRE(target.request_count() == 12);
    REQUIRE(report.metrics.requests == 12);
}

static double ms_between(std::chrono::steady_clock::time_point a,
                         std::chrono::steady_clock::time_point b) {
    return std::chrono::duration<double, std::milli>(b - a).count();
}

TEST_CASE("Baseline requests pass the rate gate too", "[orchestrator][rate]") {
    FakeTarget target;
    ScanConfig config = critical_only();
    CancellationToken cancel;

    SECTION("Requests per second cap covers the whole run") {
        config.rate_limit = 20.0;
        ScanOrchestrator orch(config, target, cancel);
        ScanReport report = orch.run("http://example.com/");

        auto times = target.request_times();
        REQUIRE(times.size() == 3 + 12);
        REQUIRE(report.metrics.requests == times.size());

        // 50 ms slots from the very first sanity probe on
        REQUIRE(ms_between(times[0], times[1]) >= 45.0);
        REQUIRE(ms_between(times[0], times[4]) >= 190.0);
        REQUIRE(ms_between(times[0], times.back()) >= 680.0);
    }

    SECTION("Per-worker delay spaces the sanity probes") {
        config.delay_ms = 100;
        config.threads = 1;
        ScanOrchestrator orch(config, target, cancel);
        orch.run("http://example.com/");

        auto times = target.request_times();
        REQUIRE(times.size() == 3 + 12);
        REQUIRE(ms_between(times[0], times[1]) >= 95.0);
        REQUIRE(ms_between(times[1], times[2]) >= 95.0);
    }
}

TEST_CASE("Transport failures are counted and skipped", "[orchestrator]") {
    FakeTarget target;
    FakeResponse broken;
    broken.transport_error = "connection reset";
    target.add("/.env", broken);
    target.add("/web.config", page(200, "<configuration/>"));

    ScanConfig config = critical_only();
    CancellationToken cancel;
    ScanOrchestrator orch(config, target, cancel);
    ScanReport report = orch.run("http://example.com/");

    REQUIRE(report.metrics.transport_errors == 1);
    REQUIRE(report.results.size() == 1);
    REQUIRE(report.results[0].candidate.path == "/web.config");

    // Failed probes are not retried
    auto paths = target.requested_paths();
    REQUIRE(std::count(paths.begin(), paths.end(), "/.env") == 1);
}

TEST_CASE("Repeated path shapes are answered from the cache", "[orchestrator]") {
    FakeTarget target;
    ScanConfig config;
    config.level = 1;
    config.brute_force = true;
    config.threads = 2;
    CancellationToken cancel;
    ScanOrchestrator orch(config, target, cancel);
    ScanReport report = orch.run("http://example.com/");

    REQUIRE(report.results.empty());
    REQUIRE(report.metrics.cache_hits > 0);
    REQUIRE(report.metrics.cache_lookups == report.metrics.candidates);
    REQUIRE(report.metrics.requests == 3 + report.metrics.candidates);
}

TEST_CASE("Cancellation before the run probes nothing", "[orchestrator]") {
    FakeTarget target;
    ScanConfig config = critical_only();
    CancellationToken cancel;
    cancel.cancel();

    ScanOrchestrator orch(config, target, cancel);
    ScanReport report = orch.run("http://example.com/");

    REQUIRE(report.cancelled);
    REQUIRE(report.results.empty());
    REQUIRE(target.request_count() == 0);
}

TEST_CASE("Cancellation mid-run drains and returns partial results", "[orchestrator]") {
    FakeTarget target;
    target.set_sleep(20);
    target.add("/.env", page(200, "SECRET=1"));

    ScanConfig config;
    config.level = 2;
    config.brute_force = true;
    config.threads = 2;
    CancellationToken cancel;
    ScanOrchestrator orch(config, target, cancel);

    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        cancel.cancel();
    });

    auto t0 = std::chrono::steady_clock::now();
    ScanReport report = orch.run("http://example.com/");
    auto took = std::chrono::steady_clock::now() - t0;
    canceller.join();

    REQUIRE(report.cancelled);
    REQUIRE(took < std::chrono::seconds(5));
    REQUIRE(report.metrics.requests == target.request_count());
    REQUIRE(report.metrics.requests < 3 + 200);

    // Critical files go first, so the planted one was already reported
    REQUIRE(reported(report, "/.env"));
}

TEST_CASE("Malformed target is a configuration error", "[orchestrator]") {
    FakeTarget target;
    ScanConfig config = critical_only();
    CancellationToken cancel;
    ScanOrchestrator orch(config, target, cancel);
    REQUIRE_THROWS_AS(orch.run("gopher://example.com/"), ConfigError);
}

TEST_CASE("Adaptive pool follows target latency", "[orchestrator][adaptive]") {
    ScanConfig config;
    config.level = 2;
    config.brute_force = true;
    config.adaptive = true;
    config.max_threads = 30;
    CancellationToken cancel;

    SECTION("Fast target grows the pool") {
        FakeTarget target;
        target.set_latency(5.0);
        ScanOrchestrator orch(config, target, cancel);
        ScanReport report = orch.run("http://example.com/");

        REQUIRE(report.metrics.worker_adjustments > 0);
        REQUIRE(report.metrics.current_workers > config.threads);
        REQUIRE(report.metrics.current_workers <= config.max_threads);
        REQUIRE(report.metrics.peak_workers > config.threads);
    }

    SECTION("Oscillating latency does not pile up retired threads") {
        // Alternate fast and slow blocks of 50 so the pool keeps resizing
        FakeTarget target;
        std::atomic<size_t> served{0};
        target.set_not_found([&served](const std::string&) {
            FakeResponse r = not_found_page();
            r.latency_ms = (served++ / 50) % 2 == 0 ? 5.0 : 900.0;
            return r;
        });

        ScanOrchestrator orch(config, target, cancel);
        std::atomic<size_t> most_threads{0};
        orch.on_progress([&](const ScanProgress&) {
            size_t n = orch.pool_threads();
            size_t seen = most_threads.load();
            while (n > seen && !most_threads.compare_exchange_weak(seen, n)) {}
        });
        ScanReport report = orch.run("http://example.com/");

        REQUIRE(report.metrics.worker_adjustments >= 10);
        REQUIRE(most_threads.load() > 0);
        REQUIRE(most_threads.load() <= 2 * static_cast<size_t>(config.threads));
        REQUIRE(orch.pool_threads() == 0);
    }

    SECTION("Slow target shrinks the pool") {
        FakeTarget target;
        target.set_latency(900.0);
        ScanOrchestrator orch(config, target, cancel);
        ScanReport report = orch.run("http://example.com/");

        REQUIRE(report.metrics.worker_adjustments > 0);
        REQUIRE(report.metrics.current_workers < config.threads);
        REQUIRE(report.metrics.current_workers >= 1);
    }
}
