/**
 * @file report_writer.cpp
 * @brief JSON reports and console summaries for finished scans
 */

#include "report_writer.h"
#include "logging/console.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace report {

using json = nlohmann::json;
namespace fs = std::filesystem;

static std::string utc_now() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

json ReportWriter::leftover_to_json(const Leftover& leftover) {
    json j;
    j["url"] = leftover.candidate.url;
    j["path"] = leftover.candidate.path;
    j["status"] = leftover.status;
    j["size"] = leftover.size;
    j["content_type"] = leftover.content_type;
    j["hash"] = leftover.content_hash;
    j["confidence"] = confidence_name(leftover.confidence);
    j["category"] = leftover.candidate.category;
    j["source"] = candidate_source_name(leftover.candidate.source);
    j["elapsed_ms"] = leftover.elapsed_ms;
    j["timestamp"] = leftover.timestamp;
    if (leftover.candidate.expected_interesting) j["interesting"] = true;
    if (leftover.partial_analysis) j["partial_analysis"] = true;
    if (leftover.partial_content) j["partial_content"] = true;
    if (!leftover.redirected_to.empty()) j["redirected_to"] = leftover.redirected_to;
    return j;
}

json ReportWriter::scan_to_json(const ScanReport& scan, bool include_metrics) {
    json j;
    j["target"] = scan.target;
    j["timestamp"] = scan.timestamp;
    j["scan_level"] = scan.level;
    j["cancelled"] = scan.cancelled;

    json baseline;
    baseline["state"] = baseline_state_name(scan.baseline_state);
    if (scan.baseline_state == BaselineState::READY) {
        baseline["signature"] = signature_kind_name(scan.baseline.kind);
        baseline["status"] = scan.baseline.status;
        baseline["size"] = scan.baseline.size;
        baseline["hash"] = scan.baseline.hash;
        baseline["agreement"] = scan.baseline.agreement;
        baseline["samples"] = scan.baseline.samples.size();
    }
    j["baseline"] = baseline;

    j["results"] = json::array();
    for (const auto& leftover : scan.results) {
        j["results"].push_back(leftover_to_json(leftover));
    }

    if (include_metrics) j["metrics"] = scan.metrics.to_json();
    return j;
}

json ReportWriter::document(const std::vector<ScanReport>& scans, bool include_metrics) {
    json doc;
    doc["tool"] = kTool;
    doc["version"] = kVersion;
    doc["generated_at"] = utc_now();
    doc["scans"] = json::array();
    for (const auto& scan : scans) {
        doc["scans"].push_back(scan_to_json(scan, include_metrics));
    }
    return doc;
}

static bool write_json_file(const json& j, const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            std::cerr << "Error: cannot create " << p.parent_path().string() << ": " << ec.message() << "\n";
            return false;
        }
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        std::cerr << "Error: cannot open " << path << " for writing\n";
        return false;
    }
    // Header-derived strings may carry arbitrary bytes from the target
    out << j.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    return out.good();
}

bool ReportWriter::write_document(const std::vector<ScanReport>& scans,
                                  const std::string& output_path,
                                  bool include_metrics) {
    return write_json_file(document(scans, include_metrics), output_path);
}

std::string ReportWriter::per_url_filename(const std::string& target) {
    std::string rest = target;
    auto scheme = rest.find("://");
    if (scheme != std::string::npos) rest = rest.substr(scheme + 3);
    while (!rest.empty() && rest.back() == '/') rest.pop_back();

    std::string name;
    for (char c : rest) {
        unsigned char uc = static_cast<unsigned char>(c);
        name += (std::isalnum(uc) || c == '.' || c == '-') ? c : '_';
    }
    if (name.empty()) name = "target";
    return name + ".json";
}

std::string ReportWriter::write_per_url(const ScanReport& scan,
                                        const std::string& output_dir,
                                        bool include_metrics) {
    std::string path = (fs::path(output_dir) / per_url_filename(scan.target)).string();
    if (!write_json_file(document({scan}, include_metrics), path)) return "";
    return path;
}

ScanSummary ReportWriter::summarize(const ScanReport& scan, size_t top_n) {
    ScanSummary summary;
    summary.target = scan.target;
    summary.accepted = scan.results.size();
    summary.cancelled = scan.cancelled;
    for (const auto& leftover : scan.results) {
        summary.by_status[leftover.status]++;
    }

    summary.top = scan.results;
    std::stable_sort(summary.top.begin(), summary.top.end(),
        [](const Leftover& a, const Leftover& b) {
            bool a_ok = a.status >= 200 && a.status < 300;
            bool b_ok = b.status >= 200 && b.status < 300;
            if (a_ok != b_ok) return a_ok;
            if (a.candidate.expected_interesting != b.candidate.expected_interesting) {
                return a.candidate.expected_interesting;
            }
            return a.size > b.size;
        });
    if (summary.top.size() > top_n) summary.top.resize(top_n);
    return summary;
}

void ReportWriter::print_summary(const ScanSummary& summary, std::ostream& out) {
    out << "\n=== Scan Summary: " << summary.target << " ===\n";
    if (summary.cancelled) out << "(scan cancelled, results are partial)\n";
    out << "Leftovers found: " << summary.accepted << "\n";

    if (!summary.by_status.empty()) {
        out << "By status:\n";
        for (const auto& [status, count] : summary.by_status) {
            out << "  " << status << ": " << count << "\n";
        }
    }

    if (!summary.top.empty()) {
        out << "Top findings:\n";
        for (const auto& leftover : summary.top) {
            out << "  [" << leftover.status << "] "
                << std::left << std::setw(9) << logging::format_size(leftover.size)
                << leftover.candidate.url << "\n";
        }
    }
    out << "\n";
}

void ReportWriter::print_metrics(const MetricsSnapshot& metrics, std::ostream& out) {
    out << "=== Metrics ===\n";
    out << "Requests:         " << metrics.requests << "\n";
    out << "Transport errors: " << metrics.transport_errors << "\n";
    out << "Cache hit rate:   " << std::fixed << std::setprecision(1)
        << metrics.cache_hit_rate() * 100.0 << "%\n";
    out << "Baseline rejects: " << metrics.baseline_rejections << "\n";
    out << "Filtered:         " << metrics.filtered << "\n";
    out << "Final workers:    " << metrics.current_workers
        << " (peak " << metrics.peak_workers << ", " << metrics.worker_adjustments << " adjustments)\n";
    out << "Elapsed:          " << std::setprecision(2) << metrics.elapsed_seconds << " s ("
        << std::setprecision(1) << metrics.requests_per_second() << " req/s)\n\n";
}

} // namespace report
