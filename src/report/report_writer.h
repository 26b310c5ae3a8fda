#pragma once
#include <iosfwd>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <schema/leftover.h>
#include "core/scan_orchestrator.h"

namespace report {

/**
 * @brief Totals for the end-of-scan summary
 */
struct ScanSummary {
    std::string target;
    size_t accepted = 0;
    std::map<long, size_t> by_status;
    std::vector<Leftover> top;     // most relevant first: 2xx before others, larger first
    bool cancelled = false;
};

/**
 * @brief Turns scan reports into JSON documents and console summaries
 *
 * A run produces one document with every scanned target under "scans".
 * With --output-per-url each target additionally gets its own file, named
 * after the host and path so repeated runs against the same target
 * overwrite the previous result.
 */
class ReportWriter {
public:
    static constexpr const char* kTool = "residue";
    static constexpr const char* kVersion = "1.0.0";

    /// One result as it appears in the "results" array.
    static nlohmann::json leftover_to_json(const Leftover& leftover);

    /**
     * @brief Serialise one scan
     * @param scan Finished scan
     * @param include_metrics Add the "metrics" object
     * @return JSON object with target, timestamp, level, baseline and results
     */
    static nlohmann::json scan_to_json(const ScanReport& scan, bool include_metrics);

    /**
     * @brief Build the run document {"tool","version","generated_at","scans":[...]}
     */
    static nlohmann::json document(const std::vector<ScanReport>& scans, bool include_metrics);

    /**
     * @brief Write the run document to a file
     * @param scans Finished scans
     * @param output_path Destination, parent directories are created
     * @param include_metrics Add metrics to each scan
     * @return true if the file was written
     */
    static bool write_document(const std::vector<ScanReport>& scans,
                               const std::string& output_path,
                               bool include_metrics);

    /**
     * @brief Write one scan into its own file under a directory
     * @return Path of the written file, empty on failure
     */
    static std::string write_per_url(const ScanReport& scan,
                                     const std::string& output_dir,
                                     bool include_metrics);

    /**
     * @brief File name for a target, e.g. "example.com_app_v1.json"
     *
     * Scheme is dropped, the port is kept, and every character outside
     * [A-Za-z0-9.-] becomes '_'.
     */
    static std::string per_url_filename(const std::string& target);

    /// Aggregate a scan for the console summary.
    static ScanSummary summarize(const ScanReport& scan, size_t top_n = 10);

    /// Print the summary block.
    static void print_summary(const ScanSummary& summary, std::ostream& out);

    /// Print the metrics block shown with --metrics.
    static void print_metrics(const MetricsSnapshot& metrics, std::ostream& out);
};

} // namespace report
