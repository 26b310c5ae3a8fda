#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <fstream>
#include <nlohmann/json.hpp>

namespace logging {

// Hash-chained audit trail for scans.
// Every JSONL entry carries the hash of the entry before it, so editing,
// reordering or deleting lines breaks the chain and is caught by verify().

struct LogEntry {
    std::string event_type;
    std::string run_id;
    std::string timestamp;
    std::string prev_hash;
    std::string entry_hash;
    nlohmann::json payload;

    nlohmann::json to_json() const;
    static LogEntry from_json(const nlohmann::json& j);
};

struct VerifyReport {
    bool ok = true;
    size_t entries = 0;
    size_t bad_index = 0;      // first failing entry when !ok
    std::string reason;
};

class ChainLogger {
public:
    /**
     * @brief Open (or continue) an audit log
     * @param log_path JSONL file, created if missing
     * @param run_id Identifier stamped on every entry of this run
     * @throws std::runtime_error if the file cannot be opened for appending
     */
    ChainLogger(const std::string& log_path, const std::string& run_id);

    /**
     * @brief Append an event, chaining it to the previous entry
     * @param event_type scan_started, baseline_established, leftover_recorded, ...
     * @param payload Event data
     * @return true if the line was written and flushed
     */
    bool append(const std::string& event_type, const nlohmann::json& payload);

    /// Hash of the most recent entry, empty before the first append.
    std::string last_hash() const;

    const std::string& run_id() const { return run_id_; }

    /**
     * @brief Recompute the chain of a log file
     * @param log_path File to check
     * @return Report naming the first broken entry, if any
     */
    static VerifyReport verify(const std::string& log_path);

    /**
     * @brief Read all entries; unparseable lines are skipped with a warning
     */
    static std::vector<LogEntry> load(const std::string& log_path);

    /// Hash of an entry's canonical form ("sha256:<hex>").
    static std::string compute_hash(const LogEntry& entry);

    /// Random run identifier.
    static std::string new_run_id();

private:
    std::string log_path_;
    std::string run_id_;
    std::string last_hash_;
    std::ofstream log_stream_;
    mutable std::mutex mu_;

    static std::string get_timestamp();
};

} // namespace logging
