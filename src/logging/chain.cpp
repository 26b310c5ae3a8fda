/**
 * @file chain.cpp
 * @brief Hash-chained JSONL audit trail
 */

#include "chain.h"
#include <openssl/sha.h>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace logging {

using json = nlohmann::json;

static const char* kGenesis = "sha256:genesis";

json LogEntry::to_json() const {
    json j;
    j["event_type"] = event_type;
    j["run_id"] = run_id;
    j["timestamp"] = timestamp;
    j["prev_hash"] = prev_hash;
    j["entry_hash"] = entry_hash;
    j["payload"] = payload;
    return j;
}

LogEntry LogEntry::from_json(const json& j) {
    LogEntry entry;
    entry.event_type = j.value("event_type", "");
    entry.run_id = j.value("run_id", "");
    entry.timestamp = j.value("timestamp", "");
    entry.prev_hash = j.value("prev_hash", "");
    entry.entry_hash = j.value("entry_hash", "");
    entry.payload = j.value("payload", json::object());
    return entry;
}

ChainLogger::ChainLogger(const std::string& log_path, const std::string& run_id)
    : log_path_(log_path), run_id_(run_id) {
    // Continue an existing chain
    if (std::ifstream existing(log_path); existing.good()) {
        auto entries = load(log_path);
        if (!entries.empty()) last_hash_ = entries.back().entry_hash;
    }

    log_stream_.open(log_path_, std::ios::app);
    if (!log_stream_.is_open()) {
        throw std::runtime_error("cannot open audit log: " + log_path_);
    }
}

std::string ChainLogger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string ChainLogger::new_run_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::ostringstream oss;
    oss << "run-" << std::hex << std::setw(16) << std::setfill('0') << gen();
    return oss.str();
}

// prev_hash + timestamp + event_type + run_id + compact payload (keys sorted by nlohmann)
std::string ChainLogger::compute_hash(const LogEntry& entry) {
    std::ostringstream canonical;
    canonical << entry.prev_hash;
    canonical << entry.timestamp;
    canonical << entry.event_type;
    canonical << entry.run_id;
    canonical << entry.payload.dump(-1, ' ', false, json::error_handler_t::replace);

    const std::string data = canonical.str();
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::ostringstream hex;
    hex << "sha256:";
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return hex.str();
}

bool ChainLogger::append(const std::string& event_type, const json& payload) {
    std::lock_guard<std::mutex> lock(mu_);

    LogEntry entry;
    entry.event_type = event_type;
    entry.run_id = run_id_;
    entry.timestamp = get_timestamp();
    entry.prev_hash = last_hash_.empty() ? kGenesis : last_hash_;
    entry.payload = payload;
    entry.entry_hash = compute_hash(entry);

    // Same replacement as compute_hash, so reloaded entries hash identically
    log_stream_ << entry.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    log_stream_.flush();
    if (!log_stream_.good()) return false;

    last_hash_ = entry.entry_hash;
    return true;
}

std::string ChainLogger::last_hash() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_hash_;
}

std::vector<LogEntry> ChainLogger::load(const std::string& log_path) {
    std::vector<LogEntry> entries;
    std::ifstream in(log_path);
    if (!in.is_open()) return entries;

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        try {
            entries.push_back(LogEntry::from_json(json::parse(line)));
        } catch (const json::exception& e) {
            std::cerr << "Failed to parse log entry: " << e.what() << "\n";
        }
    }
    return entries;
}

VerifyReport ChainLogger::verify(const std::string& log_path) {
    VerifyReport report;

    // Unlike load(), a line that does not parse is a failure: it may be a
    // truncated or overwritten entry
    std::vector<LogEntry> entries;
    std::ifstream in(log_path);
    std::string line;
    size_t line_no = 0;
    while (in.is_open() && std::getline(in, line)) {
        line_no++;
        if (line.empty()) continue;
        try {
            entries.push_back(LogEntry::from_json(json::parse(line)));
        } catch (const json::exception& e) {
            report.ok = false;
            report.entries = entries.size();
            report.bad_index = entries.size();
            report.reason = "unparseable entry on line " + std::to_string(line_no) + ": " + e.what();
            return report;
        }
    }
    report.entries = entries.size();

    for (size_t i = 0; i < entries.size(); i++) {
        const auto& entry = entries[i];
        const std::string expected_prev = i == 0 ? kGenesis : entries[i - 1].entry_hash;

        if (entry.prev_hash != expected_prev) {
            report.ok = false;
            report.bad_index = i;
            report.reason = "chain break: prev_hash " + entry.prev_hash +
                            " does not match " + expected_prev;
            return report;
        }
        std::string computed = compute_hash(entry);
        if (computed != entry.entry_hash) {
            report.ok = false;
            report.bad_index = i;
            report.reason = "hash mismatch on " + entry.event_type + " entry: stored " +
                            entry.entry_hash + ", computed " + computed;
            return report;
        }
    }
    return report;
}

} // namespace logging
