/**
 * @file test_chain.cpp
 * @brief Unit tests for the hash-chained audit log
 *
 * Tests the append-only logger that chains scan events together with hashes.
 * Verifies that tampering, reordering and deletion are detected and that the
 * chain continues correctly across multiple logger instances.
 */

#include <catch2/catch.hpp>
#include "logging/chain.h"
#include <filesystem>
#include <fstream>

using namespace logging;
namespace fs = std::filesystem;

static std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

static void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream out(path, std::ios::trunc);
    for (const auto& l : lines) out << l << "\n";
}

static void record_scan(const std::string& path, const std::string& run_id) {
    ChainLogger logger(path, run_id);
    REQUIRE(logger.append("scan_started", {{"target", "http://example.com/"}, {"level", 2}}));
    REQUIRE(logger.append("baseline_established", {{"signature", "hash"}, {"status", 404}}));
    REQUIRE(logger.append("leftover_recorded", {{"url", "http://example.com/.env"}, {"status", 200},
                                                 {"category", "credential"}}));
    REQUIRE(logger.append("scan_completed", {{"accepted", 1}}));
}

TEST_CASE("ChainLogger creates valid log entries", "[chain]") {
    std::string test_log = "test_audit_log.jsonl";

    // Clean up any existing test file
    if (fs::exists(test_log)) {
        fs::remove(test_log);
    }

    SECTION("Basic append and verify") {
        {
            ChainLogger logger(test_log, "test_run_1");
            REQUIRE(logger.last_hash().empty());
            REQUIRE(logger.append("scan_started", {{"target", "http://example.com/"}}));
            REQUIRE(logger.append("scan_completed", {{"accepted", 0}}));
            REQUIRE(!logger.last_hash().empty());
        }

        auto report = ChainLogger::verify(test_log);
        REQUIRE(report.ok);
        REQUIRE(report.entries == 2);

        auto entries = ChainLogger::load(test_log);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].event_type == "scan_started");
        REQUIRE(entries[0].run_id == "test_run_1");
        REQUIRE(entries[0].prev_hash == "sha256:genesis");
        REQUIRE(entries[1].prev_hash == entries[0].entry_hash);
        REQUIRE(entries[1].entry_hash == ChainLogger::compute_hash(entries[1]));
    }

    SECTION("Chain continuation") {
        record_scan(test_log, "run1");
        std::string last_hash1 = ChainLogger::load(test_log).back().entry_hash;

        // Second logger continues the chain
        {
            ChainLogger logger2(test_log, "run2");
            REQUIRE(logger2.last_hash() == last_hash1);
            logger2.append("scan_started", {{"target", "http://example.org/"}});
        }

        REQUIRE(ChainLogger::verify(test_log).ok);

        auto entries = ChainLogger::load(test_log);
        REQUIRE(entries.size() == 5);
        REQUIRE(entries[4].prev_hash == last_hash1);
        REQUIRE(entries[4].run_id == "run2");
    }

    SECTION("Payload tampering") {
        record_scan(test_log, "run");
        REQUIRE(ChainLogger::verify(test_log).ok);

        auto lines = read_lines(test_log);
        auto j = nlohmann::json::parse(lines[2]);
        j["payload"]["status"] = 404; // Tamper!
        lines[2] = j.dump();
        write_lines(test_log, lines);

        auto report = ChainLogger::verify(test_log);
        REQUIRE_FALSE(report.ok);
        REQUIRE(report.bad_index == 2);
        REQUIRE(report.reason.find("hash mismatch") != std::string::npos);
    }

    SECTION("Deleted entry") {
        record_scan(test_log, "run");
        auto lines = read_lines(test_log);
        lines.erase(lines.begin() + 1);
        write_lines(test_log, lines);

        auto report = ChainLogger::verify(test_log);
        REQUIRE_FALSE(report.ok);
        REQUIRE(report.bad_index == 1);
        REQUIRE(report.reason.find("chain break") != std::string::npos);
    }

    SECTION("Reordered entries") {
        record_scan(test_log, "run");
        auto lines = read_lines(test_log);
        std::swap(lines[1], lines[2]);
        write_lines(test_log, lines);

        REQUIRE_FALSE(ChainLogger::verify(test_log).ok);
    }

    SECTION("Recomputing a tampered hash still breaks the next link") {
        record_scan(test_log, "run");
        auto lines = read_lines(test_log);
        auto entry = LogEntry::from_json(nlohmann::json::parse(lines[1]));
        entry.payload["signature"] = "size";
        entry.entry_hash = ChainLogger::compute_hash(entry);
        lines[1] = entry.to_json().dump();
        write_lines(test_log, lines);

        auto report = ChainLogger::verify(test_log);
        REQUIRE_FALSE(report.ok);
        REQUIRE(report.bad_index == 2);
    }

    SECTION("Truncated last line fails verification") {
        record_scan(test_log, "run");
        auto lines = read_lines(test_log);
        lines.back() = lines.back().substr(0, lines.back().size() / 2);
        write_lines(test_log, lines);

        auto report = ChainLogger::verify(test_log);
        REQUIRE_FALSE(report.ok);
        REQUIRE(report.bad_index == 3);
        REQUIRE(report.reason.find("unparseable") != std::string::npos);
    }

    SECTION("Non-UTF-8 payload bytes are written and still verify") {
        {
            ChainLogger logger(test_log, "run");
            REQUIRE(logger.append("leftover_recorded", {{"url", "http://example.com/a.bak"},
                                                         {"content_type", "text/plain; charset=\xff\xfe"}}));
            REQUIRE(logger.append("scan_completed", {{"accepted", 1}}));
        }

        auto report = ChainLogger::verify(test_log);
        REQUIRE(report.ok);
        REQUIRE(report.entries == 2);
    }

    SECTION("Empty or missing log verifies trivially") {
        auto report = ChainLogger::verify(test_log);
        REQUIRE(report.ok);
        REQUIRE(report.entries == 0);
    }

    // Cleanup
    if (fs::exists(test_log)) {
        fs::remove(test_log);
    }
}

TEST_CASE("LogEntry JSON serialization", "[chain]") {
    LogEntry entry;
    entry.event_type = "leftover_recorded";
    entry.run_id = "run123";
    entry.timestamp = "2025-01-01T00:00:00.000Z";
    entry.prev_hash = "sha256:prev";
    entry.entry_hash = "sha256:current";
    entry.payload = nlohmann::json::object();
    entry.payload["url"] = "http://example.com/backup.zip";

    SECTION("to_json and from_json roundtrip") {
        auto json = entry.to_json();
        auto restored = LogEntry::from_json(json);

        REQUIRE(restored.event_type == entry.event_type);
        REQUIRE(restored.run_id == entry.run_id);
        REQUIRE(restored.timestamp == entry.timestamp);
        REQUIRE(restored.prev_hash == entry.prev_hash);
        REQUIRE(restored.entry_hash == entry.entry_hash);
        REQUIRE(restored.payload == entry.payload);
    }

    SECTION("Hash depends on every chained field") {
        std::string base = ChainLogger::compute_hash(entry);
        REQUIRE(base.rfind("sha256:", 0) == 0);
        REQUIRE(base.size() == 7 + 64);

        LogEntry other = entry;
        other.run_id = "run124";
        REQUIRE(ChainLogger::compute_hash(other) != base);

        other = entry;
        other.prev_hash = "sha256:other";
        REQUIRE(ChainLogger::compute_hash(other) != base);

        // The stored entry hash itself is not part of the input
        other = entry;
        other.entry_hash = "sha256:whatever";
        REQUIRE(ChainLogger::compute_hash(other) == base);
    }

    SECTION("Run ids are distinct") {
        REQUIRE(ChainLogger::new_run_id() != ChainLogger::new_run_id());
        REQUIRE(ChainLogger::new_run_id().rfind("run-", 0) == 0);
    }
}
