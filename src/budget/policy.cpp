// Implementation of risk budget and policy evaluation

#include "policy.h"
#include "core/scan_config.h"
#include <fstream>
#include <iostream>
#include <iomanip>
#include <regex>
#include <sstream>

namespace budget {

using json = nlohmann::json;

// Get default policy
Policy Policy::get_default() {
    Policy p;
    p.category_scores["credential"] = 10;
    p.category_scores["vcs"] = 8;
    p.category_scores["database"] = 8;
    p.category_scores["config"] = 6;
    p.category_scores["archive"] = 5;
    p.category_scores["backup"] = 5;
    p.category_scores["source"] = 4;
    p.category_scores["log"] = 3;
    p.category_scores["editor"] = 3;
    p.category_scores["build"] = 2;
    p.category_scores["document"] = 1;
    p.category_scores["generic"] = 1;
    return p;
}

int Policy::score_for(const std::string& category) const {
    auto it = category_scores.find(category);
    return it != category_scores.end() ? it->second : default_score;
}

// Flat YAML: "key: value" lines, category scores under a "category_scores:" block
static void parse_flat_yaml(const std::string& content, Policy& p) {
    static const std::regex kv_rx(R"(^(\s*)([A-Za-z_][A-Za-z0-9_]*)\s*:\s*(-?\d+)?\s*(#.*)?$)");
    std::istringstream in(content);
    std::string line;
    bool in_scores = false;

    while (std::getline(in, line)) {
        std::smatch m;
        if (!std::regex_match(line, m, kv_rx)) continue;
        bool indented = !m[1].str().empty();
        const std::string key = m[2].str();

        if (!m[3].matched) {
            in_scores = key == "category_scores";
            continue;
        }
        int value = 0;
        try {
            value = std::stoi(m[3].str());
        } catch (const std::out_of_range&) {
            throw ConfigError("policy value out of range for " + key);
        }

        if (indented && in_scores) {
            p.category_scores[key] = value;
            continue;
        }
        in_scores = false;
        if (key == "warn_threshold") p.warn_threshold = value;
        else if (key == "block_threshold") p.block_threshold = value;
        else if (key == "default_score") p.default_score = value;
    }
}

// Load policy from file (supports both YAML and JSON)
Policy Policy::load(const std::string& policy_path) {
    std::ifstream in(policy_path);
    if (!in.is_open()) {
        throw ConfigError("cannot open policy file: " + policy_path);
    }

    // Read entire file
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());

    Policy p = get_default();

    // JSON first, flat YAML otherwise
    json j = json::parse(content, nullptr, false);
    if (j.is_discarded()) {
        parse_flat_yaml(content, p);
    } else {
        try {
            if (j.contains("category_scores")) {
                for (auto& [key, value] : j["category_scores"].items()) {
                    p.category_scores[key] = value.get<int>();
                }
            }
            p.default_score = j.value("default_score", p.default_score);
            p.warn_threshold = j.value("warn_threshold", p.warn_threshold);
            p.block_threshold = j.value("block_threshold", p.block_threshold);
        } catch (const json::exception& e) {
            throw ConfigError("invalid policy file " + policy_path + ": " + e.what());
        }
    }

    if (p.block_threshold < p.warn_threshold) {
        throw ConfigError("policy block_threshold is below warn_threshold");
    }
    return p;
}

// Constructor
BudgetEvaluator::BudgetEvaluator(const Policy& policy)
    : policy_(policy) {}

std::vector<json> BudgetEvaluator::findings_from_report(const json& doc) {
    std::vector<json> findings;
    if (!doc.is_object() || !doc.contains("scans") || !doc["scans"].is_array()) {
        return findings;
    }
    for (const auto& scan : doc["scans"]) {
        if (!scan.contains("results")) continue;
        for (const auto& r : scan["results"]) findings.push_back(r);
    }
    return findings;
}

// Evaluate from a report document or an audit log
BudgetResult BudgetEvaluator::evaluate(const std::string& path) const {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open " + path);
    }

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());

    json doc = json::parse(content, nullptr, false);
    if (!doc.is_discarded() && doc.is_object() && doc.contains("scans")) {
        return evaluate_findings(findings_from_report(doc));
    }

    std::vector<json> findings;
    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.empty()) continue;

        try {
            json entry = json::parse(line);
            if (entry.value("event_type", "") == "leftover_recorded" && entry.contains("payload")) {
                findings.push_back(entry["payload"]);
            }
        } catch (const json::exception& e) {
            std::cerr << "Warning: Failed to parse log line: " << e.what() << "\n";
        }
    }

    return evaluate_findings(findings);
}

// Evaluate from findings
BudgetResult BudgetEvaluator::evaluate_findings(const std::vector<json>& findings) const {
    BudgetResult result;
    result.findings = findings.size();

    for (const auto& finding : findings) {
        std::string category = finding.is_object() ? finding.value("category", "generic") : "generic";
        int score = policy_.score_for(category);

        result.category_counts[category]++;
        result.category_scores[category] += score;
        result.total_score += score;
    }

    // Check thresholds
    result.exceeds_warn = result.total_score >= policy_.warn_threshold;
    result.exceeds_block = result.total_score >= policy_.block_threshold;

    return result;
}

// Print report
void BudgetEvaluator::print_report(const BudgetResult& result, std::ostream& out) {
    out << "\n=== Risk Budget Report ===\n\n";

    out << "Leftovers by Category:\n";
    for (const auto& [category, count] : result.category_counts) {
        int score = result.category_scores.count(category)
            ? result.category_scores.at(category) : 0;
        out << "  " << std::left << std::setw(16) << category
            << " Count: " << std::setw(4) << count
            << " Score: " << score << "\n";
    }

    out << "\n";
    out << "Total Score: " << result.total_score << "\n";
    out << "Status: " << result.status_string() << "\n";

    if (result.exceeds_block) {
        out << "\n   BLOCKED: Risk score exceeds threshold\n";
    } else if (result.exceeds_warn) {
        out << "\n   WARNING: Risk score approaching threshold\n";
    } else {
        out << "\n   PASS: Risk within acceptable limits\n";
    }

    out << "\n";
}

} // namespace budget
