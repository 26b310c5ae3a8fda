#pragma once
#include <string>
#include <map>
#include <iosfwd>
#include <vector>
#include <nlohmann/json.hpp>

namespace budget {

// Risk budget evaluation for scan results.
// Assigns points to every leftover based on its category and checks the
// total against warning and blocking thresholds, so a CI job can fail when
// a deployment exposes credentials or repository metadata.

struct Policy {
    // Points per leftover category
    std::map<std::string, int> category_scores;

    // Points for categories missing from the table
    int default_score;

    // Thresholds
    int warn_threshold;
    int block_threshold;

    Policy() : default_score(1), warn_threshold(5), block_threshold(15) {}

    /**
     * @brief Load policy from a JSON file, or a flat "key: value" YAML file
     * @param policy_path Path to policy file
     * @return Loaded policy; categories the file does not name keep their defaults
     * @throws ConfigError if the file cannot be read or a value is malformed
     */
    static Policy load(const std::string& policy_path);

    /**
     * @brief Get a default policy with reasonable scores
     * @return Default policy
     */
    static Policy get_default();

    int score_for(const std::string& category) const;
};

struct BudgetResult {
    int total_score = 0;
    size_t findings = 0;
    std::map<std::string, int> category_counts;
    std::map<std::string, int> category_scores;
    bool exceeds_warn = false;
    bool exceeds_block = false;

    enum class Status {
        PASS,
        WARN,
        BLOCK
    };

    Status status() const {
        if (exceeds_block) return Status::BLOCK;
        if (exceeds_warn) return Status::WARN;
        return Status::PASS;
    }

    int exit_code() const {
        switch (status()) {
            case Status::PASS:  return 0;
            case Status::WARN:  return 1;
            case Status::BLOCK: return 2;
        }
        return 0;
    }

    std::string status_string() const {
        switch (status()) {
            case Status::PASS:  return "PASS";
            case Status::WARN:  return "WARN";
            case Status::BLOCK: return "BLOCK";
        }
        return "UNKNOWN";
    }
};

class BudgetEvaluator {
public:
    /**
     * @brief Create an evaluator with a specific policy
     * @param policy Risk policy to use for scoring
     */
    explicit BudgetEvaluator(const Policy& policy);

    /**
     * @brief Evaluate the leftovers recorded in a file
     *
     * Accepts either a JSON scan report (results under "scans") or a JSONL
     * audit log, in which only leftover_recorded entries are counted.
     *
     * @param path Report or audit log
     * @return Evaluation result with scores and status
     * @throws ConfigError if the file cannot be opened
     */
    BudgetResult evaluate(const std::string& path) const;

    /**
     * @brief Evaluate already-parsed result objects
     * @param findings Result objects carrying a "category" key
     * @return Evaluation result with scores and status
     */
    BudgetResult evaluate_findings(const std::vector<nlohmann::json>& findings) const;

    /// Results of every scan in a report document.
    static std::vector<nlohmann::json> findings_from_report(const nlohmann::json& doc);

    /**
     * @brief Print a human-readable budget report
     * @param result Result to print
     * @param out Destination stream
     */
    static void print_report(const BudgetResult& result, std::ostream& out);

    const Policy& policy() const { return policy_; }

private:
    Policy policy_;
};

} // namespace budget
