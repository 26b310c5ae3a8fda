#pragma once
#include "catalog.h"
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Scan configuration.
// One immutable value per run, built from a JSON file and command-line flags,
// validated before any probe is sent and passed by const reference to every
// engine component.

// Invalid or conflicting configuration; reported before probing starts.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct ScanConfig {
    // Targets
    std::vector<std::string> targets;

    // Candidate selection
    int level;
    bool brute_force;
    bool recursive;
    bool domain_wordlist;
    bool test_index;
    Language language;
    std::vector<std::string> extensions;   // replaces the level extension set when non-empty
    std::vector<std::string> wordlist;     // replaces the level keywords when non-empty
    std::vector<int> date_stamp_years;

    // Concurrency and pacing
    int threads;
    bool threads_explicit;
    bool adaptive;
    int max_threads;
    double rate_limit;                     // requests per second, 0 = unlimited
    long delay_ms;                         // per-worker gap between request starts

    // Transport
    long timeout_seconds;
    bool verify_tls;
    std::map<std::string, std::string> headers;
    std::string cookie;
    std::string user_agent;
    bool rotate_user_agent;
    size_t large_file_threshold;
    size_t hash_window;
    size_t sample_bytes;

    // Classification
    std::vector<std::string> content_type_ignore;
    std::set<long> status_allow;           // empty = any status not ignored
    std::set<long> status_ignore;
    size_t min_size;
    size_t max_size;                       // 0 = unbounded
    bool strict_auth;
    bool skip_baseline;
    int baseline_probes;
    double baseline_consensus;
    size_t cache_capacity;

    // Output
    std::string output_path;
    std::string output_dir;
    std::string audit_log_path;
    std::string policy_path;
    bool metrics;
    bool verbose;
    bool silent;
    bool color;

    ScanConfig()
        : level(2),
          brute_force(false),
          recursive(false),
          domain_wordlist(false),
          test_index(false),
          language(Language::ALL),
          date_stamp_years(default_years()),
          threads(10),
          threads_explicit(false),
          adaptive(false),
          max_threads(50),
          rate_limit(0.0),
          delay_ms(0),
          timeout_seconds(5),
          verify_tls(true),
          rotate_user_agent(false),
          large_file_threshold(10 * 1024 * 1024),
          hash_window(64 * 1024),
          sample_bytes(4096),
          status_ignore({404}),
          min_size(0),
          max_size(0),
          strict_auth(false),
          skip_baseline(false),
          baseline_probes(3),
          baseline_consensus(0.6),
          cache_capacity(4096),
          metrics(false),
          verbose(false),
          silent(false),
          color(true)
    {}

    /**
     * @brief Check ranges and flag conflicts
     * @throws ConfigError naming the offending setting
     */
    void validate() const;

    /**
     * @brief Overlay settings from a JSON object onto this config
     * @param j Object with keys named after the fields ("level", "threads", ...)
     * @throws ConfigError on type errors or unknown languages
     */
    void apply_json(const nlohmann::json& j);

    /**
     * @brief Load a JSON configuration file on top of the defaults
     * @param path File path
     * @throws ConfigError if the file is unreadable or malformed
     */
    static ScanConfig load(const std::string& path);

    /**
     * @brief Read a newline-separated list, skipping blanks and '#' comments
     * @throws ConfigError if the file cannot be opened
     */
    static std::vector<std::string> read_list_file(const std::string& path);

    /**
     * @brief Parse "Name: Value" into a header pair
     * @throws ConfigError on a missing colon or empty name
     */
    static std::pair<std::string, std::string> parse_header(const std::string& line);

    /**
     * @brief Parse a comma-separated status list such as "200,403"
     * @throws ConfigError on non-numeric or out-of-range codes
     */
    static std::set<long> parse_status_list(const std::string& list);

    /// Current year and the two before it.
    static std::vector<int> default_years();

    nlohmann::json to_json() const;
};
