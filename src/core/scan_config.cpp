// Scan configuration loading and validation

#include "scan_config.h"
#include "url_utils.h"
#include <chrono>
#include <ctime>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

std::vector<int> ScanConfig::default_years() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    int year = tm.tm_year + 1900;
    return {year, year - 1, year - 2};
}

void ScanConfig::validate() const {
    if (targets.empty()) {
        throw ConfigError("no target given (use -u URL or -l FILE)");
    }
    for (const auto& t : targets) {
        TargetUrl parsed;
        if (!parse_target_url(t, parsed)) {
            throw ConfigError("malformed target URL: " + t);
        }
    }
    if (level < 0 || level > Catalog::kMaxLevel) {
        throw ConfigError("scan level must be between 0 and 4, got " + std::to_string(level));
    }
    if (threads_explicit && adaptive) {
        throw ConfigError("--threads and --adaptive are mutually exclusive");
    }
    if (verbose && silent) {
        throw ConfigError("--verbose and --silent are mutually exclusive");
    }
    if (threads < 1) {
        throw ConfigError("thread count must be at least 1");
    }
    if (max_threads < 1) {
        throw ConfigError("--max-threads must be at least 1");
    }
    if (max_size != 0 && min_size > max_size) {
        throw ConfigError("--min-size (" + std::to_string(min_size) +
                          ") is larger than --max-size (" + std::to_string(max_size) + ")");
    }
    if (timeout_seconds <= 0) {
        throw ConfigError("timeout must be positive");
    }
    if (rate_limit < 0.0) {
        throw ConfigError("rate limit must be positive");
    }
    if (delay_ms < 0) {
        throw ConfigError("delay must not be negative");
    }
    if (!skip_baseline && baseline_probes < 1) {
        throw ConfigError("baseline needs at least one probe");
    }
    if (baseline_consensus <= 0.0 || baseline_consensus > 1.0) {
        throw ConfigError("baseline consensus must be in (0, 1]");
    }
    if (cache_capacity < 1) {
        throw ConfigError("cache capacity must be at least 1");
    }
    if (hash_window == 0 || large_file_threshold == 0) {
        throw ConfigError("hash window and large-file threshold must be positive");
    }
}

/// Read an int field without silently narrowing a larger JSON number.
static int int_value(const json& j, const char* key, int fallback) {
    if (!j.contains(key)) return fallback;
    long long v = j[key].get<long long>();
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw ConfigError(std::string("configuration value out of range: ") + key);
    }
    return static_cast<int>(v);
}

void ScanConfig::apply_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }
    try {
        if (j.contains("targets")) targets = j["targets"].get<std::vector<std::string>>();
        level = int_value(j, "level", level);
        brute_force = j.value("brute_force", brute_force);
        recursive = j.value("recursive", recursive);
        domain_wordlist = j.value("domain_wordlist", domain_wordlist);
        test_index = j.value("test_index", test_index);
        if (j.contains("language")) {
            std::string lang = j["language"].get<std::string>();
            if (!parse_language(lang, language)) {
                throw ConfigError("unknown language: " + lang);
            }
        }
        if (j.contains("extensions")) extensions = j["extensions"].get<std::vector<std::string>>();
        if (j.contains("wordlist")) wordlist = read_list_file(j["wordlist"].get<std::string>());
        if (j.contains("date_stamp_years")) date_stamp_years = j["date_stamp_years"].get<std::vector<int>>();

        if (j.contains("threads")) {
            threads = int_value(j, "threads", threads);
            threads_explicit = true;
        }
        adaptive = j.value("adaptive", adaptive);
        max_threads = int_value(j, "max_threads", max_threads);
        rate_limit = j.value("rate_limit", rate_limit);
        delay_ms = j.value("delay_ms", delay_ms);

        timeout_seconds = j.value("timeout", timeout_seconds);
        verify_tls = j.value("verify_tls", verify_tls);
        if (j.contains("headers")) {
            for (auto& [k, v] : j["headers"].items()) headers[k] = v.get<std::string>();
        }
        cookie = j.value("cookie", cookie);
        user_agent = j.value("user_agent", user_agent);
        rotate_user_agent = j.value("rotate_user_agent", rotate_user_agent);
        large_file_threshold = j.value("large_file_threshold", large_file_threshold);
        hash_window = j.value("hash_window", hash_window);
        sample_bytes = j.value("sample_bytes", sample_bytes);

        if (j.contains("content_type_ignore")) {
            content_type_ignore = j["content_type_ignore"].get<std::vector<std::string>>();
        }
        if (j.contains("status")) {
            auto codes = j["status"].get<std::vector<long>>();
            status_allow = std::set<long>(codes.begin(), codes.end());
        }
        if (j.contains("status_ignore")) {
            auto codes = j["status_ignore"].get<std::vector<long>>();
            status_ignore = std::set<long>(codes.begin(), codes.end());
        }
        min_size = j.value("min_size", min_size);
        max_size = j.value("max_size", max_size);
        strict_auth = j.value("strict_auth", strict_auth);
        skip_baseline = j.value("no_baseline", skip_baseline);
        baseline_probes = int_value(j, "baseline_probes", baseline_probes);
        baseline_consensus = j.value("baseline_consensus", baseline_consensus);
        cache_capacity = j.value("cache_capacity", cache_capacity);

        output_path = j.value("output", output_path);
        output_dir = j.value("output_per_url", output_dir);
        audit_log_path = j.value("audit_log", audit_log_path);
        policy_path = j.value("policy", policy_path);
        metrics = j.value("metrics", metrics);
        verbose = j.value("verbose", verbose);
        silent = j.value("silent", silent);
        color = j.value("color", color);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }
}

ScanConfig ScanConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("cannot parse config file " + path + ": " + e.what());
    }
    ScanConfig cfg;
    cfg.apply_json(j);
    return cfg;
}

std::vector<std::string> ScanConfig::read_list_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot read list file: " + path);
    }
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) {
        size_t b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos) continue;
        size_t e = line.find_last_not_of(" \t\r");
        std::string item = line.substr(b, e - b + 1);
        if (item[0] == '#') continue;
        out.push_back(item);
    }
    return out;
}

std::pair<std::string, std::string> ScanConfig::parse_header(const std::string& line) {
    auto pos = line.find(':');
    if (pos == std::string::npos || pos == 0) {
        throw ConfigError("malformed header, expected 'Name: Value': " + line);
    }
    std::string name = line.substr(0, pos);
    std::string value = line.substr(pos + 1);
    size_t vb = value.find_first_not_of(" \t");
    value = vb == std::string::npos ? "" : value.substr(vb);
    while (!name.empty() && (name.back() == ' ' || name.back() == '\t')) name.pop_back();
    if (name.empty()) {
        throw ConfigError("malformed header, empty name: " + line);
    }
    return {name, value};
}

std::set<long> ScanConfig::parse_status_list(const std::string& list) {
    std::set<long> out;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        long code = 0;
        try {
            size_t used = 0;
            code = std::stol(item, &used);
            if (used != item.size()) throw std::invalid_argument(item);
        } catch (const std::exception&) {
            throw ConfigError("invalid status code: " + item);
        }
        if (code < 100 || code > 599) {
            throw ConfigError("status code out of range: " + item);
        }
        out.insert(code);
    }
    if (out.empty()) {
        throw ConfigError("empty status list");
    }
    return out;
}

json ScanConfig::to_json() const {
    json j;
    j["level"] = level;
    j["brute_force"] = brute_force;
    j["recursive"] = recursive;
    j["domain_wordlist"] = domain_wordlist;
    j["test_index"] = test_index;
    j["language"] = language_name(language);
    j["threads"] = threads;
    j["adaptive"] = adaptive;
    j["max_threads"] = max_threads;
    j["rate_limit"] = rate_limit;
    j["delay_ms"] = delay_ms;
    j["timeout"] = timeout_seconds;
    j["verify_tls"] = verify_tls;
    j["status"] = std::vector<long>(status_allow.begin(), status_allow.end());
    j["status_ignore"] = std::vector<long>(status_ignore.begin(), status_ignore.end());
    j["min_size"] = min_size;
    j["max_size"] = max_size;
    j["strict_auth"] = strict_auth;
    j["no_baseline"] = skip_baseline;
    return j;
}
