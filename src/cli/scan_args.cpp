// Command-line parsing for the scan subcommand

#include "scan_args.h"
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace cli {

std::vector<std::string> split_list(const std::string& list) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= list.size()) {
        size_t end = list.find(',', start);
        if (end == std::string::npos) end = list.size();
        std::string item = list.substr(start, end - start);
        item.erase(0, item.find_first_not_of(" \t"));
        auto last = item.find_last_not_of(" \t");
        item.erase(last == std::string::npos ? 0 : last + 1);
        if (!item.empty()) out.push_back(item);
        start = end + 1;
    }
    return out;
}

const char* scan_usage() {
    return
        "Usage: residue scan (-u URL | -l FILE) [options]\n"
        "\n"
        "Targets:\n"
        "  -u, --url URL               Target URL (repeatable)\n"
        "  -l, --list FILE             File with one target URL per line\n"
        "\n"
        "Candidates:\n"
        "  -L, --level 0-4             Scan depth (default 2)\n"
        "  -b, --brute                 Keyword x extension brute force\n"
        "  -r, --recursive             Also scan parent directories\n"
        "  -d, --domain-wordlist       Add tokens derived from the domain\n"
        "      --test-index            Probe index.<ext> variants\n"
        "      --lang en|pt-br|all     Keyword language (default all)\n"
        "  -e, --extensions a,b,c      Replace the level extension set\n"
        "  -w, --wordlist FILE         Replace the level keywords\n"
        "\n"
        "Concurrency:\n"
        "      --threads N             Fixed worker count (default 10)\n"
        "      --adaptive              Resize the pool from observed latency\n"
        "      --max-threads N         Adaptive upper bound (default 50)\n"
        "      --rate-limit RPS        Global request rate cap\n"
        "      --delay MS              Per-worker gap between requests\n"
        "\n"
        "HTTP:\n"
        "  -t, --timeout SEC           Per-request timeout (default 5)\n"
        "  -k, --no-tls-verify         Skip certificate verification\n"
        "  -H, --header 'Name: Value'  Extra header (repeatable)\n"
        "  -c, --cookie STRING         Cookie header\n"
        "  -a, --user-agent STRING     Fixed User-Agent\n"
        "      --rotate-agent          Rotate over built-in User-Agents\n"
        "\n"
        "Filtering:\n"
        "  -ci, --content-ignore TYPE  Drop a content type (repeatable)\n"
        "  -sc, --status LIST          Only report these status codes\n"
        "      --min-size BYTES        Drop smaller responses\n"
        "      --max-size BYTES        Drop larger responses\n"
        "      --strict-auth           Extra 401/403 error-page checks\n"
        "      --no-baseline           Skip not-found fingerprinting\n"
        "\n"
        "Output:\n"
        "      --config FILE           JSON configuration file\n"
        "  -o, --output FILE           JSON report for the whole run\n"
        "      --output-per-url DIR    One JSON report per target\n"
        "      --metrics               Include scan metrics\n"
        "      --audit-log FILE        Hash-chained JSONL audit trail\n"
        "      --policy FILE           Gate the exit code on a risk budget\n"
        "  -v, --verbose               Progress and debug output\n"
        "  -s, --silent                Results only\n"
        "      --no-color              Plain output\n";
}

static long parse_long(const std::string& flag, const std::string& value) {
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || errno == ERANGE) {
        throw ConfigError(flag + " expects an integer, got '" + value + "'");
    }
    return v;
}

static int parse_int(const std::string& flag, const std::string& value) {
    long v = parse_long(flag, value);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
        throw ConfigError(flag + " is out of range: " + value);
    }
    return static_cast<int>(v);
}

static size_t parse_size(const std::string& flag, const std::string& value) {
    long v = parse_long(flag, value);
    if (v < 0) throw ConfigError(flag + " must not be negative");
    return static_cast<size_t>(v);
}

static double parse_double(const std::string& flag, const std::string& value) {
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(value.c_str(), &end);
    if (value.empty() || *end != '\0' || errno == ERANGE) {
        throw ConfigError(flag + " expects a number, got '" + value + "'");
    }
    return v;
}

ScanConfig parse_scan_args(const std::vector<std::string>& args) {
    ScanConfig config;

    // Config file first so the remaining flags win
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) throw ConfigError("--config requires a value");
            config = ScanConfig::load(args[i + 1]);
            break;
        }
    }

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw ConfigError(a + " requires a value");
            return args[++i];
        };

        if (a == "-u" || a == "--url") {
            config.targets.push_back(value());
        } else if (a == "-l" || a == "--list") {
            for (auto& t : ScanConfig::read_list_file(value())) config.targets.push_back(t);
        } else if (a == "-L" || a == "--level") {
            config.level = parse_int(a, value());
        } else if (a == "-b" || a == "--brute") {
            config.brute_force = true;
        } else if (a == "-r" || a == "--recursive") {
            config.recursive = true;
        } else if (a == "-d" || a == "--domain-wordlist") {
            config.domain_wordlist = true;
        } else if (a == "--test-index") {
            config.test_index = true;
        } else if (a == "--lang") {
            const std::string& name = value();
            if (!parse_language(name, config.language)) {
                throw ConfigError("unknown language '" + name + "' (en, pt-br, all)");
            }
        } else if (a == "-e" || a == "--extensions") {
            config.extensions = split_list(value());
            if (config.extensions.empty()) throw ConfigError(a + " needs at least one extension");
        } else if (a == "-w" || a == "--wordlist") {
            config.wordlist = ScanConfig::read_list_file(value());
            if (config.wordlist.empty()) throw ConfigError("wordlist is empty");
        } else if (a == "--threads") {
            config.threads = parse_int(a, value());
            config.threads_explicit = true;
        } else if (a == "--adaptive") {
            config.adaptive = true;
        } else if (a == "--max-threads") {
            config.max_threads = parse_int(a, value());
        } else if (a == "--rate-limit") {
            config.rate_limit = parse_double(a, value());
            if (config.rate_limit <= 0.0) throw ConfigError("--rate-limit must be positive");
        } else if (a == "--delay") {
            config.delay_ms = parse_long(a, value());
        } else if (a == "-t" || a == "--timeout") {
            config.timeout_seconds = parse_long(a, value());
        } else if (a == "-k" || a == "--no-tls-verify") {
            config.verify_tls = false;
        } else if (a == "-H" || a == "--header") {
            auto header = ScanConfig::parse_header(value());
            config.headers[header.first] = header.second;
        } else if (a == "-c" || a == "--cookie") {
            config.cookie = value();
        } else if (a == "-a" || a == "--user-agent") {
            config.user_agent = value();
        } else if (a == "--rotate-agent") {
            config.rotate_user_agent = true;
        } else if (a == "-ci" || a == "--content-ignore") {
            config.content_type_ignore.push_back(value());
        } else if (a == "-sc" || a == "--status") {
            config.status_allow = ScanConfig::parse_status_list(value());
        } else if (a == "--min-size") {
            config.min_size = parse_size(a, value());
        } else if (a == "--max-size") {
            config.max_size = parse_size(a, value());
        } else if (a == "--strict-auth") {
            config.strict_auth = true;
        } else if (a == "--no-baseline") {
            config.skip_baseline = true;
        } else if (a == "--config") {
            ++i;
        } else if (a == "-o" || a == "--output") {
            config.output_path = value();
        } else if (a == "--output-per-url") {
            config.output_dir = value();
        } else if (a == "--metrics") {
            config.metrics = true;
        } else if (a == "--audit-log") {
            config.audit_log_path = value();
        } else if (a == "--policy") {
            config.policy_path = value();
        } else if (a == "-v" || a == "--verbose") {
            config.verbose = true;
        } else if (a == "-s" || a == "--silent") {
            config.silent = true;
        } else if (a == "--no-color") {
            config.color = false;
        } else {
            throw ConfigError("unknown option: " + a);
        }
    }

    config.validate();
    return config;
}

} // namespace cli
