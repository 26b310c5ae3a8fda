#include "cli/scan_args.h"
#include "core/http_client.h"
#include "core/probe_executor.h"
#include "core/scan_orchestrator.h"
#include "logging/chain.h"
#include "logging/console.h"
#include "report/report_writer.h"
#include "budget/policy.h"
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

static CancellationToken g_cancel;

extern "C" void handle_sigint(int) {
    g_cancel.cancel();
}

/**
 * @brief Build the HTTP client options for a scan
 * @param config Validated scan configuration
 * @return Client options carrying timeouts, TLS and body limits
 */
static HttpClient::Options client_options(const ScanConfig& config) {
    HttpClient::Options opts;
    opts.timeout_seconds = config.timeout_seconds;
    opts.connect_timeout_seconds = config.timeout_seconds;
    opts.follow_redirects = true;
    opts.verify_tls = config.verify_tls;
    opts.max_retained_bytes = config.hash_window;
    opts.large_file_threshold = config.large_file_threshold;
    return opts;
}

static HttpProbeExecutor::Options executor_options(const ScanConfig& config) {
    HttpProbeExecutor::Options opts;
    opts.headers = config.headers;
    opts.cookie = config.cookie;
    if (!config.user_agent.empty()) opts.user_agents.push_back(config.user_agent);
    opts.rotate_user_agent = config.rotate_user_agent;
    opts.sample_bytes = config.sample_bytes;
    return opts;
}

static logging::Verbosity verbosity_of(const ScanConfig& config) {
    if (config.silent) return logging::Verbosity::SILENT;
    if (config.verbose) return logging::Verbosity::VERBOSE;
    return logging::Verbosity::NORMAL;
}

/// Append to the audit log if one is open; a failed write is reported, not fatal.
static void audit(logging::ChainLogger* logger, logging::Console& console,
                  const std::string& event, const nlohmann::json& payload) {
    if (!logger) return;
    if (!logger->append(event, payload)) {
        console.warn("audit log write failed for " + event);
    }
}

/**
 * @brief Scans every configured target and writes the requested outputs
 * @param argc Argument count from command line
 * @param argv Argument values from command line
 * @return 0 on success, 2 on configuration errors, or the policy gate's code
 */
int run_scan(int argc, char** argv) {
    std::vector<std::string> args(argv + 2, argv + argc);
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        std::cout << cli::scan_usage();
        return args.empty() ? 2 : 0;
    }

    ScanConfig config;
    std::unique_ptr<budget::Policy> policy;
    std::unique_ptr<logging::ChainLogger> logger;
    try {
        config = cli::parse_scan_args(args);
        if (!config.policy_path.empty()) {
            policy = std::make_unique<budget::Policy>(budget::Policy::load(config.policy_path));
        }
        if (!config.audit_log_path.empty()) {
            logger = std::make_unique<logging::ChainLogger>(config.audit_log_path,
                                                            logging::ChainLogger::new_run_id());
        }
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    logging::Console console(verbosity_of(config), config.color);

    std::unique_ptr<HttpClient> client;
    try {
        client = std::make_unique<HttpClient>(client_options(config));
    } catch (const std::runtime_error& e) {
        console.error(e.what());
        return 2;
    }
    HttpProbeExecutor executor(*client, executor_options(config));

    std::signal(SIGINT, handle_sigint);

    std::vector<ScanReport> reports;
    for (const auto& target : config.targets) {
        if (g_cancel.cancelled()) break;

        console.info("Target: " + target + " (level " + std::to_string(config.level) + ")");
        nlohmann::json started;
        started["target"] = target;
        started["config"] = config.to_json();
        audit(logger.get(), console, "scan_started", started);

        ScanOrchestrator orchestrator(config, executor, g_cancel);
        orchestrator.on_baseline([&](const Baseline& b, BaselineState state) {
            nlohmann::json payload;
            payload["target"] = target;
            payload["state"] = baseline_state_name(state);
            if (state == BaselineState::READY) {
                payload["signature"] = signature_kind_name(b.kind);
                payload["status"] = b.status;
                payload["size"] = b.size;
                payload["hash"] = b.hash;
                payload["agreement"] = b.agreement;
                std::ostringstream msg;
                msg << "Baseline: " << signature_kind_name(b.kind) << " signature, status "
                    << b.status << ", " << logging::format_size(b.size);
                console.debug(msg.str());
            } else {
                console.debug(std::string("Baseline ") + baseline_state_name(state));
            }
            audit(logger.get(), console, "baseline_established", payload);
            console.result_header();
        });
        orchestrator.on_result([&](const Leftover& leftover) {
            console.result(leftover);
            audit(logger.get(), console, "leftover_recorded",
                  report::ReportWriter::leftover_to_json(leftover));
        });
        if (config.verbose) {
            orchestrator.on_rejected([&](const Candidate& candidate, const ProbeOutcome& outcome,
                                         VerdictReason reason) {
                console.debug("Rejected " + candidate.url + " (" + std::to_string(outcome.status) +
                              ", " + verdict_reason_name(reason) + ")");
            });
        }
        orchestrator.on_progress([&](const ScanProgress& p) {
            console.progress(p.processed, p.accepted, p.workers, p.rps);
        });

        ScanReport scan;
        try {
            scan = orchestrator.run(target);
        } catch (const ConfigError& e) {
            console.error(e.what());
            return 2;
        }

        nlohmann::json finished;
        finished["target"] = scan.target;
        finished["results"] = scan.results.size();
        finished["metrics"] = scan.metrics.to_json();
        audit(logger.get(), console, scan.cancelled ? "scan_cancelled" : "scan_completed", finished);

        if (!config.silent) {
            report::ReportWriter::print_summary(report::ReportWriter::summarize(scan), std::cout);
            if (config.metrics) report::ReportWriter::print_metrics(scan.metrics, std::cout);
        }
        if (scan.cancelled) console.warn("Scan interrupted, results are partial");

        if (!config.output_dir.empty()) {
            std::string path = report::ReportWriter::write_per_url(scan, config.output_dir, config.metrics);
            if (path.empty()) {
                console.error("failed to write report for " + scan.target);
            } else {
                console.info("Report written: " + path);
            }
        }
        reports.push_back(std::move(scan));
    }

    if (!config.output_path.empty()) {
        if (report::ReportWriter::write_document(reports, config.output_path, config.metrics)) {
            console.info("Report written: " + config.output_path);
        } else {
            console.error("failed to write " + config.output_path);
        }
    }

    if (!policy) return 0;

    // Gate the exit code on the risk budget
    std::vector<nlohmann::json> findings;
    for (const auto& scan : reports) {
        for (const auto& leftover : scan.results) {
            findings.push_back(report::ReportWriter::leftover_to_json(leftover));
        }
    }
    budget::BudgetEvaluator evaluator(*policy);
    auto result = evaluator.evaluate_findings(findings);
    if (!config.silent) budget::BudgetEvaluator::print_report(result, std::cout);
    return result.exit_code();
}

/**
 * @brief Verifies the integrity of a JSONL audit log
 * @param argc Argument count from the command line
 * @param argv Argument values from the command line; argv[2] should be the log file path
 * @return 0 if verification succeeds, 1 if it fails, 2 if usage is incorrect
 */
int cmd_verify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: residue verify <audit-log.jsonl>\n";
        return 2;
    }

    std::string log_path = argv[2];
    std::cout << "Verifying log: " << log_path << "\n";

    auto report = logging::ChainLogger::verify(log_path);
    if (report.ok) {
        std::cout << "OK: " << report.entries << " entries, chain intact\n";
        return 0;
    }
    std::cerr << "Verification failed at entry " << report.bad_index << ": " << report.reason << "\n";
    return 1;
}

/**
 * @brief Evaluates a report or audit log against a risk budget policy
 * @param argc Argument count from the command line
 * @param argv Argument values from the command line; argv[2] and beyond specify policy and input file
 * @return 0 pass, 1 warn, 2 block or usage error
 */
int cmd_budget(int argc, char** argv) {
    std::string policy_path;
    std::string input_path;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--policy" && i + 1 < argc) {
            policy_path = argv[++i];
        } else if (input_path.empty()) {
            input_path = arg;
        }
    }

    if (input_path.empty()) {
        std::cerr << "Usage: residue budget [--policy FILE] <report.json|audit-log.jsonl>\n";
        return 2;
    }

    try {
        budget::Policy policy = budget::Policy::get_default();
        if (!policy_path.empty()) {
            std::cout << "Loading policy: " << policy_path << "\n";
            policy = budget::Policy::load(policy_path);
        } else {
            std::cout << "Using default policy\n";
        }

        budget::BudgetEvaluator evaluator(policy);
        auto result = evaluator.evaluate(input_path);
        budget::BudgetEvaluator::print_report(result, std::cout);
        return result.exit_code();
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage:\n";
        std::cerr << "  residue scan (-u URL | -l FILE) [options]   (residue scan --help)\n";
        std::cerr << "  residue verify <audit-log.jsonl>\n";
        std::cerr << "  residue budget [--policy FILE] <report.json|audit-log.jsonl>\n";
        return 2;
    }

    std::string command = argv[1];

    if (command == "scan") {
        return run_scan(argc, argv);
    } else if (command == "verify") {
        return cmd_verify(argc, argv);
    } else if (command == "budget") {
        return cmd_budget(argc, argv);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        return 2;
    }
}
