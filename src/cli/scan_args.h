#pragma once
#include "core/scan_config.h"
#include <string>
#include <vector>

namespace cli {

/**
 * @brief Build a validated scan configuration from "residue scan" arguments
 *
 * A --config file is applied first wherever it appears on the line, then
 * every other flag overrides it.
 *
 * @param args Arguments after the "scan" subcommand
 * @return Validated configuration
 * @throws ConfigError on unknown flags, missing values, unreadable files or
 *         conflicting settings
 */
ScanConfig parse_scan_args(const std::vector<std::string>& args);

/// Split "a,b,c" into its non-empty trimmed parts.
std::vector<std::string> split_list(const std::string& list);

/// Usage text for the scan subcommand.
const char* scan_usage();

} // namespace cli
