#pragma once
#include "url_utils.h"
#include <string>
#include <vector>

// Domain-derived leftover names.
// Builds tokens from the registrable domain and subdomains (combinations,
// composite-label permutations, backup patterns, case variants) and turns
// them into filenames with backup suffixes and date stamps.

class DomainWordlist {
public:
    static constexpr size_t kMaxVariations = 100;

    /**
     * @brief Tokens derived from the target host, most likely first
     * @param target Parsed target; IP hosts yield no tokens
     * @return Ordered, duplicate-free token list
     */
    static std::vector<std::string> variations(const TargetUrl& target);

    /**
     * @brief Combine domain tokens with backup suffixes and date stamps
     * @param target Parsed target
     * @param suffixes Backup/archive/database suffixes to append
     * @param years Years used for date-stamped archive names
     * @return Ordered, duplicate-free filenames
     */
    static std::vector<std::string> filenames(const TargetUrl& target,
                                              const std::vector<std::string>& suffixes,
                                              const std::vector<int>& years);

    /// Permutations of a composite label such as "shop-api".
    static std::vector<std::string> composite_permutations(const std::string& label);

    /// Append an extension to a base name ("a" + "bak" -> "a.bak", "a" + "~" -> "a~").
    static std::string join_extension(const std::string& base, const std::string& ext);
};
