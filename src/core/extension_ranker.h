#pragma once
#include "catalog.h"
#include "url_utils.h"
#include <string>
#include <vector>

// Context-based extension ordering.
// Looks at hostname and path for hints (backup hosts, development hosts,
// admin panels, APIs, server-side technology) and moves the extensions most
// likely to hit to the front. Ranking only reorders; it never adds or drops.

struct TargetContext {
    bool likely_backup_site = false;
    bool likely_development = false;
    bool likely_admin = false;
    bool likely_api = false;
    std::string technology;  // "php", "asp", "aspx", "jsp", "py", "rb" or ""
};

class ExtensionRanker {
public:
    /**
     * @brief Derive context hints from a target
     * @param target Parsed target URL
     * @return Flags describing what the target looks like
     */
    static TargetContext analyze(const TargetUrl& target);

    /**
     * @brief Reorder extensions by contextual relevance
     * @param extensions Level extension set in catalog order
     * @param ctx Context from analyze()
     * @return Same entries, stably reordered
     */
    static std::vector<CatalogEntry> rank(const std::vector<CatalogEntry>& extensions,
                                          const TargetContext& ctx);

private:
    static int score(const CatalogEntry& entry, const TargetContext& ctx);
    static int backup_likelihood(const std::string& ext);
};
