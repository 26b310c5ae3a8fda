#pragma once
#include "catalog.h"
#include "scan_config.h"
#include "url_utils.h"
#include <schema/candidate.h>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <vector>

// Ordered, lazy candidate generation for one target.
// Phases run strictly in priority order: critical filenames, index variants,
// extension sweep, keyword brute force, domain-derived names, then recursive
// parent directories (each re-entering the index..domain phases). Every
// normalized URL is emitted at most once. Not thread-safe; the orchestrator
// serializes calls to next().

class CandidateGenerator {
public:
    /**
     * @brief Create a generator for one target
     * @param target Parsed target URL
     * @param config Scan configuration (level, mode flags, overrides)
     * @param catalog Built-in catalogs
     */
    CandidateGenerator(const TargetUrl& target,
                       const ScanConfig& config,
                       const Catalog& catalog = Catalog::builtin());

    /**
     * @brief Produce the next candidate
     * @return Candidate, or std::nullopt once the sequence is exhausted
     */
    std::optional<Candidate> next();

    /// Number of candidates emitted so far.
    size_t emitted() const { return emitted_; }

    /// Drain the whole sequence (tests and dry runs).
    std::vector<Candidate> collect();

    /**
     * @brief Base names the extension sweep applies extensions to
     * @param dir Directory level, starting and ending with '/'
     * @param include_target_file Add the target's own file name first
     */
    std::vector<std::string> sweep_bases(const std::string& dir, bool include_target_file) const;

private:
    enum class Phase {
        CRITICAL,
        INDEX,
        EXTENSIONS,
        BRUTE,
        DOMAIN,
        RECURSE,
        DONE
    };

    // One directory level being expanded.
    struct Frame {
        std::string dir;
        Phase phase;
        size_t cursor;
        bool is_target_dir;
        std::vector<std::string> bases;
    };

    TargetUrl target_;
    const ScanConfig& config_;
    const Catalog& catalog_;

    LevelSelection selection_;
    std::vector<CatalogEntry> extensions_;
    std::vector<std::string> words_;
    std::vector<std::string> domain_names_;

    std::vector<Frame> stack_;
    std::deque<Candidate> buffer_;
    std::set<std::string> seen_;
    size_t emitted_ = 0;

    void refill();
    void advance(Frame& f);
    void push_candidate(const std::string& dir, const std::string& name,
                        const std::string& extension, const std::string& category,
                        CandidateSource source, PriorityTier tier, bool expected_interesting);
    void push_directory(const std::string& dir);
};
