#pragma once
#include <string>

/**
 * @file candidate.h
 * @brief A single path to probe on a target
 *
 * Produced by the CandidateGenerator in strict priority order and consumed
 * exactly once by the scan orchestrator.
 */

enum class CandidateSource {
    CRITICAL,     // fixed high-value filenames (.env, keys, certificates)
    INDEX,        // index.<ext> variants
    EXTENSION,    // extension sweep over URL-derived bases
    BRUTE_FORCE,  // keyword x extension cross product
    DOMAIN,       // tokens derived from the target's domain
    RECURSIVE     // parent directory of the target path
};

/**
 * Lower tier numbers are offered to the work queue first.
 */
enum class PriorityTier {
    CRITICAL = 0,
    HIGH = 1,
    NORMAL = 2,
    LOW = 3
};

struct Candidate {
    std::string url;          // absolute URL as probed
    std::string path;         // path component, always starts with '/'
    std::string extension;    // extension or suffix that produced it, may be empty
    std::string category;     // credential, config, vcs, database, archive, ...
    CandidateSource source = CandidateSource::EXTENSION;
    PriorityTier tier = PriorityTier::NORMAL;
    bool expected_interesting = false;
};

inline const char* candidate_source_name(CandidateSource s) {
    switch (s) {
        case CandidateSource::CRITICAL:    return "critical";
        case CandidateSource::INDEX:       return "index";
        case CandidateSource::EXTENSION:   return "extension";
        case CandidateSource::BRUTE_FORCE: return "brute-force";
        case CandidateSource::DOMAIN:      return "domain";
        case CandidateSource::RECURSIVE:   return "recursive";
    }
    return "unknown";
}
