#pragma once
#include <string>
#include "candidate.h"

/**
 * @file leftover.h
 * @brief A confirmed residual file reported by a scan
 *
 * Immutable once emitted. A scan never reports two leftovers with the same
 * (url, status, size) triple.
 */

enum class Confidence {
    HASH,        // content hash differs from the target's not-found signature
    SIZE,        // baseline only had a size signature to compare against
    UNVERIFIED   // baseline was skipped
};

inline const char* confidence_name(Confidence c) {
    switch (c) {
        case Confidence::HASH:       return "hash";
        case Confidence::SIZE:       return "size";
        case Confidence::UNVERIFIED: return "unverified";
    }
    return "unknown";
}

struct Leftover {
    Candidate candidate;
    long status = 0;
    size_t size = 0;
    std::string content_type;
    std::string content_hash;
    double elapsed_ms = 0.0;
    Confidence confidence = Confidence::HASH;
    bool partial_analysis = false;   // body exceeded the large-file threshold
    bool partial_content = false;    // server answered 206
    std::string redirected_to;       // final URL when redirects were followed
    std::string timestamp;
};
