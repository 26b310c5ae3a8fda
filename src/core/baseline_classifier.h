#pragma once
#include "probe_executor.h"
#include "scan_config.h"
#include <schema/leftover.h>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

// Per-target false-positive classification.
// Before bulk probing, a handful of deliberately nonexistent paths are
// requested to learn what "not found" looks like on this server. Candidate
// outcomes matching that signature, or excluded by the configured filters,
// are rejected; everything else is accepted with a confidence level.

enum class BaselineState {
    UNINITIALIZED,
    SANITY_CHECK,
    READY,
    SKIPPED
};

enum class SignatureKind {
    HASH,        // not-found pages share status and content hash
    SIZE,        // not-found pages share status and size, content varies
    PERMISSIVE   // no consensus; only verbatim sample matches are rejected
};

struct BaselineSample {
    long status = 0;
    size_t size = 0;
    std::string hash;
};

struct Baseline {
    std::vector<BaselineSample> samples;
    SignatureKind kind = SignatureKind::PERMISSIVE;
    long status = 0;
    size_t size = 0;
    std::string hash;
    double agreement = 0.0;       // fraction of samples backing the signature
    double size_tolerance = 0.05;
};

enum class VerdictReason {
    ACCEPTED,
    BASELINE_MATCH,
    IGNORED_STATUS,
    STATUS_NOT_ALLOWED,
    IGNORED_CONTENT_TYPE,
    SIZE_OUT_OF_RANGE,
    AUTH_ERROR_PAGE
};

const char* verdict_reason_name(VerdictReason r);
const char* signature_kind_name(SignatureKind k);
const char* baseline_state_name(BaselineState s);

struct Verdict {
    bool accepted = false;
    VerdictReason reason = VerdictReason::ACCEPTED;
    Confidence confidence = Confidence::HASH;
};

class BaselineClassifier {
public:
    /**
     * @brief Create a classifier
     * @param config Filters, probe count and consensus threshold
     */
    explicit BaselineClassifier(const ScanConfig& config);

    /**
     * @brief Run the sanity phase against a target directory
     * @param executor Probe executor
     * @param dir_url Absolute URL of the directory to probe under, ending in '/'
     * @param gate Called before each sanity probe; returning false ends the
     *             phase early (cancellation while waiting for the rate gate)
     * @return Number of sanity probes that got a response
     */
    size_t establish(ProbeExecutor& executor, const std::string& dir_url,
                     const std::function<bool()>& gate = nullptr);

    /**
     * @brief Compute the signature from sanity outcomes and become READY
     * @param outcomes Sanity probe outcomes; transport failures are ignored
     */
    void learn(const std::vector<ProbeOutcome>& outcomes);

    /// Skip the baseline; every verdict is then UNVERIFIED.
    void skip();

    BaselineState state() const;
    Baseline baseline() const;

    /**
     * @brief Check an outcome against the not-found signature only
     * @return true if the outcome looks like the server's generic error page
     */
    bool matches_baseline(const ProbeOutcome& outcome) const;

    /**
     * @brief Apply the filters and produce the final verdict
     * @param outcome Probe outcome
     * @param baseline_match Result of matches_baseline (possibly cached)
     */
    Verdict judge(const ProbeOutcome& outcome, bool baseline_match);

    /// matches_baseline followed by judge.
    Verdict classify(const ProbeOutcome& outcome);

    /**
     * @brief Improbable paths used for the sanity phase
     * @param count Number of paths
     * @return Relative paths that should not exist on any server
     */
    static std::vector<std::string> random_paths(size_t count);

private:
    const ScanConfig& config_;
    Baseline baseline_;
    BaselineState state_ = BaselineState::UNINITIALIZED;
    std::set<std::pair<long, std::string>> sample_keys_;
    mutable std::shared_mutex mu_;

    std::map<std::pair<long, size_t>, int> auth_pages_;
    std::mutex auth_mu_;

    bool content_type_ignored(const std::string& content_type) const;
    bool looks_like_auth_error(const ProbeOutcome& outcome);
};
