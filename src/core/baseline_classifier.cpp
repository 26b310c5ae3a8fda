// Baseline classification implementation

#include "baseline_classifier.h"
#include "content_sniffer.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

const char* verdict_reason_name(VerdictReason r) {
    switch (r) {
        case VerdictReason::ACCEPTED:             return "accepted";
        case VerdictReason::BASELINE_MATCH:       return "baseline_match";
        case VerdictReason::IGNORED_STATUS:       return "ignored_status";
        case VerdictReason::STATUS_NOT_ALLOWED:   return "status_not_allowed";
        case VerdictReason::IGNORED_CONTENT_TYPE: return "ignored_content_type";
        case VerdictReason::SIZE_OUT_OF_RANGE:    return "size_out_of_range";
        case VerdictReason::AUTH_ERROR_PAGE:      return "auth_error_page";
    }
    return "unknown";
}

const char* signature_kind_name(SignatureKind k) {
    switch (k) {
        case SignatureKind::HASH:       return "hash";
        case SignatureKind::SIZE:       return "size";
        case SignatureKind::PERMISSIVE: return "permissive";
    }
    return "unknown";
}

const char* baseline_state_name(BaselineState s) {
    switch (s) {
        case BaselineState::UNINITIALIZED: return "uninitialized";
        case BaselineState::SANITY_CHECK:  return "sanity_check";
        case BaselineState::READY:         return "ready";
        case BaselineState::SKIPPED:       return "skipped";
    }
    return "unknown";
}

static bool within_tolerance(size_t a, size_t b, double tolerance) {
    size_t hi = std::max(a, b);
    size_t lo = std::min(a, b);
    return static_cast<double>(hi - lo) <= tolerance * static_cast<double>(hi);
}

BaselineClassifier::BaselineClassifier(const ScanConfig& config)
    : config_(config) {}

std::vector<std::string> BaselineClassifier::random_paths(size_t count) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<unsigned long> dist(0, 0xffffffffUL);

    std::vector<std::string> out;
    for (size_t i = 0; i < count; i++) {
        std::ostringstream ss;
        ss << std::hex << std::setw(8) << std::setfill('0') << dist(gen);
        const std::string token = ss.str();
        switch (i % 4) {
            case 0: out.push_back("nonexistent_" + token); break;
            case 1: out.push_back("residue-probe-" + token + ".html"); break;
            case 2: out.push_back(token + ".bak"); break;
            default: out.push_back("missing_" + token + ".php"); break;
        }
    }
    return out;
}

size_t BaselineClassifier::establish(ProbeExecutor& executor, const std::string& dir_url,
                                     const std::function<bool()>& gate) {
    {
        std::unique_lock<std::shared_mutex> lock(mu_);
        state_ = BaselineState::SANITY_CHECK;
    }

    std::vector<ProbeOutcome> outcomes;
    for (const auto& path : random_paths(static_cast<size_t>(std::max(config_.baseline_probes, 1)))) {
        if (gate && !gate()) break;
        outcomes.push_back(executor.probe(dir_url + path));
    }
    learn(outcomes);

    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [](const ProbeOutcome& o) { return o.ok(); }));
}

void BaselineClassifier::learn(const std::vector<ProbeOutcome>& outcomes) {
    Baseline b;
    for (const auto& o : outcomes) {
        if (!o.ok()) continue;
        b.samples.push_back({o.status, o.size, o.content_hash});
    }

    const size_t n = b.samples.size();
    const double needed = config_.baseline_consensus * static_cast<double>(n);

    if (n > 0) {
        // Most common (status, hash)
        std::map<std::pair<long, std::string>, size_t> by_hash;
        for (const auto& s : b.samples) by_hash[{s.status, s.hash}]++;
        auto top = std::max_element(by_hash.begin(), by_hash.end(),
            [](const auto& x, const auto& y) { return x.second < y.second; });

        if (static_cast<double>(top->second) >= needed) {
            b.kind = SignatureKind::HASH;
            b.status = top->first.first;
            b.hash = top->first.second;
            for (const auto& s : b.samples) {
                if (s.status == b.status && s.hash == b.hash) {
                    b.size = s.size;
                    break;
                }
            }
            b.agreement = static_cast<double>(top->second) / static_cast<double>(n);
        } else {
            // Most common (status, size bucket)
            size_t best = 0;
            size_t best_index = 0;
            for (size_t i = 0; i < n; i++) {
                size_t votes = 0;
                for (size_t j = 0; j < n; j++) {
                    if (b.samples[j].status == b.samples[i].status &&
                        within_tolerance(b.samples[i].size, b.samples[j].size, b.size_tolerance)) {
                        votes++;
                    }
                }
                if (votes > best) {
                    best = votes;
                    best_index = i;
                }
            }
            if (static_cast<double>(best) >= needed) {
                b.kind = SignatureKind::SIZE;
                b.status = b.samples[best_index].status;
                b.size = b.samples[best_index].size;
                b.agreement = static_cast<double>(best) / static_cast<double>(n);
            }
        }
    }

    std::unique_lock<std::shared_mutex> lock(mu_);
    baseline_ = std::move(b);
    sample_keys_.clear();
    for (const auto& s : baseline_.samples) sample_keys_.insert({s.status, s.hash});
    state_ = BaselineState::READY;
}

void BaselineClassifier::skip() {
    std::unique_lock<std::shared_mutex> lock(mu_);
    baseline_ = Baseline();
    sample_keys_.clear();
    state_ = BaselineState::SKIPPED;
}

BaselineState BaselineClassifier::state() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return state_;
}

Baseline BaselineClassifier::baseline() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return baseline_;
}

bool BaselineClassifier::matches_baseline(const ProbeOutcome& outcome) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    if (state_ != BaselineState::READY) return false;

    switch (baseline_.kind) {
        case SignatureKind::HASH:
            return outcome.status == baseline_.status && outcome.content_hash == baseline_.hash;
        case SignatureKind::SIZE:
            return outcome.status == baseline_.status &&
                   within_tolerance(outcome.size, baseline_.size, baseline_.size_tolerance);
        case SignatureKind::PERMISSIVE:
            return sample_keys_.count({outcome.status, outcome.content_hash}) > 0;
    }
    return false;
}

bool BaselineClassifier::content_type_ignored(const std::string& content_type) const {
    if (config_.content_type_ignore.empty() || content_type.empty()) return false;
    const std::string mt = sniff::media_type(content_type);

    for (const auto& raw : config_.content_type_ignore) {
        std::string entry = sniff::media_type(raw);
        if (entry.empty()) continue;
        if (mt == entry) return true;

        // "text/*" matches any text subtype
        if (entry.size() > 2 && entry.compare(entry.size() - 2, 2, "/*") == 0 &&
            mt.compare(0, entry.size() - 1, entry, 0, entry.size() - 1) == 0) {
            return true;
        }

        // "application/json" also matches "application/problem+json"
        auto slash = entry.find('/');
        auto plus = mt.find('+');
        if (slash != std::string::npos && plus != std::string::npos &&
            mt.compare(0, slash + 1, entry, 0, slash + 1) == 0 &&
            mt.substr(plus + 1) == entry.substr(slash + 1)) {
            return true;
        }
    }
    return false;
}

bool BaselineClassifier::looks_like_auth_error(const ProbeOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lock(auth_mu_);
        int& seen = auth_pages_[{outcome.status, outcome.size}];
        seen++;
        if (seen > 2) return true;
    }

    if (outcome.size < 150) return true;

    if (sniff::is_html(outcome.content_type, outcome.sample)) {
        std::string text = sniff::visible_text(outcome.sample);
        if (sniff::has_error_phrase(text)) return true;
        if (text.size() < 100) return true;
    } else if (sniff::has_error_phrase(outcome.sample)) {
        return true;
    }
    return false;
}

Verdict BaselineClassifier::judge(const ProbeOutcome& outcome, bool baseline_match) {
    Verdict v;
    {
        std::shared_lock<std::shared_mutex> lock(mu_);
        if (state_ == BaselineState::SKIPPED) {
            v.confidence = Confidence::UNVERIFIED;
        } else if (state_ == BaselineState::READY && baseline_.kind == SignatureKind::SIZE) {
            v.confidence = Confidence::SIZE;
        } else {
            v.confidence = Confidence::HASH;
        }
    }

    bool allowed = config_.status_allow.count(outcome.status) > 0;
    if (config_.status_ignore.count(outcome.status) && !allowed) {
        v.reason = VerdictReason::IGNORED_STATUS;
        return v;
    }
    if (!config_.status_allow.empty() && !allowed) {
        v.reason = VerdictReason::STATUS_NOT_ALLOWED;
        return v;
    }
    if (baseline_match) {
        v.reason = VerdictReason::BASELINE_MATCH;
        return v;
    }
    if (content_type_ignored(outcome.content_type)) {
        v.reason = VerdictReason::IGNORED_CONTENT_TYPE;
        return v;
    }
    if (outcome.size < config_.min_size ||
        (config_.max_size != 0 && outcome.size > config_.max_size)) {
        v.reason = VerdictReason::SIZE_OUT_OF_RANGE;
        return v;
    }
    if (config_.strict_auth && (outcome.status == 401 || outcome.status == 403) &&
        looks_like_auth_error(outcome)) {
        v.reason = VerdictReason::AUTH_ERROR_PAGE;
        return v;
    }

    v.accepted = true;
    v.reason = VerdictReason::ACCEPTED;
    return v;
}

Verdict BaselineClassifier::classify(const ProbeOutcome& outcome) {
    return judge(outcome, matches_baseline(outcome));
}
