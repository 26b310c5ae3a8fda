// Candidate generation implementation

#include "candidate_generator.h"
#include "domain_wordlist.h"
#include "extension_ranker.h"
#include <algorithm>
#include <sstream>

namespace {

constexpr size_t kDomainChunk = 50;

std::vector<std::string> split_dir(const std::string& dir) {
    std::vector<std::string> out;
    std::string seg;
    std::istringstream ss(dir);
    while (std::getline(ss, seg, '/')) {
        if (!seg.empty()) out.push_back(seg);
    }
    return out;
}

// Trailing suffix of a generated name, used for categorizing.
std::string trailing_suffix(const std::string& name) {
    if (!name.empty() && name.back() == '~') return "~";
    auto dot = name.rfind('.');
    return dot == std::string::npos ? std::string() : name.substr(dot + 1);
}

} // namespace

CandidateGenerator::CandidateGenerator(const TargetUrl& target,
                                       const ScanConfig& config,
                                       const Catalog& catalog)
    : target_(target), config_(config), catalog_(catalog) {
    selection_ = catalog_.for_level(config_.level, config_.language);

    if (!config_.extensions.empty()) {
        for (const auto& e : config_.extensions) {
            extensions_.push_back({e, catalog_.category_of(e)});
        }
    } else {
        extensions_ = ExtensionRanker::rank(selection_.extensions, ExtensionRanker::analyze(target_));
    }

    words_ = config_.wordlist.empty() ? selection_.words : config_.wordlist;

    if (config_.domain_wordlist && !target_.is_ip) {
        domain_names_ = DomainWordlist::filenames(target_, catalog_.domain_suffixes(),
                                                  config_.date_stamp_years);
    }

    Frame root;
    root.dir = target_.directory();
    root.phase = Phase::CRITICAL;
    root.cursor = 0;
    root.is_target_dir = true;
    root.bases = sweep_bases(root.dir, true);
    stack_.push_back(std::move(root));
}

std::vector<std::string> CandidateGenerator::sweep_bases(const std::string& dir,
                                                         bool include_target_file) const {
    std::vector<std::string> out;
    std::set<std::string> seen;
    auto add = [&](const std::string& b) {
        if (!b.empty() && seen.insert(b).second) out.push_back(b);
    };

    if (include_target_file) add(target_.file_name());
    for (const auto& seg : split_dir(dir)) add(seg);

    if (!target_.is_ip && !target_.domain.name.empty()) {
        for (const auto& label : target_.domain.subdomains) {
            if (label != "www") add(label);
        }
        for (const auto& v : DomainWordlist::variations(target_)) add(v);
    }

    for (const char* g : {"backup", "bak", "old", "temp", "archive", "test"}) add(g);
    for (const char* env : {"dev", "test", "staging", "prod", "debug"}) add(env);
    return out;
}

void CandidateGenerator::push_candidate(const std::string& dir, const std::string& name,
                                        const std::string& extension, const std::string& category,
                                        CandidateSource source, PriorityTier tier,
                                        bool expected_interesting) {
    Candidate c;
    c.path = dir + name;
    c.url = target_.origin() + c.path;
    if (!seen_.insert(normalize_url(c.url)).second) return;

    c.extension = extension;
    c.category = category;
    c.source = source;
    c.tier = tier;
    c.expected_interesting = expected_interesting;
    buffer_.push_back(std::move(c));
}

void CandidateGenerator::push_directory(const std::string& dir) {
    Candidate c;
    c.path = dir;
    c.url = target_.origin() + dir;
    if (!seen_.insert(normalize_url(c.url)).second) return;

    c.category = "generic";
    c.source = CandidateSource::RECURSIVE;
    c.tier = PriorityTier::NORMAL;
    buffer_.push_back(std::move(c));
}

/// Generate one chunk of the frame's current phase, moving to the next phase when done.
void CandidateGenerator::advance(Frame& f) {
    switch (f.phase) {
        case Phase::CRITICAL:
            for (const auto& file : selection_.files) {
                bool critical = catalog_.is_critical_file(file.value);
                push_candidate(f.dir, file.value, "", file.category, CandidateSource::CRITICAL,
                               critical ? PriorityTier::CRITICAL : PriorityTier::HIGH,
                               critical || file.category == "credential");
            }
            f.phase = Phase::INDEX;
            break;

        case Phase::INDEX:
            if (config_.test_index) {
                for (const auto& ext : extensions_) {
                    push_candidate(f.dir, DomainWordlist::join_extension("index", ext.value),
                                   ext.value, ext.category, CandidateSource::INDEX,
                                   PriorityTier::HIGH, ext.category == "credential");
                }
            }
            f.phase = Phase::EXTENSIONS;
            f.cursor = 0;
            break;

        case Phase::EXTENSIONS:
            if (f.cursor < f.bases.size() && !extensions_.empty()) {
                const std::string& base = f.bases[f.cursor];
                bool own_file = f.is_target_dir && base == target_.file_name();
                for (const auto& ext : extensions_) {
                    push_candidate(f.dir, DomainWordlist::join_extension(base, ext.value),
                                   ext.value, ext.category, CandidateSource::EXTENSION,
                                   own_file ? PriorityTier::HIGH : PriorityTier::NORMAL,
                                   ext.category == "credential");
                }
                f.cursor++;
            } else {
                f.phase = Phase::BRUTE;
                f.cursor = 0;
            }
            break;

        case Phase::BRUTE:
            if (config_.brute_force && f.cursor < words_.size()) {
                const std::string& word = words_[f.cursor];
                for (const auto& ext : extensions_) {
                    push_candidate(f.dir, DomainWordlist::join_extension(word, ext.value),
                                   ext.value, ext.category, CandidateSource::BRUTE_FORCE,
                                   PriorityTier::LOW, ext.category == "credential");
                }
                f.cursor++;
            } else {
                f.phase = Phase::DOMAIN;
                f.cursor = 0;
            }
            break;

        case Phase::DOMAIN:
            if (f.cursor < domain_names_.size()) {
                size_t end = std::min(f.cursor + kDomainChunk, domain_names_.size());
                for (size_t i = f.cursor; i < end; i++) {
                    const std::string& name = domain_names_[i];
                    std::string suffix = trailing_suffix(name);
                    push_candidate(f.dir, name, suffix, catalog_.category_of(suffix),
                                   CandidateSource::DOMAIN, PriorityTier::LOW, false);
                }
                f.cursor = end;
            } else {
                f.phase = f.is_target_dir ? Phase::RECURSE : Phase::DONE;
            }
            break;

        case Phase::RECURSE:
        case Phase::DONE:
            f.phase = Phase::DONE;
            break;
    }
}

void CandidateGenerator::refill() {
    while (buffer_.empty() && !stack_.empty()) {
        Frame& top = stack_.back();

        if (top.phase == Phase::DONE) {
            stack_.pop_back();
            continue;
        }

        if (top.phase == Phase::RECURSE) {
            std::string dir = top.dir;
            stack_.pop_back();
            if (!config_.recursive) continue;

            // Parents nearest first: /a/b/c/ -> /a/b/, /a/
            auto segments = split_dir(dir);
            std::vector<std::string> parents;
            for (size_t depth = segments.size(); depth-- > 1;) {
                std::string p = "/";
                for (size_t i = 0; i < depth; i++) p += segments[i] + "/";
                parents.push_back(p);
            }
            for (const auto& p : parents) push_directory(p);

            // Explicit work stack: push deepest last so it is expanded first.
            for (auto it = parents.rbegin(); it != parents.rend(); ++it) {
                Frame f;
                f.dir = *it;
                f.phase = Phase::INDEX;
                f.cursor = 0;
                f.is_target_dir = false;
                f.bases = sweep_bases(f.dir, false);
                stack_.push_back(std::move(f));
            }
            continue;
        }

        advance(top);
    }
}

std::optional<Candidate> CandidateGenerator::next() {
    if (buffer_.empty()) refill();
    if (buffer_.empty()) return std::nullopt;

    Candidate c = std::move(buffer_.front());
    buffer_.pop_front();
    emitted_++;
    return c;
}

std::vector<Candidate> CandidateGenerator::collect() {
    std::vector<Candidate> out;
    while (auto c = next()) out.push_back(std::move(*c));
    return out;
}
