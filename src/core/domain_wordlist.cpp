// Domain-derived leftover names

#include "domain_wordlist.h"
#include <cctype>
#include <set>

namespace {

// Insertion-ordered set of non-empty tokens.
struct OrderedTokens {
    std::vector<std::string> items;
    std::set<std::string> seen;

    void add(const std::string& t) {
        if (t.empty()) return;
        if (seen.insert(t).second) items.push_back(t);
    }
};

std::string join_labels(const std::vector<std::string>& labels) {
    std::string out;
    for (const auto& l : labels) {
        if (l == "www") continue;
        if (!out.empty()) out += ".";
        out += l;
    }
    return out;
}

std::string capitalized(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

std::string uppercased(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

std::string DomainWordlist::join_extension(const std::string& base, const std::string& ext) {
    if (ext.empty()) return base;
    if (ext[0] == '~' || ext[0] == '.') return base + ext;
    return base + "." + ext;
}

std::vector<std::string> DomainWordlist::composite_permutations(const std::string& label) {
    std::vector<std::string> parts;
    for (char sep : {'-', '_', '.'}) {
        if (label.find(sep) == std::string::npos) continue;
        std::string cur;
        for (char c : label) {
            if (c == sep) {
                if (!cur.empty()) parts.push_back(cur);
                cur.clear();
            } else {
                cur.push_back(c);
            }
        }
        if (!cur.empty()) parts.push_back(cur);
        break;
    }

    OrderedTokens out;
    if (parts.size() < 2) return out.items;

    const std::string& a = parts[0];
    const std::string& b = parts[1];
    for (const char* sep : {".", "_", "", "-"}) {
        out.add(a + sep + b);
        out.add(b + sep + a);
    }
    out.add(a);
    out.add(b);

    if (parts.size() >= 3) {
        const std::string& c = parts[2];
        for (const char* sep : {".", "_", "", "-"}) {
            out.add(a + sep + b + sep + c);
            out.add(c + sep + b + sep + a);
        }
        out.add(c);
    }
    return out.items;
}

std::vector<std::string> DomainWordlist::variations(const TargetUrl& target) {
    OrderedTokens out;
    if (target.is_ip || target.domain.name.empty()) return out.items;

    const std::string& d = target.domain.name;
    const std::string s = join_labels(target.domain.subdomains);

    // Subdomain and domain combinations
    if (!s.empty()) {
        out.add(d + "." + s);
        out.add(s + "." + d);
        out.add(s + d);
        out.add(d + s);
        out.add(s + "_" + d);
        out.add(d + "_" + s);
    }

    // Backup patterns around the domain
    for (const char* p : {"backup", "bak", "old", "temp"}) {
        std::string pattern(p);
        out.add(pattern + d);
        out.add(d + pattern);
        out.add(pattern + "_" + d);
        out.add(d + "_" + pattern);
    }

    // Composite subdomain labels
    for (const auto& label : target.domain.subdomains) {
        if (label.find('-') != std::string::npos || label.find('_') != std::string::npos) {
            for (const auto& p : composite_permutations(label)) out.add(p);
        }
    }

    // Individual components and case variants
    out.add(d);
    if (!target.domain.suffix.empty()) out.add(d + "." + target.domain.suffix);
    for (const auto& label : target.domain.subdomains) {
        if (label != "www") out.add(label);
    }
    out.add(capitalized(d));
    out.add(uppercased(d));

    if (out.items.size() > kMaxVariations) out.items.resize(kMaxVariations);
    return out.items;
}

std::vector<std::string> DomainWordlist::filenames(const TargetUrl& target,
                                                   const std::vector<std::string>& suffixes,
                                                   const std::vector<int>& years) {
    OrderedTokens out;
    const auto tokens = variations(target);
    for (const auto& token : tokens) {
        for (const auto& suffix : suffixes) {
            out.add(join_extension(token, suffix));
        }
    }

    // Date-stamped dumps of the site itself
    if (!tokens.empty() && !target.domain.name.empty()) {
        std::vector<std::string> stamped = {target.domain.name};
        if (!target.domain.suffix.empty()) {
            stamped.push_back(target.domain.name + "." + target.domain.suffix);
        }
        for (const auto& base : stamped) {
            for (int year : years) {
                const std::string y = std::to_string(year);
                for (const char* ext : {"zip", "tar.gz", "sql", "bak"}) {
                    out.add(join_extension(base + "_" + y, ext));
                    out.add(join_extension(base + "-" + y, ext));
                    out.add(join_extension(base + y, ext));
                }
            }
        }
    }
    return out.items;
}
