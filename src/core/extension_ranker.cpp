// Context-based extension ordering

#include "extension_ranker.h"
#include <algorithm>
#include <initializer_list>
#include <map>

static bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

TargetContext ExtensionRanker::analyze(const TargetUrl& target) {
    TargetContext ctx;
    std::string path;
    for (const auto& s : target.segments) path += "/" + s;
    std::transform(path.begin(), path.end(), path.begin(), [](unsigned char c){ return std::tolower(c); });
    const std::string& host = target.host;

    ctx.likely_backup_site =
        contains_any(host, {"backup", "bkp", "archive", "old", "temp", "tmp", "staging", "test", "dev"}) ||
        contains_any(path, {"backup", "bkp", "archive", "old", "temp", "tmp"});
    ctx.likely_development =
        contains_any(host, {"dev", "test", "staging", "beta", "alpha", "demo", "sandbox", "lab", "hml", "homolog"});
    ctx.likely_admin =
        contains_any(host + path, {"admin", "manage", "control", "panel", "dashboard"});
    ctx.likely_api =
        contains_any(host + path, {"api", "service", "webservice", "rest", "graphql"});

    std::string file = target.file_name();
    auto dot = file.rfind('.');
    if (dot != std::string::npos) {
        std::string ext = file.substr(dot + 1);
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
        if (ext == "php" || ext == "asp" || ext == "aspx" || ext == "jsp" || ext == "py" || ext == "rb") {
            ctx.technology = ext;
        }
    }
    return ctx;
}

int ExtensionRanker::backup_likelihood(const std::string& ext) {
    static const std::map<std::string, int> priority = {
        {"sql", 10}, {"dump", 10}, {"db", 10},
        {"zip", 9}, {"rar", 9}, {"tar.gz", 9}, {"7z", 9},
        {"bak", 8}, {"backup", 8}, {"old", 8},
        {"tar", 7}, {"gz", 7}, {"bz2", 7},
        {"tmp", 6}, {"temp", 6}, {"save", 6},
    };
    auto it = priority.find(ext);
    return it == priority.end() ? 0 : it->second;
}

int ExtensionRanker::score(const CatalogEntry& entry, const TargetContext& ctx) {
    const std::string& cat = entry.category;
    int s;
    if (cat == "archive" || cat == "backup" || cat == "database") {
        s = 30;
        if (ctx.likely_backup_site) s += backup_likelihood(entry.value);
    } else if (cat == "log" || cat == "document" || cat == "config") {
        s = 20;
        if (ctx.likely_development) s += 15;
        if (ctx.likely_api && cat == "config") s += 12;
    } else if (cat == "source") {
        s = 0;
    } else {
        s = 10;
        if (ctx.likely_admin && cat == "credential") s += 15;
    }

    // Framework hint: "login.php" favours "php.bak", "php~", ...
    if (!ctx.technology.empty()) {
        const std::string& v = entry.value;
        if (v.size() > ctx.technology.size() &&
            v.compare(0, ctx.technology.size(), ctx.technology) == 0 &&
            (v[ctx.technology.size()] == '.' || v[ctx.technology.size()] == '~')) {
            s += 100;
        }
    }
    return s;
}

std::vector<CatalogEntry> ExtensionRanker::rank(const std::vector<CatalogEntry>& extensions,
                                                const TargetContext& ctx) {
    std::vector<std::pair<int, CatalogEntry>> scored;
    scored.reserve(extensions.size());
    for (const auto& e : extensions) scored.emplace_back(score(e, ctx), e);

    std::stable_sort(scored.begin(), scored.end(),
        [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<CatalogEntry> out;
    out.reserve(scored.size());
    for (auto& [s, e] : scored) out.push_back(std::move(e));
    return out;
}
