/**
 * @file test_domain_wordlist.cpp
 * @brief Unit tests for domain tokens, context ranking and the built-in catalog
 */

#include <catch2/catch.hpp>
#include "core/catalog.h"
#include "core/domain_wordlist.h"
#include "core/extension_ranker.h"
#include <algorithm>
#include <set>

static TargetUrl target(const std::string& url) {
    TargetUrl t;
    REQUIRE(parse_target_url(url, t));
    return t;
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

static size_t index_of(const std::vector<CatalogEntry>& v, const std::string& value) {
    for (size_t i = 0; i < v.size(); i++) {
        if (v[i].value == value) return i;
    }
    return v.size();
}

TEST_CASE("Domain variations combine subdomain and domain", "[domain]") {
    auto tokens = DomainWordlist::variations(target("https://www.shop-api.example.com.br/"));

    REQUIRE(tokens.front() == "example.shop-api");
    REQUIRE(contains(tokens, "shop-api.example"));
    REQUIRE(contains(tokens, "shop-apiexample"));
    REQUIRE(contains(tokens, "backupexample"));
    REQUIRE(contains(tokens, "example_old"));
    REQUIRE(contains(tokens, "api_shop"));
    REQUIRE(contains(tokens, "example"));
    REQUIRE(contains(tokens, "example.com.br"));
    REQUIRE(contains(tokens, "Example"));
    REQUIRE(contains(tokens, "EXAMPLE"));

    // www never becomes a token on its own
    REQUIRE_FALSE(contains(tokens, "www"));
    REQUIRE(tokens.size() <= DomainWordlist::kMaxVariations);
    REQUIRE(std::set<std::string>(tokens.begin(), tokens.end()).size() == tokens.size());
}

TEST_CASE("IP targets yield no domain tokens", "[domain]") {
    REQUIRE(DomainWordlist::variations(target("http://10.1.2.3/")).empty());
    REQUIRE(DomainWordlist::filenames(target("http://10.1.2.3/"), {"zip"}, {2024}).empty());
}

TEST_CASE("Composite labels are split and permuted", "[domain]") {
    auto p = DomainWordlist::composite_permutations("shop-api");
    REQUIRE(p.front() == "shop.api");
    REQUIRE(contains(p, "api.shop"));
    REQUIRE(contains(p, "shopapi"));
    REQUIRE(contains(p, "api-shop"));
    REQUIRE(contains(p, "shop"));
    REQUIRE(contains(p, "api"));

    auto three = DomainWordlist::composite_permutations("a_b_c");
    REQUIRE(contains(three, "a_b_c"));
    REQUIRE(contains(three, "c.b.a"));
    REQUIRE(contains(three, "c"));

    REQUIRE(DomainWordlist::composite_permutations("plain").empty());
}

TEST_CASE("Domain filenames add suffixes and date stamps", "[domain]") {
    auto names = DomainWordlist::filenames(target("http://example.org/"), {"zip", "~"}, {2024});

    REQUIRE(names.front() == "backupexample.zip");
    REQUIRE(contains(names, "example~"));
    REQUIRE(contains(names, "example.org.zip"));
    REQUIRE(contains(names, "example_2024.tar.gz"));
    REQUIRE(contains(names, "example-2024.sql"));
    REQUIRE(contains(names, "example2024.bak"));
    REQUIRE(contains(names, "example.org_2024.zip"));
    REQUIRE_FALSE(contains(names, "example_2023.zip"));
}

TEST_CASE("Target context hints", "[ranker]") {
    SECTION("Development backup host with PHP") {
        auto ctx = ExtensionRanker::analyze(target("http://dev-backup.example.com/admin/index.PHP"));
        REQUIRE(ctx.likely_backup_site);
        REQUIRE(ctx.likely_development);
        REQUIRE(ctx.likely_admin);
        REQUIRE_FALSE(ctx.likely_api);
        REQUIRE(ctx.technology == "php");
    }

    SECTION("API path") {
        auto ctx = ExtensionRanker::analyze(target("https://example.com/api/v2/"));
        REQUIRE(ctx.likely_api);
        REQUIRE_FALSE(ctx.likely_development);
        REQUIRE(ctx.technology.empty());
    }
}

TEST_CASE("Ranking reorders without adding or dropping", "[ranker]") {
    const auto sel = Catalog::builtin().for_level(2, Language::ALL);
    auto ctx = ExtensionRanker::analyze(target("http://backup.example.com/login.php"));
    auto ranked = ExtensionRanker::rank(sel.extensions, ctx);

    REQUIRE(ranked.size() == sel.extensions.size());
    std::set<std::string> before, after;
    for (const auto& e : sel.extensions) before.insert(e.value);
    for (const auto& e : ranked) after.insert(e.value);
    REQUIRE(before == after);

    // Technology-specific backups lead, database dumps beat plain source leftovers
    REQUIRE(ranked.front().value.rfind("php", 0) == 0);
    REQUIRE(index_of(ranked, "php.bak") < index_of(ranked, "sql"));
    REQUIRE(index_of(ranked, "sql") < index_of(ranked, "txt"));
    REQUIRE(index_of(ranked, "sql") < index_of(ranked, "jsp.bak"));
}

TEST_CASE("Ranking is stable for equal scores", "[ranker]") {
    std::vector<CatalogEntry> in = {{"zz", "generic"}, {"aa", "generic"}, {"mm", "generic"}};
    auto out = ExtensionRanker::rank(in, TargetContext{});
    REQUIRE(out[0].value == "zz");
    REQUIRE(out[1].value == "aa");
    REQUIRE(out[2].value == "mm");
}

TEST_CASE("Catalog levels nest", "[catalog]") {
    const auto& cat = Catalog::builtin();
    auto l0 = cat.for_level(0, Language::ALL);
    auto l1 = cat.for_level(1, Language::ALL);
    auto l4 = cat.for_level(4, Language::ALL);

    REQUIRE(l0.extensions.empty());
    REQUIRE(l0.words.empty());
    REQUIRE(l0.files.size() == 12);
    REQUIRE(l1.words == std::vector<std::string>{"backup", "old", "temp", "test", "dev"});
    REQUIRE(l1.extensions.size() == 14);

    for (size_t i = 0; i < l1.extensions.size(); i++) {
        REQUIRE(l4.extensions[i].value == l1.extensions[i].value);
    }
    REQUIRE(l4.words.size() > 400);
}

TEST_CASE("Language filter keeps neutral words", "[catalog]") {
    const auto& cat = Catalog::builtin();
    auto en = cat.for_level(4, Language::EN);
    auto pt = cat.for_level(4, Language::PT_BR);

    REQUIRE(contains(en.words, "backup"));
    REQUIRE(contains(pt.words, "backup"));
    REQUIRE(contains(en.words, "database"));
    REQUIRE(contains(pt.words, "fatura"));
    REQUIRE_FALSE(contains(en.words, "fatura"));

    Language lang;
    REQUIRE(parse_language("pt-br", lang));
    REQUIRE(lang == Language::PT_BR);
    REQUIRE_FALSE(parse_language("de", lang));
}

TEST_CASE("Catalog categories", "[catalog]") {
    const auto& cat = Catalog::builtin();
    REQUIRE(cat.category_of("php.bak") == "source");
    REQUIRE(cat.category_of("sql") == "database");
    REQUIRE(cat.category_of("pfx") == "credential");
    REQUIRE(cat.category_of("tar.gz") == "archive");
    REQUIRE(cat.category_of("nope") == "generic");

    REQUIRE(cat.is_critical_file(".env"));
    REQUIRE_FALSE(cat.is_critical_file("index.php"));

    auto suffixes = cat.domain_suffixes();
    REQUIRE(suffixes.size() == 50);
    REQUIRE(suffixes.front() == "zip");
    REQUIRE(std::set<std::string>(suffixes.begin(), suffixes.end()).size() == suffixes.size());
}
