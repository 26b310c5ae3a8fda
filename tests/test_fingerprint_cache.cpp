/**
 * @file test_fingerprint_cache.cpp
 * @brief Unit tests for the bounded LRU fingerprint cache
 */

#include <catch2/catch.hpp>
#include "core/fingerprint_cache.h"
#include <thread>
#include <vector>

TEST_CASE("Path shapes collapse the variable part of a path", "[cache]") {
    REQUIRE(FingerprintCache::path_shape("/a/b/x.php.bak") == "3:*.php.bak");
    REQUIRE(FingerprintCache::path_shape("/x/.env") == "2:.env");
    REQUIRE(FingerprintCache::path_shape("/login.php.bak") == FingerprintCache::path_shape("/index.php.bak"));
    REQUIRE(FingerprintCache::path_shape("/a/login.php.bak") != FingerprintCache::path_shape("/login.php.bak"));
    REQUIRE(FingerprintCache::path_shape("/a/b/") == "2:/");
    REQUIRE(FingerprintCache::path_shape("/index.php~") == "1:*.php~");
    REQUIRE(FingerprintCache::path_shape("/index~") == "1:*~");
}

TEST_CASE("Cache returns what was stored and counts hits and misses", "[cache]") {
    FingerprintCache cache(8);
    Fingerprint key{"1:*.bak", 404};

    REQUIRE_FALSE(cache.get(key).has_value());
    REQUIRE(cache.misses() == 1);

    cache.put(key, CachedVerdict{true, "sha256:aa"});
    auto hit = cache.get(key);
    REQUIRE(hit.has_value());
    REQUIRE(hit->is_baseline_match);
    REQUIRE(hit->content_hash == "sha256:aa");
    REQUIRE(cache.hits() == 1);

    SECTION("Status is part of the key") {
        REQUIRE_FALSE(cache.get(Fingerprint{"1:*.bak", 200}).has_value());
    }

    SECTION("Put replaces an existing entry") {
        cache.put(key, CachedVerdict{false, "sha256:bb"});
        REQUIRE(cache.size() == 1);
        REQUIRE_FALSE(cache.get(key)->is_baseline_match);
    }
}

TEST_CASE("Cache evicts the least recently used entry", "[cache]") {
    FingerprintCache cache(2);
    Fingerprint a{"1:*.bak", 404};
    Fingerprint b{"1:*.old", 404};
    Fingerprint c{"1:*.zip", 404};

    cache.put(a, CachedVerdict{true, "h1"});
    cache.put(b, CachedVerdict{true, "h2"});

    // Touch a so b becomes the eviction victim
    REQUIRE(cache.get(a).has_value());
    cache.put(c, CachedVerdict{true, "h3"});

    REQUIRE(cache.size() == 2);
    REQUIRE(cache.get(a).has_value());
    REQUIRE_FALSE(cache.get(b).has_value());
    REQUIRE(cache.get(c).has_value());
}

TEST_CASE("Cache never grows beyond its capacity under concurrent use", "[cache]") {
    FingerprintCache cache(16);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 500; i++) {
                Fingerprint key{std::to_string(t) + ":*." + std::to_string(i % 40), 404};
                if (!cache.get(key)) cache.put(key, CachedVerdict{i % 2 == 0, "h"});
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(cache.size() <= 16);
    REQUIRE(cache.hits() + cache.misses() == 8 * 500);
}
