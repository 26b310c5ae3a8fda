#pragma once
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Bounded LRU memo of baseline-match decisions.
// Keyed by (path shape, status) rather than the full URL so structurally
// identical probes, such as the same extension across many directories,
// reuse one classifier decision. All operations are atomic with respect to
// each other.

struct Fingerprint {
    std::string shape;  // see FingerprintCache::path_shape
    long status = 0;

    bool operator==(const Fingerprint& o) const {
        return status == o.status && shape == o.shape;
    }
};

struct FingerprintHash {
    size_t operator()(const Fingerprint& f) const {
        return std::hash<std::string>()(f.shape) ^ (std::hash<long>()(f.status) << 1);
    }
};

struct CachedVerdict {
    bool is_baseline_match = false;
    std::string content_hash;
};

class FingerprintCache {
public:
    /**
     * @brief Create a cache
     * @param capacity Maximum number of entries (at least 1)
     */
    explicit FingerprintCache(size_t capacity);

    /**
     * @brief Look up a fingerprint, marking it most recently used on a hit
     * @return Cached verdict, or std::nullopt on a miss
     */
    std::optional<CachedVerdict> get(const Fingerprint& key);

    /**
     * @brief Insert or replace a verdict, evicting the least recently used
     *        entry when capacity is exceeded
     */
    void put(const Fingerprint& key, const CachedVerdict& value);

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t hits() const;
    size_t misses() const;

    /**
     * @brief Structural shape of a URL path
     *
     * Depth plus the last segment with its stem replaced by '*':
     * "/a/b/config.php.bak" -> "3:*.php.bak", "/x/.env" -> "2:.env",
     * "/a/b/" -> "2:/".
     */
    static std::string path_shape(const std::string& path);

private:
    using Entry = std::pair<Fingerprint, CachedVerdict>;

    size_t capacity_;
    std::list<Entry> order_;  // front = most recently used
    std::unordered_map<Fingerprint, std::list<Entry>::iterator, FingerprintHash> index_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    mutable std::mutex mu_;
};
