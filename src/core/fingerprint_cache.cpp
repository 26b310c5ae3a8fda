// LRU fingerprint cache implementation

#include "fingerprint_cache.h"
#include <algorithm>

FingerprintCache::FingerprintCache(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

std::optional<CachedVerdict> FingerprintCache::get(const Fingerprint& key) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        misses_++;
        return std::nullopt;
    }
    order_.splice(order_.begin(), order_, it->second);
    hits_++;
    return it->second->second;
}

void FingerprintCache::put(const Fingerprint& key, const CachedVerdict& value) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = value;
        order_.splice(order_.begin(), order_, it->second);
        return;
    }

    order_.emplace_front(key, value);
    index_[key] = order_.begin();

    if (order_.size() > capacity_) {
        index_.erase(order_.back().first);
        order_.pop_back();
    }
}

size_t FingerprintCache::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return order_.size();
}

size_t FingerprintCache::hits() const {
    std::lock_guard<std::mutex> lock(mu_);
    return hits_;
}

size_t FingerprintCache::misses() const {
    std::lock_guard<std::mutex> lock(mu_);
    return misses_;
}

std::string FingerprintCache::path_shape(const std::string& path) {
    size_t depth = 0;
    std::string last;
    std::string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty()) {
                depth++;
                last = cur;
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }

    if (cur.empty()) {
        // Directory path
        return std::to_string(depth) + ":/";
    }
    depth++;
    last = cur;

    // Dot-files keep their full name, they are few and distinct.
    if (last[0] == '.') return std::to_string(depth) + ":" + last;

    auto dot = last.find('.');
    std::string tail;
    if (dot != std::string::npos) {
        tail = last.substr(dot);
    } else if (last.back() == '~') {
        tail = "~";
    }
    return std::to_string(depth) + ":*" + tail;
}
