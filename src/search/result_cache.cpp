#include <mvsearch/search/result_cache.h>

#include <spdlog/spdlog.h>
#include <mutex>
#include <vector>

namespace mvsearch::search {

ResultCache::ResultCache(const ResultCacheConfig& config) : config_(config) {
    stats_.maxSize = config.maxEntries;
}

std::optional<SearchResponse> ResultCache::get(const CacheKey& key) {
    auto startTime = std::chrono::steady_clock::now();

    // Hits reorder the LRU list, so take the write lock up front
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto recordAccess = [&]() {
        if (config_.enableStatistics) {
            auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - startTime);
            stats_.totalAccessTime.fetch_add(duration.count());
        }
    };

    if (!config_.enabled) {
        return std::nullopt;
    }

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        if (config_.enableStatistics) {
            stats_.misses.fetch_add(1);
        }
        recordAccess();
        return std::nullopt;
    }

    auto entry = it->second;
    if (entry->isExpired(startTime)) {
        eraseLocked(key);
        if (config_.enableStatistics) {
            stats_.ttlExpirations.fetch_add(1);
            stats_.misses.fetch_add(1);
        }
        recordAccess();
        return std::nullopt;
    }

    entry->lastAccessTime = startTime;
    entry->accessCount++;
    moveToFront(key);

    if (config_.enableStatistics) {
        stats_.hits.fetch_add(1);
    }
    recordAccess();
    return entry->data;
}

void ResultCache::put(const CacheKey& key, const SearchResponse& response,
                      std::chrono::seconds ttl) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!config_.enabled || config_.maxEntries == 0) {
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    auto it = cache_.find(key);
    if (it != cache_.end()) {
        auto& entry = it->second;
        entry->data = response;
        entry->insertTime = now;
        entry->lastAccessTime = now;
        entry->ttl = (ttl.count() > 0) ? ttl : config_.defaultTTL;
        moveToFront(key);
        return;
    }

    while (cache_.size() >= config_.maxEntries) {
        evictLRU();
    }

    auto entry = std::make_shared<CacheEntry>();
    entry->data = response;
    entry->insertTime = now;
    entry->lastAccessTime = now;
    entry->ttl = (ttl.count() > 0) ? ttl : config_.defaultTTL;

    cache_[key] = entry;
    lruList_.push_front(key);
    keyToListIter_[key] = lruList_.begin();

    if (config_.enableStatistics) {
        stats_.insertions.fetch_add(1);
    }
    stats_.currentSize.store(cache_.size());
}

bool ResultCache::contains(const CacheKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    return !it->second->isExpired(std::chrono::steady_clock::now());
}

void ResultCache::invalidate(const CacheKey& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (cache_.count(key)) {
        eraseLocked(key);
        if (config_.enableStatistics) {
            stats_.invalidations.fetch_add(1);
        }
    }
}

size_t ResultCache::invalidatePattern(const std::string& pattern) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::vector<CacheKey> keysToRemove;
    for (const auto& [key, entry] : cache_) {
        if (key.matchesPattern(pattern)) {
            keysToRemove.push_back(key);
        }
    }
    for (const auto& key : keysToRemove) {
        eraseLocked(key);
    }
    if (config_.enableStatistics) {
        stats_.invalidations.fetch_add(keysToRemove.size());
        stats_.patternInvalidations.fetch_add(1);
    }
    spdlog::debug("Result cache pattern '{}' invalidated {} entries", pattern, keysToRemove.size());
    return keysToRemove.size();
}

void ResultCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
    lruList_.clear();
    keyToListIter_.clear();
    stats_.currentSize.store(0);
}

size_t ResultCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

size_t ResultCache::removeExpired() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    const auto now = std::chrono::steady_clock::now();
    std::vector<CacheKey> expired;
    for (const auto& [key, entry] : cache_) {
        if (entry->isExpired(now)) {
            expired.push_back(key);
        }
    }
    for (const auto& key : expired) {
        eraseLocked(key);
    }
    if (config_.enableStatistics) {
        stats_.ttlExpirations.fetch_add(expired.size());
    }
    return expired.size();
}

CacheStats ResultCache::getStats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return stats_;
}

void ResultCache::resetStats() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    stats_.reset();
}

void ResultCache::setConfig(const ResultCacheConfig& config) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    config_ = config;
    stats_.maxSize = config.maxEntries;
    while (cache_.size() > config_.maxEntries) {
        evictLRU();
    }
}

ResultCacheConfig ResultCache::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return config_;
}

void ResultCache::moveToFront(const CacheKey& key) {
    auto it = keyToListIter_.find(key);
    if (it != keyToListIter_.end()) {
        lruList_.splice(lruList_.begin(), lruList_, it->second);
    }
}

void ResultCache::evictLRU() {
    if (lruList_.empty()) {
        return;
    }
    CacheKey victim = lruList_.back();
    spdlog::debug("Result cache evicting '{}'", victim.getComponents().queryText);
    eraseLocked(victim);
    if (config_.enableStatistics) {
        stats_.evictions.fetch_add(1);
    }
}

void ResultCache::eraseLocked(const CacheKey& key) {
    cache_.erase(key);
    auto listIt = keyToListIter_.find(key);
    if (listIt != keyToListIter_.end()) {
        lruList_.erase(listIt->second);
        keyToListIter_.erase(listIt);
    }
    stats_.currentSize.store(cache_.size());
}

} // namespace mvsearch::search
