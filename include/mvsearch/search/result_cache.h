#pragma once

#include <chrono>
#include <list>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <mvsearch/search/cache_key.h>
#include <mvsearch/search/cache_stats.h>
#include <mvsearch/search/search_types.h>

namespace mvsearch::search {

/**
 * @brief Configuration for the search result cache
 */
struct ResultCacheConfig {
    bool enabled = true;
    size_t maxEntries = 100;               ///< LRU capacity
    std::chrono::seconds defaultTTL{3600}; ///< 1 hour
    bool enableStatistics = true;
};

/**
 * @brief Thread-safe LRU + TTL cache of complete search responses
 */
class ResultCache {
public:
    struct CacheEntry {
        SearchResponse data;
        std::chrono::steady_clock::time_point insertTime;
        std::chrono::steady_clock::time_point lastAccessTime;
        std::chrono::seconds ttl{0};
        size_t accessCount = 0;

        bool isExpired(std::chrono::steady_clock::time_point now) const {
            return (now - insertTime) > ttl;
        }
    };

    explicit ResultCache(const ResultCacheConfig& config = {});

    /**
     * @brief Get a cached response
     * @return nullopt if absent or expired; expired entries are removed
     */
    std::optional<SearchResponse> get(const CacheKey& key);

    /**
     * @brief Store a response; ttl of 0 uses the configured default
     */
    void put(const CacheKey& key, const SearchResponse& response,
             std::chrono::seconds ttl = std::chrono::seconds{0});

    bool contains(const CacheKey& key) const;
    void invalidate(const CacheKey& key);
    size_t invalidatePattern(const std::string& pattern);
    void clear();

    size_t size() const;
    size_t removeExpired();

    CacheStats getStats() const;
    void resetStats();

    void setConfig(const ResultCacheConfig& config);
    ResultCacheConfig getConfig() const;

private:
    using ListIterator = std::list<CacheKey>::iterator;

    void moveToFront(const CacheKey& key);
    void evictLRU();
    void eraseLocked(const CacheKey& key);

    mutable std::shared_mutex mutex_;
    ResultCacheConfig config_;

    std::list<CacheKey> lruList_; ///< front = most recently used
    std::unordered_map<CacheKey, ListIterator, CacheKeyHash> keyToListIter_;
    std::unordered_map<CacheKey, std::shared_ptr<CacheEntry>, CacheKeyHash> cache_;

    mutable CacheStats stats_;
};

} // namespace mvsearch::search
