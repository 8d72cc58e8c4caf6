#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace mvsearch::search {

/**
 * @brief Counters for the query result cache
 *
 * Updated lock-free from the cache's read path. Copies are point-in-time snapshots.
 */
struct CacheStats {
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> insertions{0};
    std::atomic<uint64_t> evictions{0};      // capacity pressure only
    std::atomic<uint64_t> ttlExpirations{0}; // on read or removeExpired()
    std::atomic<uint64_t> invalidations{0};  // explicit keys plus pattern matches
    std::atomic<uint64_t> patternInvalidations{0};
    std::atomic<uint64_t> totalAccessTime{0}; // microseconds across all lookups

    std::atomic<size_t> currentSize{0};
    size_t maxSize = 0;

    CacheStats() = default;
    CacheStats(const CacheStats& other) { copyFrom(other); }
    CacheStats& operator=(const CacheStats& other) {
        if (this != &other)
            copyFrom(other);
        return *this;
    }

    uint64_t lookups() const { return hits.load() + misses.load(); }

    double hitRate() const {
        const uint64_t total = lookups();
        return total == 0 ? 0.0 : static_cast<double>(hits.load()) / static_cast<double>(total);
    }

    double fillRatio() const {
        return maxSize == 0 ? 0.0
                            : static_cast<double>(currentSize.load()) / static_cast<double>(maxSize);
    }

    std::chrono::microseconds avgAccessTime() const {
        const uint64_t total = lookups();
        return std::chrono::microseconds(total == 0 ? 0 : totalAccessTime.load() / total);
    }

    // Counters only; size and capacity describe the live cache
    void reset() {
        for (auto* counter : {&hits, &misses, &insertions, &evictions, &ttlExpirations,
                              &invalidations, &patternInvalidations, &totalAccessTime}) {
            counter->store(0);
        }
    }

private:
    void copyFrom(const CacheStats& other) {
        hits.store(other.hits.load());
        misses.store(other.misses.load());
        insertions.store(other.insertions.load());
        evictions.store(other.evictions.load());
        ttlExpirations.store(other.ttlExpirations.load());
        invalidations.store(other.invalidations.load());
        patternInvalidations.store(other.patternInvalidations.load());
        totalAccessTime.store(other.totalAccessTime.load());
        currentSize.store(other.currentSize.load());
        maxSize = other.maxSize;
    }
};

} // namespace mvsearch::search
