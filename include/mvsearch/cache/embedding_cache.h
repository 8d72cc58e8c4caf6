#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include <mvsearch/compression/compressor_interface.h>
#include <mvsearch/core/types.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json_fwd.hpp>

namespace mvsearch::cache {

enum class EvictionPolicy {
    LRU,      ///< Oldest last access first
    LFU,      ///< Lowest access count first
    Priority, ///< Lowest recency * frequency * caller priority first
    Adaptive  ///< Same score as Priority
};

constexpr const char* evictionPolicyToString(EvictionPolicy policy) {
    switch (policy) {
        case EvictionPolicy::LRU:
            return "lru";
        case EvictionPolicy::LFU:
            return "lfu";
        case EvictionPolicy::Priority:
            return "priority";
        case EvictionPolicy::Adaptive:
            return "adaptive";
    }
    return "lru";
}

std::optional<EvictionPolicy> parseEvictionPolicy(std::string_view name);

/**
 * @brief Configuration for the embedding cache
 */
struct EmbeddingCacheConfig {
    bool enabled = true;
    size_t maxEntries = 1000;              // embeddingCacheSize
    std::chrono::seconds baseTTL{3600};    // TTL before adaptive scaling
    std::chrono::seconds minTTL{300};
    std::chrono::seconds maxTTL{7200};
    bool adaptiveTTL = true;
    EvictionPolicy evictionPolicy = EvictionPolicy::Adaptive;

    bool enableCompression = true;
    uint8_t compressionLevel = 3;
    size_t compressionMinBytes = 256;      // smaller vectors are stored raw

    bool enableSemanticLookup = true;
    double semanticThreshold = 0.8;        // cosine similarity must exceed this

    bool enableMaintenance = false;        // periodic cleanup + warm-up task
    std::chrono::milliseconds maintenanceInterval{300000};
    std::vector<std::string> warmupKeys;
};

/**
 * @brief Snapshot of cache counters and derived rates
 */
struct EmbeddingCacheMetrics {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t semanticHits = 0;
    uint64_t evictions = 0;
    uint64_t expirations = 0;
    uint64_t compressions = 0;
    uint64_t decompressions = 0;
    uint64_t cacheErrors = 0;
    uint64_t totalRequests = 0;

    double hitRate = 0.0;
    double semanticHitRate = 0.0;
    size_t size = 0;
    size_t memoryUsage = 0;         // bytes, keys + stored vectors
    double averageTTLSeconds = 0.0;
    double compressionRatio = 0.0;  // original bytes / compressed bytes over all compressions
    EvictionPolicy evictionPolicy = EvictionPolicy::Adaptive;
};

struct EmbeddingCacheEntryInfo {
    std::string key;
    uint64_t accessCount = 0;
    double ageSeconds = 0.0;
    double priorityScore = 0.0;
    std::string source;
    bool compressed = false;
};

struct EmbeddingCacheStats {
    EmbeddingCacheMetrics metrics;
    std::vector<EmbeddingCacheEntryInfo> topEntries; // top 10 by priority score
};

// Per-entry options for EmbeddingCache::set
struct EmbeddingSetOptions {
    double priority = 1.0;
    std::string source = "default";
    std::optional<std::chrono::seconds> customTTL;
    std::optional<uint64_t> accessCount; // restored entries keep their history
};

/**
 * @brief Thread-safe embedding cache with adaptive TTL, compression and semantic fallback
 *
 * Entries satisfy now - createdAt <= ttl while present. Expired entries are dropped on access
 * and by cleanup().
 */
class EmbeddingCache {
public:
    struct CacheEntry {
        Embedding embedding;               // empty while compressed
        std::vector<std::byte> compressed;
        size_t dimension = 0;
        bool isCompressed = false;

        std::chrono::steady_clock::time_point createdAt;
        std::chrono::steady_clock::time_point lastAccessed;
        uint64_t accessSequence = 0;       // strictly increasing, orders LRU
        uint64_t accessCount = 1;
        std::chrono::seconds ttl{0};
        double priority = 1.0;
        std::string source;
        size_t byteSize = 0;
        std::string contentHash;
        std::string semanticHash;

        bool isExpired(std::chrono::steady_clock::time_point now) const {
            return now - createdAt > ttl;
        }
    };

    using SetOptions = EmbeddingSetOptions;

    enum class LookupKind { Exact, Semantic };

    struct LookupResult {
        Embedding embedding;
        LookupKind kind = LookupKind::Exact;
        double similarity = 1.0;
        std::string matchedKey;
    };

    // Produces an embedding for a warm-up key; nullopt skips the key
    using Warmer = std::function<std::optional<Embedding>(const std::string& key)>;

    explicit EmbeddingCache(EmbeddingCacheConfig config = {});
    ~EmbeddingCache();

    EmbeddingCache(const EmbeddingCache&) = delete;
    EmbeddingCache& operator=(const EmbeddingCache&) = delete;

    // ===== Core Operations =====

    /**
     * @brief Exact lookup, then semantic fallback when queryEmbedding is given
     * @return nullopt on miss
     */
    std::optional<Embedding> get(const std::string& key, const Embedding* queryEmbedding = nullptr);

    /**
     * @brief Same as get() but reports how the hit was found
     */
    std::optional<LookupResult> lookup(const std::string& key,
                                       const Embedding* queryEmbedding = nullptr);

    void set(const std::string& key, const Embedding& embedding, const SetOptions& options = {});

    // Live-entry check, no access metadata update
    bool has(const std::string& key);
    bool remove(const std::string& key);
    void clear();

    std::vector<std::optional<Embedding>> getBatch(const std::vector<std::string>& keys);
    void setBatch(const std::vector<std::pair<std::string, Embedding>>& items,
                  const SetOptions& options = {});

    /**
     * @brief Remove every expired entry
     * @return number of entries removed
     */
    size_t cleanup();

    size_t size() const;

    // ===== Introspection =====

    EmbeddingCacheMetrics getMetrics() const;
    EmbeddingCacheStats getStats() const;
    std::optional<CacheEntry> inspect(const std::string& key) const;

    void setEvictionPolicy(EvictionPolicy policy);
    EvictionPolicy getEvictionPolicy() const;

    void setEnabled(bool enabled);
    bool isEnabled() const;

    // ===== Persistence =====

    nlohmann::json exportEntries() const;
    Result<size_t> importEntries(const nlohmann::json& data);
    Result<void> saveToDisk(const std::filesystem::path& path) const;
    Result<size_t> loadFromDisk(const std::filesystem::path& path);

    // ===== Maintenance =====

    void setWarmer(Warmer warmer);
    void startMaintenance();
    void stopMaintenance();
    bool isMaintenanceRunning() const;

    // Cleanup followed by warm-up of missing configured keys
    size_t runMaintenance();

    // ===== Scoring helpers =====

    static std::chrono::seconds computeAdaptiveTTL(uint64_t accessCount, double ageSeconds,
                                                   const EmbeddingCacheConfig& config);
    static double computePriorityScore(uint64_t accessCount, double ageSeconds,
                                       double callerPriority);
    static double cosineSimilarity(std::span<const float> a, std::span<const float> b);
    static std::string contentHash(std::span<const float> embedding);
    static std::string semanticHash(std::span<const float> embedding);

private:
    using EntryMap = std::unordered_map<std::string, CacheEntry>;

    std::optional<LookupResult> lookupLocked(const std::string& key,
                                             const Embedding* queryEmbedding);
    void touchLocked(CacheEntry& entry, std::chrono::steady_clock::time_point now);
    Result<Embedding> decodeLocked(const CacheEntry& entry) const;
    std::optional<Embedding> materializeLocked(const std::string& key, const CacheEntry& entry,
                                               bool countDecompression = true);
    void insertLocked(const std::string& key, const Embedding& embedding,
                      const SetOptions& options);
    void evictOneLocked(std::chrono::steady_clock::time_point now);
    void eraseLocked(EntryMap::iterator it);
    size_t warmMissing();

    boost::asio::awaitable<void> maintenanceLoop(std::shared_ptr<boost::asio::steady_timer> timer);

    EmbeddingCacheConfig config_;
    std::unique_ptr<compression::ICompressor> compressor_;

    mutable std::mutex mutex_;
    EntryMap entries_;
    uint64_t sequence_ = 0;
    size_t memoryUsage_ = 0;
    uint64_t compressedInputBytes_ = 0;
    uint64_t compressedOutputBytes_ = 0;
    EmbeddingCacheMetrics counters_;

    Warmer warmer_;
    std::mutex maintenanceMutex_;
    std::atomic<bool> maintenanceRunning_{false};
    std::unique_ptr<boost::asio::thread_pool> maintenancePool_;
    std::shared_ptr<boost::asio::steady_timer> maintenanceTimer_;
};

} // namespace mvsearch::cache
