#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <mvsearch/cache/embedding_cache.h>
#include <mvsearch/core/types.h>
#include <mvsearch/resilience/circuit_breaker.h>
#include <mvsearch/search/collaborators.h>
#include <mvsearch/search/diversity_filter.h>
#include <mvsearch/search/merge_strategy.h>
#include <mvsearch/search/result_cache.h>
#include <mvsearch/search/result_deduplicator.h>
#include <mvsearch/search/search_types.h>

namespace mvsearch::search {

/**
 * @brief Configuration for MultiVectorSearch
 *
 * Every field can be overridden at construction or later through updateConfig(). Merge strategy
 * and RRF constant can also be overridden per query.
 */
struct MultiVectorSearchConfig {
    // Declaration order doubles as the merge tie-break order
    std::vector<std::string> vectorTypes = defaultVectorTypes();
    std::map<std::string, double> vectorWeights = defaultVectorTypeWeights();

    MergeStrategyKind mergeStrategy = MergeStrategyKind::ReciprocalRankFusion;
    double rrfK = DEFAULT_RRF_K;
    double hybridRrfWeight = 0.6;
    double hybridWeightedWeight = 0.4;

    size_t maxResultsPerVector = DEFAULT_MAX_RESULTS_PER_VECTOR;
    std::chrono::milliseconds searchTimeout = DEFAULT_SEARCH_TIMEOUT; // per vector type
    bool enableParallelSearch = true;
    size_t maxConcurrency = 5; // minimum fan-out worker threads

    bool enableDeduplication = true;
    bool enableSourceAttribution = true;
    double diversityThreshold = DEFAULT_DIVERSITY_THRESHOLD;

    double performanceAlpha = 0.3; // EMA smoothing for per-type metrics

    ResultCacheConfig resultCache;
    DeduplicationConfig deduplication;
    resilience::CircuitBreaker::Config vectorStoreBreaker =
        resilience::CircuitBreaker::Config::vectorStore();
    resilience::CircuitBreaker::Config embeddingBreaker = resilience::CircuitBreaker::Config::llm();

    // Custom merge hook, used when mergeStrategy is Custom
    CustomMergeFn customMerge;
};

/**
 * @brief Running per-vector-type performance figures
 */
struct VectorTypePerformance {
    std::string vectorType;
    double averageLatencyMs = 0.0;   // EMA
    double averageResultCount = 0.0; // EMA
    double averageScore = 0.0;       // EMA
    uint64_t totalSearches = 0;
    uint64_t errorCount = 0;
    uint64_t timeoutCount = 0;
};

struct SearchHealth {
    bool healthy = false;
    bool embeddingProviderHealthy = false;
    bool vectorStoreHealthy = false;
    std::map<std::string, resilience::CircuitBreaker::State> breakerStates;
    double embeddingCacheHitRate = 0.0;
};

struct PerformanceReport {
    std::map<std::string, VectorTypePerformance> perType;
    std::optional<SearchTimings> lastSearch;
    uint64_t totalSearches = 0;
    uint64_t resultCacheHits = 0;
    DeduplicationStats deduplication;
    cache::EmbeddingCacheMetrics embeddingCache;
    CacheStats resultCache;
    std::map<std::string, resilience::CircuitBreaker::Stats> breakers;
};

/**
 * @brief Fans a query out over several vector types and fuses the rankings
 *
 * Pipeline: result cache, embedding (cache then provider), concurrent per-type search behind the
 * vector store breaker, merge, deduplicate, diversity filter, truncate. A failing or slow vector
 * type degrades the response; only an embedding failure or the failure of every type is
 * returned as an error.
 */
class MultiVectorSearch {
public:
    struct Dependencies {
        std::shared_ptr<IEmbeddingProvider> embeddingProvider;
        std::shared_ptr<IVectorStore> vectorStore;
        std::shared_ptr<cache::EmbeddingCache> embeddingCache;             // created if null
        std::shared_ptr<resilience::CircuitBreakerManager> breakerManager; // created if null
    };

    MultiVectorSearch(Dependencies deps, MultiVectorSearchConfig config = {});
    ~MultiVectorSearch();

    MultiVectorSearch(const MultiVectorSearch&) = delete;
    MultiVectorSearch& operator=(const MultiVectorSearch&) = delete;

    Result<SearchResponse> search(const SearchQuery& query);

    SearchHealth healthCheck();

    // Replaces the configuration and drops cached responses
    void updateConfig(const MultiVectorSearchConfig& config);
    MultiVectorSearchConfig getConfig() const;

    std::optional<SearchTimings> getLastSearchMetrics() const;
    std::map<std::string, VectorTypePerformance> getPerformanceMetrics() const;
    PerformanceReport getPerformanceReport() const;

    void clearCaches();

    cache::EmbeddingCache& embeddingCache() { return *embeddingCache_; }
    ResultDeduplicator& deduplicator() { return deduplicator_; }
    ResultCache& resultCache() { return resultCache_; }
    std::shared_ptr<resilience::CircuitBreaker> vectorStoreBreaker() const;
    std::shared_ptr<resilience::CircuitBreaker> embeddingBreaker() const;

private:
    struct TypeOutcome {
        VectorTypeResults results;
        VectorTypeMetrics metrics;
    };

    struct WorkerPool;

    // Current pool, replaced when it is too small or its workers are stuck on timed-out calls
    std::shared_ptr<WorkerPool> acquirePool(size_t needed, size_t minThreads);

    Result<Embedding> resolveEmbedding(const std::string& text, bool& fromCache);
    std::vector<TypeOutcome> fanOut(const std::vector<std::string>& types,
                                    std::shared_ptr<const Embedding> embedding, size_t perTypeLimit,
                                    const std::optional<nlohmann::json>& filter,
                                    const MultiVectorSearchConfig& config);
    void recordPerformance(const VectorTypeMetrics& metrics, double alpha);

    Dependencies deps_;
    std::shared_ptr<cache::EmbeddingCache> embeddingCache_;
    std::shared_ptr<resilience::CircuitBreakerManager> breakers_;
    std::shared_ptr<resilience::CircuitBreaker> vectorBreaker_;
    std::shared_ptr<resilience::CircuitBreaker> embeddingBreaker_;

    ResultCache resultCache_;
    ResultDeduplicator deduplicator_;
    std::mutex poolMutex_; // guards pool_, retiredPools_
    std::shared_ptr<WorkerPool> pool_;
    std::vector<std::shared_ptr<WorkerPool>> retiredPools_;

    mutable std::mutex mutex_; // guards config_, metrics
    MultiVectorSearchConfig config_;
    std::optional<SearchTimings> lastTimings_;
    std::map<std::string, VectorTypePerformance> performance_;

    std::atomic<uint64_t> totalSearches_{0};
    std::atomic<uint64_t> resultCacheHits_{0};
};

} // namespace mvsearch::search
