#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <mvsearch/cache/embedding_cache.h>
#include <mvsearch/core/types.h>
#include <mvsearch/resilience/circuit_breaker.h>
#include <mvsearch/search/multi_vector_search.h>

namespace mvsearch::config {

/**
 * @brief Complete engine configuration as read from config.toml
 *
 * Recognized sections: [search], [search.weights], [embedding_cache], [result_cache], [dedup],
 * [breaker.vector_store], [breaker.embedding], [breaker.document_store]. Unknown keys are ignored
 * and malformed values keep their default.
 */
struct EngineConfig {
    search::MultiVectorSearchConfig search;
    cache::EmbeddingCacheConfig embeddingCache;
    resilience::CircuitBreaker::Config documentStoreBreaker =
        resilience::CircuitBreaker::Config::documentStore();

    std::filesystem::path sourcePath; // empty when built from defaults

    // Range checks on the values a config file can set
    Result<void> validate() const;
};

/**
 * @brief Load configuration from path, or from get_config_path() when path is empty
 *
 * A missing default config file yields the defaults; a missing explicit path is NotFound.
 * Environment overrides are applied last and the result is validated.
 */
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path = {});

// Build a configuration from already-flattened "section.key" pairs
EngineConfig engineConfigFromFlat(const std::map<std::string, std::string>& kv);

/**
 * @brief Apply MVSEARCH_MERGE_STRATEGY, MVSEARCH_SEARCH_TIMEOUT_MS, MVSEARCH_DISABLE_CACHE and
 * MVSEARCH_PARALLEL
 */
void applyEnvironmentOverrides(EngineConfig& config);

/**
 * @brief Register the vector_store, embedding and document_store breakers from config
 *
 * Pass the same manager to MultiVectorSearch so it picks up these instances. Breakers that
 * already exist keep their original config.
 */
void registerBreakers(const EngineConfig& config, resilience::CircuitBreakerManager& manager);

} // namespace mvsearch::config
