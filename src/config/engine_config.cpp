#include <mvsearch/config/config_helpers.h>
#include <mvsearch/config/engine_config.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>

namespace mvsearch::config {

namespace {

using Flat = std::map<std::string, std::string>;

const std::string* lookup(const Flat& kv, const std::string& key) {
    auto it = kv.find(key);
    if (it == kv.end() || it->second.empty())
        return nullptr;
    return &it->second;
}

void warnMalformed(const std::string& key, const std::string& value) {
    spdlog::warn("Config: ignoring malformed value '{}' for {}", value, key);
}

void readBool(const Flat& kv, const std::string& key, bool& out) {
    if (const auto* raw = lookup(kv, key)) {
        if (auto v = parse_bool(*raw))
            out = *v;
        else
            warnMalformed(key, *raw);
    }
}

void readDouble(const Flat& kv, const std::string& key, double& out) {
    if (const auto* raw = lookup(kv, key)) {
        if (auto v = parse_double(*raw))
            out = *v;
        else
            warnMalformed(key, *raw);
    }
}

template <typename T> void readCount(const Flat& kv, const std::string& key, T& out) {
    if (const auto* raw = lookup(kv, key)) {
        auto v = parse_int(*raw);
        if (v && *v >= 0)
            out = static_cast<T>(*v);
        else
            warnMalformed(key, *raw);
    }
}

void readMs(const Flat& kv, const std::string& key, std::chrono::milliseconds& out) {
    if (const auto* raw = lookup(kv, key)) {
        if (auto v = parse_ms(*raw))
            out = *v;
        else
            warnMalformed(key, *raw);
    }
}

void readSeconds(const Flat& kv, const std::string& key, std::chrono::seconds& out) {
    if (const auto* raw = lookup(kv, key)) {
        auto v = parse_int(*raw);
        if (v && *v >= 0)
            out = std::chrono::seconds(*v);
        else
            warnMalformed(key, *raw);
    }
}

void readList(const Flat& kv, const std::string& key, std::vector<std::string>& out) {
    if (const auto* raw = lookup(kv, key)) {
        auto list = parse_string_list(*raw);
        if (!list.empty())
            out = std::move(list);
        else
            warnMalformed(key, *raw);
    }
}

void readBreaker(const Flat& kv, const std::string& section,
                 resilience::CircuitBreaker::Config& breaker) {
    const std::string prefix = "breaker." + section + ".";
    breaker.name = section;
    readCount(kv, prefix + "failure_threshold", breaker.failureThreshold);
    readMs(kv, prefix + "reset_timeout_ms", breaker.resetTimeout);
    readMs(kv, prefix + "call_timeout_ms", breaker.callTimeout);
    readDouble(kv, prefix + "error_threshold_percentage", breaker.errorThresholdPercentage);
    readCount(kv, prefix + "volume_threshold", breaker.volumeThreshold);
    readMs(kv, prefix + "rolling_window_ms", breaker.rollingWindow);
}

std::optional<search::ScoreMergePolicy> parseScoreMergePolicy(const std::string& raw) {
    std::string v = raw;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "max")
        return search::ScoreMergePolicy::Max;
    if (v == "sum")
        return search::ScoreMergePolicy::Sum;
    if (v == "follow" || v == "follow_merge_strategy")
        return search::ScoreMergePolicy::FollowMergeStrategy;
    return std::nullopt;
}

bool inUnitRange(double v) {
    return v >= 0.0 && v <= 1.0;
}

} // namespace

EngineConfig engineConfigFromFlat(const Flat& kv) {
    EngineConfig config;
    auto& s = config.search;

    // [search]
    readList(kv, "search.vector_types", s.vectorTypes);
    if (const auto* raw = lookup(kv, "search.merge_strategy")) {
        if (auto strategy = search::parseMergeStrategy(*raw))
            s.mergeStrategy = *strategy;
        else
            warnMalformed("search.merge_strategy", *raw);
    }
    readDouble(kv, "search.rrf_k", s.rrfK);
    readDouble(kv, "search.hybrid_rrf_weight", s.hybridRrfWeight);
    readDouble(kv, "search.hybrid_weighted_weight", s.hybridWeightedWeight);
    readCount(kv, "search.max_results_per_vector", s.maxResultsPerVector);
    readMs(kv, "search.search_timeout_ms", s.searchTimeout);
    readBool(kv, "search.parallel", s.enableParallelSearch);
    readCount(kv, "search.max_concurrency", s.maxConcurrency);
    readBool(kv, "search.deduplication", s.enableDeduplication);
    readBool(kv, "search.source_attribution", s.enableSourceAttribution);
    readDouble(kv, "search.diversity_threshold", s.diversityThreshold);
    readDouble(kv, "search.performance_alpha", s.performanceAlpha);

    // [search.weights] type = weight
    const std::string weightPrefix = "search.weights.";
    for (auto it = kv.lower_bound(weightPrefix);
         it != kv.end() && it->first.compare(0, weightPrefix.size(), weightPrefix) == 0; ++it) {
        if (auto w = parse_double(it->second))
            s.vectorWeights[it->first.substr(weightPrefix.size())] = *w;
        else
            warnMalformed(it->first, it->second);
    }

    // [embedding_cache]
    auto& ec = config.embeddingCache;
    readBool(kv, "embedding_cache.enabled", ec.enabled);
    readCount(kv, "embedding_cache.max_entries", ec.maxEntries);
    readSeconds(kv, "embedding_cache.base_ttl_seconds", ec.baseTTL);
    readSeconds(kv, "embedding_cache.min_ttl_seconds", ec.minTTL);
    readSeconds(kv, "embedding_cache.max_ttl_seconds", ec.maxTTL);
    readBool(kv, "embedding_cache.adaptive_ttl", ec.adaptiveTTL);
    if (const auto* raw = lookup(kv, "embedding_cache.eviction_policy")) {
        if (auto policy = cache::parseEvictionPolicy(*raw))
            ec.evictionPolicy = *policy;
        else
            warnMalformed("embedding_cache.eviction_policy", *raw);
    }
    readBool(kv, "embedding_cache.compression", ec.enableCompression);
    readCount(kv, "embedding_cache.compression_level", ec.compressionLevel);
    readCount(kv, "embedding_cache.compression_min_bytes", ec.compressionMinBytes);
    readBool(kv, "embedding_cache.semantic_lookup", ec.enableSemanticLookup);
    readDouble(kv, "embedding_cache.semantic_threshold", ec.semanticThreshold);
    readBool(kv, "embedding_cache.maintenance", ec.enableMaintenance);
    readMs(kv, "embedding_cache.maintenance_interval_ms", ec.maintenanceInterval);
    readList(kv, "embedding_cache.warmup_keys", ec.warmupKeys);

    // [result_cache]
    auto& rc = s.resultCache;
    readBool(kv, "result_cache.enabled", rc.enabled);
    readCount(kv, "result_cache.max_entries", rc.maxEntries);
    readSeconds(kv, "result_cache.ttl_seconds", rc.defaultTTL);

    // [dedup]
    auto& dd = s.deduplication;
    readBool(kv, "dedup.enabled", dd.enabled);
    if (const auto* raw = lookup(kv, "dedup.strategies")) {
        std::vector<search::DetectionStrategy> strategies;
        for (const auto& name : parse_string_list(*raw)) {
            if (auto strategy = search::parseDetectionStrategy(name))
                strategies.push_back(*strategy);
            else
                warnMalformed("dedup.strategies", name);
        }
        if (!strategies.empty())
            dd.strategies = std::move(strategies);
    }
    readDouble(kv, "dedup.content_threshold", dd.contentSimilarityThreshold);
    readDouble(kv, "dedup.fuzzy_threshold", dd.fuzzyThreshold);
    readDouble(kv, "dedup.name_weight", dd.nameWeight);
    readDouble(kv, "dedup.description_weight", dd.descriptionWeight);
    if (const auto* raw = lookup(kv, "dedup.score_merge")) {
        if (auto policy = parseScoreMergePolicy(*raw))
            dd.scoreMergePolicy = *policy;
        else
            warnMalformed("dedup.score_merge", *raw);
    }
    readCount(kv, "dedup.max_comparison_items", dd.maxComparisonItems);
    readBool(kv, "dedup.similarity_cache", dd.enableSimilarityCache);
    readCount(kv, "dedup.similarity_cache_size", dd.similarityCacheSize);
    readSeconds(kv, "dedup.similarity_cache_ttl_seconds", dd.similarityCacheTTL);

    // [breaker.*]
    readBreaker(kv, "vector_store", s.vectorStoreBreaker);
    readBreaker(kv, "embedding", s.embeddingBreaker);
    readBreaker(kv, "document_store", config.documentStoreBreaker);

    return config;
}

void applyEnvironmentOverrides(EngineConfig& config) {
    if (const char* env = std::getenv("MVSEARCH_MERGE_STRATEGY"); env && *env) {
        if (auto strategy = search::parseMergeStrategy(env)) {
            config.search.mergeStrategy = *strategy;
            spdlog::info("Using MVSEARCH_MERGE_STRATEGY={}", search::mergeStrategyToString(*strategy));
        } else {
            spdlog::warn("Invalid MVSEARCH_MERGE_STRATEGY '{}', keeping {}", env,
                         search::mergeStrategyToString(config.search.mergeStrategy));
        }
    }

    if (const char* env = std::getenv("MVSEARCH_SEARCH_TIMEOUT_MS"); env && *env) {
        auto ms = parse_ms(env);
        if (ms && ms->count() > 0) {
            config.search.searchTimeout = *ms;
            spdlog::info("Using MVSEARCH_SEARCH_TIMEOUT_MS={}", ms->count());
        } else {
            spdlog::warn("Invalid MVSEARCH_SEARCH_TIMEOUT_MS '{}', using default", env);
        }
    }

    if (env_truthy(std::getenv("MVSEARCH_DISABLE_CACHE"))) {
        config.embeddingCache.enabled = false;
        config.search.resultCache.enabled = false;
        spdlog::info("Caching disabled by MVSEARCH_DISABLE_CACHE");
    }

    if (const char* env = std::getenv("MVSEARCH_PARALLEL"); env && *env) {
        config.search.enableParallelSearch = env_truthy(env);
    }
}

Result<void> EngineConfig::validate() const {
    const auto& s = search;
    if (s.vectorTypes.empty()) {
        return Error{ErrorCode::InvalidArgument, "search.vector_types must not be empty"};
    }
    if (!(s.rrfK > 0.0)) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("search.rrf_k must be > 0, got {}", s.rrfK)};
    }
    if (s.maxResultsPerVector == 0) {
        return Error{ErrorCode::InvalidArgument, "search.max_results_per_vector must be > 0"};
    }
    if (s.searchTimeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "search.search_timeout_ms must be > 0"};
    }
    if (!inUnitRange(s.diversityThreshold) || !inUnitRange(s.performanceAlpha)) {
        return Error{ErrorCode::InvalidArgument,
                     "search.diversity_threshold and search.performance_alpha must be in [0, 1]"};
    }
    for (const auto& [type, weight] : s.vectorWeights) {
        if (weight < 0.0) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("search.weights.{} must not be negative", type)};
        }
    }

    const auto& ec = embeddingCache;
    if (ec.maxEntries < 100 || ec.maxEntries > 10000) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("embedding_cache.max_entries must be in [100, 10000], got {}",
                                 ec.maxEntries)};
    }
    if (ec.baseTTL.count() < 60 || ec.baseTTL.count() > 86400) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("embedding_cache.base_ttl_seconds must be in [60, 86400], got {}",
                                 ec.baseTTL.count())};
    }
    if (ec.minTTL >= ec.maxTTL) {
        return Error{ErrorCode::InvalidArgument,
                     "embedding_cache.min_ttl_seconds must be below max_ttl_seconds"};
    }
    if (!inUnitRange(ec.semanticThreshold)) {
        return Error{ErrorCode::InvalidArgument, "embedding_cache.semantic_threshold must be in [0, 1]"};
    }

    const auto& dd = s.deduplication;
    if (!inUnitRange(dd.contentSimilarityThreshold) || !inUnitRange(dd.fuzzyThreshold)) {
        return Error{ErrorCode::InvalidArgument, "dedup thresholds must be in [0, 1]"};
    }

    for (const auto* breaker : {&s.vectorStoreBreaker, &s.embeddingBreaker, &documentStoreBreaker}) {
        if (breaker->failureThreshold == 0) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("breaker.{}.failure_threshold must be > 0", breaker->name)};
        }
        if (breaker->errorThresholdPercentage < 0.0 || breaker->errorThresholdPercentage > 100.0) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("breaker.{}.error_threshold_percentage must be in [0, 100]",
                                     breaker->name)};
        }
    }

    return {};
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path) {
    const bool explicitPath = !path.empty();
    const auto resolved = explicitPath ? expand_tilde(path.string()) : get_config_path();

    std::error_code ec;
    const bool exists = std::filesystem::exists(resolved, ec);
    if (!exists && explicitPath) {
        return Error{ErrorCode::NotFound, fmt::format("Config file not found: {}", resolved.string())};
    }

    EngineConfig config;
    if (exists) {
        config = engineConfigFromFlat(parse_simple_toml_flat(resolved));
        config.sourcePath = resolved;
        spdlog::info("Loaded config from {}", resolved.string());
    } else {
        spdlog::debug("No config at {}, using defaults", resolved.string());
    }

    applyEnvironmentOverrides(config);

    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    return config;
}

void registerBreakers(const EngineConfig& config, resilience::CircuitBreakerManager& manager) {
    manager.getOrCreate("vector_store", config.search.vectorStoreBreaker);
    manager.getOrCreate("embedding", config.search.embeddingBreaker);
    manager.getOrCreate("document_store", config.documentStoreBreaker);
}

} // namespace mvsearch::config
