#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <mvsearch/config/engine_config.h>

using namespace mvsearch;
using namespace mvsearch::config;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ =
            fs::temp_directory_path() / ("mvsearch_engine_config_" + std::to_string(::getpid()));
        fs::create_directories(testDir_);
        for (const char* var : kEnvVars) {
            ::unsetenv(var);
        }
    }

    void TearDown() override {
        for (const char* var : kEnvVars) {
            ::unsetenv(var);
        }
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    fs::path writeConfig(const std::string& content) {
        auto path = testDir_ / "config.toml";
        std::ofstream out(path);
        out << content;
        return path;
    }

    static constexpr const char* kEnvVars[] = {"MVSEARCH_MERGE_STRATEGY",
                                               "MVSEARCH_SEARCH_TIMEOUT_MS",
                                               "MVSEARCH_DISABLE_CACHE", "MVSEARCH_PARALLEL"};
    fs::path testDir_;
};

// ===== Defaults =====

TEST_F(EngineConfigTest, DefaultsValidate) {
    EngineConfig config;
    EXPECT_TRUE(config.validate().has_value());
    EXPECT_EQ(config.search.vectorTypes.size(), 5u);
    EXPECT_EQ(config.search.mergeStrategy, search::MergeStrategyKind::ReciprocalRankFusion);
    EXPECT_DOUBLE_EQ(config.search.rrfK, 60.0);
    EXPECT_EQ(config.search.searchTimeout, 5000ms);
    EXPECT_EQ(config.embeddingCache.maxEntries, 1000u);
}

// ===== Flat Parsing =====

TEST_F(EngineConfigTest, ReadsAllSections) {
    std::map<std::string, std::string> kv = {
        {"search.vector_types", "[\"semantic\", \"aliases\"]"},
        {"search.merge_strategy", "hybrid"},
        {"search.rrf_k", "30"},
        {"search.search_timeout_ms", "1200"},
        {"search.parallel", "false"},
        {"search.diversity_threshold", "0.5"},
        {"search.weights.semantic", "0.9"},
        {"search.weights.tags", "0.2"},
        {"embedding_cache.max_entries", "500"},
        {"embedding_cache.eviction_policy", "lfu"},
        {"embedding_cache.semantic_threshold", "0.9"},
        {"result_cache.ttl_seconds", "60"},
        {"dedup.strategies", "exact_id, fuzzy-match"},
        {"dedup.score_merge", "max"},
        {"breaker.vector_store.failure_threshold", "9"},
        {"breaker.embedding.reset_timeout_ms", "2500"},
    };

    auto config = engineConfigFromFlat(kv);
    const auto& s = config.search;
    ASSERT_EQ(s.vectorTypes.size(), 2u);
    EXPECT_EQ(s.vectorTypes[1], "aliases");
    EXPECT_EQ(s.mergeStrategy, search::MergeStrategyKind::Hybrid);
    EXPECT_DOUBLE_EQ(s.rrfK, 30.0);
    EXPECT_EQ(s.searchTimeout, 1200ms);
    EXPECT_FALSE(s.enableParallelSearch);
    EXPECT_DOUBLE_EQ(s.diversityThreshold, 0.5);
    EXPECT_DOUBLE_EQ(s.vectorWeights.at("semantic"), 0.9);
    EXPECT_DOUBLE_EQ(s.vectorWeights.at("tags"), 0.2);

    EXPECT_EQ(config.embeddingCache.maxEntries, 500u);
    EXPECT_EQ(config.embeddingCache.evictionPolicy, cache::EvictionPolicy::LFU);
    EXPECT_DOUBLE_EQ(config.embeddingCache.semanticThreshold, 0.9);
    EXPECT_EQ(s.resultCache.defaultTTL, std::chrono::seconds(60));

    ASSERT_EQ(s.deduplication.strategies.size(), 2u);
    EXPECT_EQ(s.deduplication.strategies[0], search::DetectionStrategy::ExactId);
    EXPECT_EQ(s.deduplication.strategies[1], search::DetectionStrategy::FuzzyMatch);
    EXPECT_EQ(s.deduplication.scoreMergePolicy, search::ScoreMergePolicy::Max);

    EXPECT_EQ(s.vectorStoreBreaker.failureThreshold, 9u);
    EXPECT_EQ(s.vectorStoreBreaker.name, "vector_store");
    EXPECT_EQ(s.embeddingBreaker.resetTimeout, 2500ms);
    EXPECT_EQ(s.embeddingBreaker.name, "embedding");

    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(EngineConfigTest, MalformedValuesKeepDefaults) {
    std::map<std::string, std::string> kv = {
        {"search.merge_strategy", "borda"},
        {"search.rrf_k", "sixty"},
        {"search.parallel", "sometimes"},
        {"search.max_results_per_vector", "-4"},
        {"embedding_cache.eviction_policy", "random"},
        {"dedup.score_merge", "avg"},
    };

    auto config = engineConfigFromFlat(kv);
    EXPECT_EQ(config.search.mergeStrategy, search::MergeStrategyKind::ReciprocalRankFusion);
    EXPECT_DOUBLE_EQ(config.search.rrfK, 60.0);
    EXPECT_TRUE(config.search.enableParallelSearch);
    EXPECT_EQ(config.search.maxResultsPerVector, 20u);
    EXPECT_EQ(config.embeddingCache.evictionPolicy, cache::EvictionPolicy::Adaptive);
    EXPECT_EQ(config.search.deduplication.scoreMergePolicy,
              search::ScoreMergePolicy::FollowMergeStrategy);
}

// ===== Validation =====

TEST_F(EngineConfigTest, ValidateRejectsOutOfRange) {
    {
        EngineConfig config;
        config.search.rrfK = 0.0;
        auto r = config.validate();
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    }
    {
        EngineConfig config;
        config.search.vectorTypes.clear();
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        EngineConfig config;
        config.search.diversityThreshold = 1.5;
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        EngineConfig config;
        config.embeddingCache.maxEntries = 50;
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        EngineConfig config;
        config.embeddingCache.minTTL = std::chrono::seconds(8000);
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        EngineConfig config;
        config.search.vectorWeights["semantic"] = -1.0;
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        EngineConfig config;
        config.documentStoreBreaker.failureThreshold = 0;
        EXPECT_FALSE(config.validate().has_value());
    }
}

// ===== Environment Overrides =====

TEST_F(EngineConfigTest, EnvironmentOverrides) {
    ::setenv("MVSEARCH_MERGE_STRATEGY", "weighted", 1);
    ::setenv("MVSEARCH_SEARCH_TIMEOUT_MS", "750", 1);
    ::setenv("MVSEARCH_DISABLE_CACHE", "1", 1);
    ::setenv("MVSEARCH_PARALLEL", "0", 1);

    EngineConfig config;
    applyEnvironmentOverrides(config);
    EXPECT_EQ(config.search.mergeStrategy, search::MergeStrategyKind::WeightedAverage);
    EXPECT_EQ(config.search.searchTimeout, 750ms);
    EXPECT_FALSE(config.embeddingCache.enabled);
    EXPECT_FALSE(config.search.resultCache.enabled);
    EXPECT_FALSE(config.search.enableParallelSearch);
}

TEST_F(EngineConfigTest, InvalidEnvironmentValuesIgnored) {
    ::setenv("MVSEARCH_MERGE_STRATEGY", "nonsense", 1);
    ::setenv("MVSEARCH_SEARCH_TIMEOUT_MS", "0", 1);

    EngineConfig config;
    applyEnvironmentOverrides(config);
    EXPECT_EQ(config.search.mergeStrategy, search::MergeStrategyKind::ReciprocalRankFusion);
    EXPECT_EQ(config.search.searchTimeout, 5000ms);
}

// ===== Loading =====

TEST_F(EngineConfigTest, LoadsFromFile) {
    auto path = writeConfig(R"(
[search]
merge_strategy = "weighted_average"
max_results_per_vector = 15

[result_cache]
enabled = false
)");

    auto result = loadEngineConfig(path);
    ASSERT_TRUE(result.has_value());
    const auto& config = result.value();
    EXPECT_EQ(config.search.mergeStrategy, search::MergeStrategyKind::WeightedAverage);
    EXPECT_EQ(config.search.maxResultsPerVector, 15u);
    EXPECT_FALSE(config.search.resultCache.enabled);
    EXPECT_EQ(config.sourcePath, path);
}

TEST_F(EngineConfigTest, MissingExplicitPathIsNotFound) {
    auto result = loadEngineConfig(testDir_ / "absent.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(EngineConfigTest, InvalidFileFailsValidation) {
    auto path = writeConfig("[search]\nrrf_k = -5\n");
    auto result = loadEngineConfig(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

TEST_F(EngineConfigTest, RegisterBreakersUsesConfiguredValues) {
    auto config = engineConfigFromFlat({{"breaker.document_store.failure_threshold", "7"},
                                        {"breaker.vector_store.failure_threshold", "9"}});
    resilience::CircuitBreakerManager manager;
    registerBreakers(config, manager);

    EXPECT_EQ(manager.size(), 3u);
    ASSERT_NE(manager.get("document_store"), nullptr);
    EXPECT_EQ(manager.get("document_store")->getConfig().failureThreshold, 7u);
    EXPECT_EQ(manager.get("vector_store")->getConfig().failureThreshold, 9u);
    EXPECT_EQ(manager.get("embedding")->getConfig().failureThreshold,
              config.search.embeddingBreaker.failureThreshold);
}
