#include <gtest/gtest.h>

#include <thread>
#include <mvsearch/search/result_cache.h>

using namespace mvsearch::search;
using namespace std::chrono_literals;

class ResultCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.maxEntries = 10;
        config_.defaultTTL = 60s;
        config_.enableStatistics = true;
        cache_ = std::make_unique<ResultCache>(config_);
    }

    static CacheKey key(const std::string& text, size_t limit = 10) {
        return CacheKey::fromQuery(text, limit, std::nullopt, {"semantic", "aliases"},
                                   MergeStrategyKind::ReciprocalRankFusion, 60.0);
    }

    static SearchResponse createTestResponse(size_t numResults) {
        SearchResponse response;
        for (size_t i = 0; i < numResults; ++i) {
            MergedItem item;
            item.id = "item_" + std::to_string(i);
            item.combinedScore = 1.0 - static_cast<double>(i) * 0.1;
            response.items.push_back(item);
        }
        response.contributingTypes = {"semantic"};
        return response;
    }

    ResultCacheConfig config_;
    std::unique_ptr<ResultCache> cache_;
};

// ===== Cache Key Tests =====

TEST_F(ResultCacheTest, KeyNormalizesTextAndTypeOrder) {
    auto a = CacheKey::fromQuery("  JSON   Parser ", 10, std::nullopt, {"semantic", "aliases"},
                                 MergeStrategyKind::ReciprocalRankFusion, 60.0);
    auto b = CacheKey::fromQuery("json parser", 10, std::nullopt, {"aliases", "semantic", "aliases"},
                                 MergeStrategyKind::ReciprocalRankFusion, 60.0);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_EQ(a.getComponents().queryText, "json parser");
    EXPECT_EQ(a.getComponents().vectorTypes.size(), 2u);
}

TEST_F(ResultCacheTest, KeyDistinguishesParameters) {
    auto base = key("query");
    EXPECT_NE(base, key("query", 20));
    EXPECT_NE(base, CacheKey::fromQuery("query", 10, std::nullopt, {"semantic", "aliases"},
                                        MergeStrategyKind::Hybrid, 60.0));
    EXPECT_NE(base, CacheKey::fromQuery("query", 10, std::nullopt, {"semantic", "aliases"},
                                        MergeStrategyKind::ReciprocalRankFusion, 30.0));

    nlohmann::json filter = {{"category", "editor"}};
    EXPECT_NE(base, CacheKey::fromQuery("query", 10, filter, {"semantic", "aliases"},
                                        MergeStrategyKind::ReciprocalRankFusion, 60.0));
}

TEST_F(ResultCacheTest, KeyFilterIsCanonical) {
    nlohmann::json f1 = nlohmann::json::parse(R"({"b": 1, "a": 2})");
    nlohmann::json f2 = nlohmann::json::parse(R"({"a": 2, "b": 1})");
    auto k1 = CacheKey::fromQuery("q", 10, f1, {"semantic"}, MergeStrategyKind::Hybrid, 60.0);
    auto k2 = CacheKey::fromQuery("q", 10, f2, {"semantic"}, MergeStrategyKind::Hybrid, 60.0);
    EXPECT_EQ(k1, k2);
}

TEST_F(ResultCacheTest, KeyPatternMatching) {
    auto k = key("vector search");
    EXPECT_TRUE(k.matchesPattern("*"));
    EXPECT_TRUE(k.matchesPattern("q:vector*"));
    EXPECT_TRUE(k.matchesPattern("*search*"));
    EXPECT_TRUE(k.matchesPattern("vector"));
    EXPECT_FALSE(k.matchesPattern("q:other*"));
}

// ===== Basic Operations Tests =====

TEST_F(ResultCacheTest, PutAndGet) {
    auto k = key("test query");
    cache_->put(k, createTestResponse(5));

    auto cached = cache_->get(k);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->items.size(), 5u);
    EXPECT_EQ(cached->items[0].id, "item_0");
}

TEST_F(ResultCacheTest, CacheMiss) {
    EXPECT_FALSE(cache_->get(key("missing")).has_value());
    EXPECT_EQ(cache_->getStats().misses.load(), 1u);
}

TEST_F(ResultCacheTest, Invalidate) {
    auto k = key("to invalidate");
    cache_->put(k, createTestResponse(3));
    EXPECT_TRUE(cache_->contains(k));

    cache_->invalidate(k);
    EXPECT_FALSE(cache_->contains(k));
    EXPECT_EQ(cache_->getStats().invalidations.load(), 1u);
}

TEST_F(ResultCacheTest, Clear) {
    for (int i = 0; i < 5; ++i) {
        cache_->put(key("query " + std::to_string(i)), createTestResponse(3));
    }
    EXPECT_EQ(cache_->size(), 5u);

    cache_->clear();
    EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(ResultCacheTest, DisabledCacheIsInert) {
    config_.enabled = false;
    cache_->setConfig(config_);
    auto k = key("query");
    cache_->put(k, createTestResponse(1));
    EXPECT_FALSE(cache_->get(k).has_value());
    EXPECT_EQ(cache_->size(), 0u);
}

// ===== TTL Tests =====

TEST_F(ResultCacheTest, TTLExpiration) {
    auto k = key("expiring query");
    cache_->put(k, createTestResponse(3), 1s);
    EXPECT_TRUE(cache_->contains(k));

    std::this_thread::sleep_for(1100ms);

    EXPECT_FALSE(cache_->contains(k));
    EXPECT_FALSE(cache_->get(k).has_value());
    auto stats = cache_->getStats();
    EXPECT_EQ(stats.ttlExpirations.load(), 1u);
    EXPECT_EQ(cache_->size(), 0u);
}

TEST_F(ResultCacheTest, RemoveExpired) {
    auto key1 = key("query1");
    auto key2 = key("query2");
    cache_->put(key1, createTestResponse(1), 1s);
    cache_->put(key2, createTestResponse(1), 10s);

    std::this_thread::sleep_for(1100ms);

    EXPECT_EQ(cache_->removeExpired(), 1u);
    EXPECT_EQ(cache_->size(), 1u);
    EXPECT_TRUE(cache_->contains(key2));
}

// ===== LRU Eviction Tests =====

TEST_F(ResultCacheTest, LRUEviction) {
    config_.maxEntries = 3;
    cache_ = std::make_unique<ResultCache>(config_);

    auto key1 = key("query1");
    auto key2 = key("query2");
    auto key3 = key("query3");
    cache_->put(key1, createTestResponse(1));
    cache_->put(key2, createTestResponse(1));
    cache_->put(key3, createTestResponse(1));

    // Access key1 to make it most recently used
    ASSERT_TRUE(cache_->get(key1).has_value());

    auto key4 = key("query4");
    cache_->put(key4, createTestResponse(1));

    EXPECT_EQ(cache_->size(), 3u);
    EXPECT_TRUE(cache_->contains(key1));
    EXPECT_FALSE(cache_->contains(key2));
    EXPECT_TRUE(cache_->contains(key3));
    EXPECT_TRUE(cache_->contains(key4));
    EXPECT_EQ(cache_->getStats().evictions.load(), 1u);
}

TEST_F(ResultCacheTest, ShrinkingCapacityEvicts) {
    for (int i = 0; i < 5; ++i) {
        cache_->put(key("query" + std::to_string(i)), createTestResponse(1));
    }
    config_.maxEntries = 2;
    cache_->setConfig(config_);
    EXPECT_EQ(cache_->size(), 2u);
    EXPECT_TRUE(cache_->contains(key("query4")));
}

// ===== Pattern Invalidation Tests =====

TEST_F(ResultCacheTest, InvalidatePattern) {
    cache_->put(key("rust parser"), createTestResponse(1));
    cache_->put(key("rust linter"), createTestResponse(1));
    cache_->put(key("python formatter"), createTestResponse(1));

    EXPECT_EQ(cache_->invalidatePattern("q:rust*"), 2u);
    EXPECT_EQ(cache_->size(), 1u);
    EXPECT_TRUE(cache_->contains(key("python formatter")));

    auto stats = cache_->getStats();
    EXPECT_EQ(stats.patternInvalidations.load(), 1u);
    EXPECT_EQ(stats.invalidations.load(), 2u);
}

// ===== Statistics Tests =====

TEST_F(ResultCacheTest, HitRate) {
    auto k = key("stats query");
    cache_->put(k, createTestResponse(1));

    cache_->get(k);
    cache_->get(k);
    cache_->get(key("other"));

    auto stats = cache_->getStats();
    EXPECT_EQ(stats.hits.load(), 2u);
    EXPECT_EQ(stats.misses.load(), 1u);
    EXPECT_NEAR(stats.hitRate(), 2.0 / 3.0, 1e-9);

    cache_->resetStats();
    EXPECT_EQ(cache_->getStats().hits.load(), 0u);
}

// ===== Thread Safety Tests =====

TEST_F(ResultCacheTest, ConcurrentAccess) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 50; ++i) {
                auto k = key("q" + std::to_string((t * 50 + i) % 20));
                if (!cache_->get(k)) {
                    cache_->put(k, createTestResponse(2));
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_LE(cache_->size(), config_.maxEntries);
}
