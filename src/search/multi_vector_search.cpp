#include <mvsearch/search/multi_vector_search.h>
#include <mvsearch/search/cache_key.h>
#include <mvsearch/search/vector_types.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>

namespace mvsearch::search {

namespace {

using Clock = std::chrono::steady_clock;

double msSince(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

struct TaskResult {
    Result<std::vector<ScoredItem>> result;
    double latencyMs = 0.0;
};

// Hand-off between one posted per-type search and the request thread waiting on it
struct TypeTask {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<Clock::time_point> startedAt;
    std::optional<TaskResult> result;
    bool cancelled = false; // waiter gave up before the task started
    bool abandoned = false; // waiter gave up while the task was running
};

VectorTypeStatus statusFor(const Error& error) {
    switch (error.code) {
        case ErrorCode::CircuitOpen:
            return VectorTypeStatus::CircuitOpen;
        case ErrorCode::Timeout:
            return VectorTypeStatus::TimedOut;
        default:
            return VectorTypeStatus::Failed;
    }
}

MergeOptions mergeOptionsFrom(const MultiVectorSearchConfig& config, double rrfK) {
    MergeOptions options;
    options.rrfK = rrfK;
    options.weights = config.vectorWeights;
    options.hybridRrfWeight = config.hybridRrfWeight;
    options.hybridWeightedWeight = config.hybridWeightedWeight;
    return options;
}

// Breakers are registered under the dependency they guard, whatever preset they came from
resilience::CircuitBreaker::Config named(resilience::CircuitBreaker::Config config,
                                         const char* name) {
    config.name = name;
    return config;
}

} // namespace

struct MultiVectorSearch::WorkerPool {
    explicit WorkerPool(size_t n) : threads(n), pool(n) {}

    const size_t threads;
    boost::asio::thread_pool pool;
    // Shared with posted tasks, which may finish after the pool is retired
    std::shared_ptr<std::atomic<size_t>> pending = std::make_shared<std::atomic<size_t>>(0);
    std::shared_ptr<std::atomic<size_t>> stuck = std::make_shared<std::atomic<size_t>>(0);
};

// ============================================================================
// MultiVectorSearch Implementation
// ============================================================================

MultiVectorSearch::MultiVectorSearch(Dependencies deps, MultiVectorSearchConfig config)
    : deps_(std::move(deps)), resultCache_(config.resultCache),
      deduplicator_(config.deduplication), config_(std::move(config)) {
    embeddingCache_ = deps_.embeddingCache ? deps_.embeddingCache
                                           : std::make_shared<cache::EmbeddingCache>();
    breakers_ = deps_.breakerManager ? deps_.breakerManager
                                     : std::make_shared<resilience::CircuitBreakerManager>();

    auto vectorConfig = named(config_.vectorStoreBreaker, "vector_store");
    auto embeddingConfig = named(config_.embeddingBreaker, "embedding");
    vectorBreaker_ = breakers_->getOrCreate(vectorConfig.name, vectorConfig);
    embeddingBreaker_ = breakers_->getOrCreate(embeddingConfig.name, embeddingConfig);

    pool_ = std::make_shared<WorkerPool>(
        std::max<size_t>({1, config_.maxConcurrency, config_.vectorTypes.size()}));

    spdlog::debug("MultiVectorSearch initialized: {} vector types, strategy={}, timeout={}ms",
                  config_.vectorTypes.size(), mergeStrategyToString(config_.mergeStrategy),
                  config_.searchTimeout.count());
}

MultiVectorSearch::~MultiVectorSearch() {
    std::lock_guard<std::mutex> lock(poolMutex_);
    if (pool_) {
        retiredPools_.push_back(std::move(pool_));
    }
    // Queued searches are dropped; running ones finish against their own shared state.
    // A vector store call that never returns blocks here.
    for (auto& worker : retiredPools_) {
        worker->pool.stop();
    }
    for (auto& worker : retiredPools_) {
        worker->pool.join();
    }
}

std::shared_ptr<MultiVectorSearch::WorkerPool> MultiVectorSearch::acquirePool(size_t needed,
                                                                              size_t minThreads) {
    std::lock_guard<std::mutex> lock(poolMutex_);

    // A retired pool is only reachable from here once no search holds it
    for (auto it = retiredPools_.begin(); it != retiredPools_.end();) {
        if (it->use_count() == 1 && (*it)->pending->load() == 0) {
            (*it)->pool.join();
            it = retiredPools_.erase(it);
        } else {
            ++it;
        }
    }

    const size_t stuck = pool_->stuck->load();
    if (pool_->threads >= needed + stuck) {
        return pool_;
    }

    const size_t threads = std::max<size_t>({1, minThreads, needed});
    if (stuck > 0) {
        spdlog::warn("Replacing fan-out pool: {} of {} workers stuck on timed-out searches", stuck,
                     pool_->threads);
    } else {
        spdlog::debug("Growing fan-out pool from {} to {} workers", pool_->threads, threads);
    }
    retiredPools_.push_back(std::move(pool_));
    pool_ = std::make_shared<WorkerPool>(threads);
    return pool_;
}

std::shared_ptr<resilience::CircuitBreaker> MultiVectorSearch::vectorStoreBreaker() const {
    return vectorBreaker_;
}

std::shared_ptr<resilience::CircuitBreaker> MultiVectorSearch::embeddingBreaker() const {
    return embeddingBreaker_;
}

Result<SearchResponse> MultiVectorSearch::search(const SearchQuery& query) {
    const auto startTime = Clock::now();

    if (!deps_.embeddingProvider || !deps_.vectorStore) {
        return Error{ErrorCode::InvalidState,
                     "MultiVectorSearch requires an embedding provider and a vector store"};
    }
    if (query.text.empty() || isBlank(query.text)) {
        return Error{ErrorCode::InvalidArgument, "Query text is empty"};
    }
    if (query.limit == 0) {
        return Error{ErrorCode::InvalidArgument, "Query limit must be positive"};
    }

    MultiVectorSearchConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
    }

    const auto& requested = query.vectorTypes.empty() ? config.vectorTypes : query.vectorTypes;
    const auto types = canonicalVectorTypeOrder(config.vectorTypes, requested);
    if (types.empty()) {
        return Error{ErrorCode::InvalidArgument, "No vector types to search"};
    }

    const MergeStrategyKind strategy = query.mergeStrategy.value_or(config.mergeStrategy);
    const double rrfK = query.rrfK.value_or(config.rrfK);
    if (!(rrfK > 0.0)) {
        return Error{ErrorCode::InvalidArgument, fmt::format("RRF constant must be > 0, got {}", rrfK)};
    }

    // Step 1: result cache
    const auto key = CacheKey::fromQuery(query.text, query.limit, query.filter, types, strategy, rrfK);
    if (auto cached = resultCache_.get(key)) {
        resultCacheHits_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Result cache hit for '{}'", query.text);
        cached->fromCache = true;
        return std::move(*cached);
    }

    totalSearches_.fetch_add(1, std::memory_order_relaxed);
    SearchResponse response;
    response.strategy = strategy;

    // Step 2: query embedding
    auto embedStart = Clock::now();
    bool embeddingFromCache = false;
    auto embedding = resolveEmbedding(query.text, embeddingFromCache);
    response.timings.embeddingMs = msSince(embedStart);
    if (!embedding) {
        spdlog::error("Search aborted, embedding failed for '{}': {}", query.text,
                      embedding.error().message);
        return embedding.error();
    }
    response.embeddingFromCache = embeddingFromCache;

    // Steps 3-4: per-type fan-out
    const size_t perTypeLimit = std::max<size_t>(
        1, std::min(query.limit * 2, config.maxResultsPerVector));
    auto searchStart = Clock::now();
    auto outcomes = fanOut(types, std::make_shared<const Embedding>(std::move(embedding).value()),
                           perTypeLimit, query.filter, config);
    response.timings.searchMs = msSince(searchStart);

    std::vector<VectorTypeResults> lists;
    lists.reserve(outcomes.size());
    for (auto& outcome : outcomes) {
        recordPerformance(outcome.metrics, config.performanceAlpha);
        switch (outcome.metrics.status) {
            case VectorTypeStatus::Success:
                response.contributingTypes.push_back(outcome.metrics.vectorType);
                lists.push_back(std::move(outcome.results));
                break;
            case VectorTypeStatus::TimedOut:
                response.timedOutTypes.push_back(outcome.metrics.vectorType);
                break;
            case VectorTypeStatus::Failed:
            case VectorTypeStatus::CircuitOpen:
                response.failedTypes.push_back(outcome.metrics.vectorType);
                break;
        }
        response.perTypeMetrics.push_back(std::move(outcome.metrics));
    }

    if (response.contributingTypes.empty()) {
        spdlog::error("Search failed for '{}': all {} vector types failed", query.text,
                      types.size());
        return Error{ErrorCode::VectorStoreError,
                     fmt::format("All {} vector types failed ({} failed, {} timed out)",
                                 types.size(), response.failedTypes.size(),
                                 response.timedOutTypes.size())};
    }

    // Step 5: merge
    auto mergeStart = Clock::now();
    auto merger = createMergeStrategy(strategy, mergeOptionsFrom(config, rrfK), config.customMerge);
    auto merged = merger->merge(lists);
    response.timings.mergeMs = msSince(mergeStart);

    // Step 6: deduplicate
    auto dedupStart = Clock::now();
    if (config.enableDeduplication) {
        auto dedup = deduplicator_.detectDuplicates(merged, strategy);
        response.duplicatesRemoved = dedup.duplicatesRemoved;
        merged = std::move(dedup.uniqueItems);
    }
    response.timings.dedupMs = msSince(dedupStart);

    // Step 7: diversity
    auto diversityStart = Clock::now();
    auto diverse = applyDiversityFilter(merged, config.diversityThreshold);
    response.timings.diversityMs = msSince(diversityStart);

    // Step 8: truncate and cache
    if (diverse.size() > query.limit) {
        diverse.resize(query.limit);
    }
    if (!config.enableSourceAttribution) {
        for (auto& item : diverse) {
            item.sources.clear();
        }
    }
    response.items = std::move(diverse);
    response.timings.totalMs = msSince(startTime);
    response.totalTimeMs = response.timings.totalMs;

    if (response.isDegraded()) {
        // Degraded responses are not cached so recovery shows up on the next call
        spdlog::warn("Degraded search for '{}': {} failed, {} timed out", query.text,
                     response.failedTypes.size(), response.timedOutTypes.size());
    } else {
        resultCache_.put(key, response);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastTimings_ = response.timings;
    }

    spdlog::debug("Search '{}' -> {} items in {:.2f}ms (embed {:.2f}, search {:.2f}, merge {:.2f}, "
                  "dedup {:.2f})",
                  query.text, response.items.size(), response.timings.totalMs,
                  response.timings.embeddingMs, response.timings.searchMs,
                  response.timings.mergeMs, response.timings.dedupMs);
    return response;
}

Result<Embedding> MultiVectorSearch::resolveEmbedding(const std::string& text, bool& fromCache) {
    fromCache = false;

    // Exact text only; paraphrases must not borrow another query's vector
    if (embeddingCache_->isEnabled()) {
        if (auto hit = embeddingCache_->get(text)) {
            spdlog::debug("Embedding cache hit for '{}'", text);
            fromCache = true;
            return std::move(*hit);
        }
    }

    auto provider = deps_.embeddingProvider;
    auto generated = embeddingBreaker_->execute(
        [&provider, &text]() -> Result<Embedding> { return provider->embed(text); });
    if (!generated) {
        return Error{ErrorCode::EmbeddingError,
                     fmt::format("Embedding generation failed: {}", generated.error().message)};
    }
    if (generated.value().empty()) {
        return Error{ErrorCode::EmbeddingError, "Embedding provider returned an empty vector"};
    }

    if (embeddingCache_->isEnabled()) {
        cache::EmbeddingCache::SetOptions options;
        options.source = "query";
        embeddingCache_->set(text, generated.value(), options);
    }
    return generated;
}

std::vector<MultiVectorSearch::TypeOutcome>
MultiVectorSearch::fanOut(const std::vector<std::string>& types,
                          std::shared_ptr<const Embedding> embedding, size_t perTypeLimit,
                          const std::optional<nlohmann::json>& filter,
                          const MultiVectorSearchConfig& config) {
    // Everything a task touches is owned by the task so an abandoned one outlives this call
    auto store = deps_.vectorStore;
    auto breaker = vectorBreaker_;
    auto filterPtr = filter ? std::make_shared<const nlohmann::json>(*filter) : nullptr;

    auto runOne = [store, breaker, embedding, perTypeLimit,
                   filterPtr](const std::string& type) -> TaskResult {
        const auto start = Clock::now();
        auto result = breaker->execute([&]() -> Result<std::vector<ScoredItem>> {
            return store->searchVectorType(*embedding, type, perTypeLimit, filterPtr.get());
        });
        return TaskResult{std::move(result), msSince(start)};
    };

    auto finish = [](const std::string& type, TaskResult task) {
        TypeOutcome outcome;
        outcome.results.vectorType = type;
        outcome.metrics.vectorType = type;
        outcome.metrics.latencyMs = task.latencyMs;

        if (!task.result) {
            const auto& error = task.result.error();
            outcome.metrics.status = statusFor(error);
            outcome.metrics.error = error.message;
            spdlog::warn("Vector type '{}' search failed ({}): {}", type, error.code,
                         error.message);
            return outcome;
        }

        auto items = std::move(task.result).value();
        double scoreSum = 0.0;
        for (size_t i = 0; i < items.size(); ++i) {
            items[i].rank = i + 1;
            items[i].vectorType = type;
            scoreSum += items[i].score;
        }
        outcome.metrics.status = VectorTypeStatus::Success;
        outcome.metrics.resultCount = items.size();
        outcome.metrics.averageScore = items.empty() ? 0.0 : scoreSum / items.size();
        outcome.results.items = std::move(items);
        spdlog::debug("Vector type '{}': {} results in {:.2f}ms", type,
                      outcome.metrics.resultCount, outcome.metrics.latencyMs);
        return outcome;
    };

    auto timedOut = [&config](const std::string& type, bool started) {
        const auto timeoutMs = config.searchTimeout.count();
        spdlog::warn("Vector type '{}' timed out after {} ms{}", type, timeoutMs,
                     started ? "" : " waiting for a worker");
        TypeOutcome outcome;
        outcome.results.vectorType = type;
        outcome.metrics.vectorType = type;
        outcome.metrics.status = VectorTypeStatus::TimedOut;
        outcome.metrics.latencyMs = static_cast<double>(timeoutMs);
        outcome.metrics.error = fmt::format("Timed out after {} ms", timeoutMs);
        return outcome;
    };

    const bool sequential = !config.enableParallelSearch;
    std::shared_ptr<WorkerPool> worker;

    auto postTask = [&](const std::string& type) {
        auto task = std::make_shared<TypeTask>();
        auto pending = worker->pending;
        auto stuck = worker->stuck;
        pending->fetch_add(1);
        boost::asio::post(worker->pool, [task, runOne, type, pending, stuck]() {
            {
                std::lock_guard<std::mutex> lock(task->mutex);
                if (task->cancelled) {
                    pending->fetch_sub(1);
                    return;
                }
                task->startedAt = Clock::now();
            }
            task->cv.notify_all();

            TaskResult outcome = runOne(type);
            bool abandoned = false;
            {
                std::lock_guard<std::mutex> lock(task->mutex);
                task->result = std::move(outcome);
                abandoned = task->abandoned;
            }
            task->cv.notify_all();
            if (abandoned) {
                stuck->fetch_sub(1);
            }
            pending->fetch_sub(1);
        });
        return std::make_pair(task, Clock::now());
    };

    // The deadline runs from the moment the search starts on a worker; time spent queued is
    // bounded separately by the same timeout
    auto awaitTask = [&](const std::string& type, TypeTask& task, Clock::time_point postedAt) {
        std::unique_lock<std::mutex> lock(task.mutex);
        if (!task.cv.wait_until(lock, postedAt + config.searchTimeout,
                                [&task] { return task.startedAt.has_value(); })) {
            task.cancelled = true;
            return timedOut(type, false);
        }
        if (!task.cv.wait_until(lock, *task.startedAt + config.searchTimeout,
                                [&task] { return task.result.has_value(); })) {
            task.abandoned = true;
            worker->stuck->fetch_add(1);
            return timedOut(type, true);
        }
        TaskResult result = std::move(*task.result);
        lock.unlock();
        return finish(type, std::move(result));
    };

    std::vector<TypeOutcome> outcomes;
    outcomes.reserve(types.size());

    if (sequential) {
        for (const auto& type : types) {
            worker = acquirePool(1, config.maxConcurrency);
            auto [task, postedAt] = postTask(type);
            outcomes.push_back(awaitTask(type, *task, postedAt));
        }
        return outcomes;
    }

    worker = acquirePool(types.size(), config.maxConcurrency);
    std::vector<std::pair<std::shared_ptr<TypeTask>, Clock::time_point>> posted;
    posted.reserve(types.size());
    for (const auto& type : types) {
        posted.push_back(postTask(type));
    }
    for (size_t i = 0; i < types.size(); ++i) {
        outcomes.push_back(awaitTask(types[i], *posted[i].first, posted[i].second));
    }
    return outcomes;
}

void MultiVectorSearch::recordPerformance(const VectorTypeMetrics& metrics, double alpha) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& perf = performance_[metrics.vectorType];
    perf.vectorType = metrics.vectorType;
    perf.totalSearches++;

    if (metrics.status == VectorTypeStatus::TimedOut) {
        perf.timeoutCount++;
    } else if (metrics.status != VectorTypeStatus::Success) {
        perf.errorCount++;
    }

    const double count = static_cast<double>(metrics.resultCount);
    if (perf.totalSearches == 1) {
        perf.averageLatencyMs = metrics.latencyMs;
        perf.averageResultCount = count;
        perf.averageScore = metrics.averageScore;
        return;
    }
    perf.averageLatencyMs = alpha * metrics.latencyMs + (1.0 - alpha) * perf.averageLatencyMs;
    perf.averageResultCount = alpha * count + (1.0 - alpha) * perf.averageResultCount;
    perf.averageScore = alpha * metrics.averageScore + (1.0 - alpha) * perf.averageScore;
}

SearchHealth MultiVectorSearch::healthCheck() {
    SearchHealth health;

    auto checkDependency = [](const char* name, auto& dependency) {
        if (!dependency)
            return false;
        try {
            return dependency->healthCheck();
        } catch (const std::exception& e) {
            spdlog::warn("{} health check threw: {}", name, e.what());
            return false;
        } catch (...) {
            spdlog::warn("{} health check threw a non-standard exception", name);
            return false;
        }
    };

    health.embeddingProviderHealthy = checkDependency("Embedding provider", deps_.embeddingProvider);
    health.vectorStoreHealthy = checkDependency("Vector store", deps_.vectorStore);

    bool anyOpen = false;
    for (const auto& [name, stats] : breakers_->getAllStats()) {
        health.breakerStates[name] = stats.state;
        anyOpen = anyOpen || stats.state == resilience::CircuitBreaker::State::Open;
    }
    health.embeddingCacheHitRate = embeddingCache_->getMetrics().hitRate;
    health.healthy = health.embeddingProviderHealthy && health.vectorStoreHealthy && !anyOpen;
    return health;
}

void MultiVectorSearch::updateConfig(const MultiVectorSearchConfig& config) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
    }
    deduplicator_.updateConfig(config.deduplication);
    resultCache_.setConfig(config.resultCache);
    resultCache_.clear();
    spdlog::info("MultiVectorSearch config updated: strategy={}, {} vector types",
                 mergeStrategyToString(config.mergeStrategy), config.vectorTypes.size());
}

MultiVectorSearchConfig MultiVectorSearch::getConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

std::optional<SearchTimings> MultiVectorSearch::getLastSearchMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastTimings_;
}

std::map<std::string, VectorTypePerformance> MultiVectorSearch::getPerformanceMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return performance_;
}

PerformanceReport MultiVectorSearch::getPerformanceReport() const {
    PerformanceReport report;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        report.perType = performance_;
        report.lastSearch = lastTimings_;
    }
    report.totalSearches = totalSearches_.load(std::memory_order_relaxed);
    report.resultCacheHits = resultCacheHits_.load(std::memory_order_relaxed);
    report.deduplication = deduplicator_.getStats();
    report.embeddingCache = embeddingCache_->getMetrics();
    report.resultCache = resultCache_.getStats();
    report.breakers = breakers_->getAllStats();
    return report;
}

void MultiVectorSearch::clearCaches() {
    resultCache_.clear();
    embeddingCache_->clear();
    deduplicator_.clearCache();
    spdlog::info("MultiVectorSearch caches cleared");
}

} // namespace mvsearch::search
