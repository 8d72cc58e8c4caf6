#include <mvsearch/cache/embedding_cache.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>

namespace mvsearch::cache {

namespace {

constexpr size_t TOP_ENTRY_COUNT = 10;
constexpr size_t SEMANTIC_HASH_BUCKETS = 16;
constexpr int EXPORT_FORMAT_VERSION = 1;

double secondsBetween(std::chrono::steady_clock::time_point from,
                      std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

std::vector<std::byte> toBytes(const Embedding& embedding) {
    std::vector<std::byte> bytes(embedding.size() * sizeof(float));
    if (!bytes.empty()) {
        std::memcpy(bytes.data(), embedding.data(), bytes.size());
    }
    return bytes;
}

} // namespace

std::optional<EvictionPolicy> parseEvictionPolicy(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "lru")
        return EvictionPolicy::LRU;
    if (lower == "lfu")
        return EvictionPolicy::LFU;
    if (lower == "priority")
        return EvictionPolicy::Priority;
    if (lower == "adaptive")
        return EvictionPolicy::Adaptive;
    return std::nullopt;
}

EmbeddingCache::EmbeddingCache(EmbeddingCacheConfig config) : config_(std::move(config)) {
    if (config_.enableCompression) {
        compressor_ = compression::createCompressor(compression::CompressionAlgorithm::Zstandard);
    }
    counters_.evictionPolicy = config_.evictionPolicy;
    if (config_.enableMaintenance) {
        startMaintenance();
    }
}

EmbeddingCache::~EmbeddingCache() {
    stopMaintenance();
}

// ===== Scoring helpers =====

std::chrono::seconds EmbeddingCache::computeAdaptiveTTL(uint64_t accessCount, double ageSeconds,
                                                        const EmbeddingCacheConfig& config) {
    if (!config.adaptiveTTL) {
        return config.baseTTL;
    }
    const double accessesPerSecond =
        static_cast<double>(accessCount) / std::max(ageSeconds, 1.0);
    const double multiplier = std::min(std::log(accessesPerSecond + 1.0) + 1.0, 3.0);
    double ttl = static_cast<double>(config.baseTTL.count()) * multiplier;
    ttl = std::min(ttl, static_cast<double>(config.maxTTL.count()));
    ttl = std::max(ttl, static_cast<double>(config.minTTL.count()));
    return std::chrono::seconds(static_cast<int64_t>(ttl));
}

double EmbeddingCache::computePriorityScore(uint64_t accessCount, double ageSeconds,
                                            double callerPriority) {
    const double ageHours = ageSeconds / 3600.0;
    const double recency = 1.0 / std::max(ageHours, 1e-3);
    const double accessesPerSecond =
        static_cast<double>(accessCount) / std::max(ageSeconds, 1.0);
    const double frequency = std::log(accessesPerSecond + 1.0);
    return recency * frequency * callerPriority;
}

double EmbeddingCache::cosineSimilarity(std::span<const float> a, std::span<const float> b) {
    if (a.empty() || a.size() != b.size()) {
        return 0.0;
    }
    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA == 0.0 || normB == 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(normA) * std::sqrt(normB));
}

std::string EmbeddingCache::contentHash(std::span<const float> embedding) {
    // FNV-1a over the raw float bytes
    uint64_t hash = 1469598103934665603ULL;
    const auto* bytes = reinterpret_cast<const unsigned char*>(embedding.data());
    for (size_t i = 0; i < embedding.size_bytes(); ++i) {
        hash ^= bytes[i];
        hash *= 1099511628211ULL;
    }
    return fmt::format("{:016x}", hash);
}

std::string EmbeddingCache::semanticHash(std::span<const float> embedding) {
    std::string hash;
    if (embedding.empty()) {
        return hash;
    }
    hash.reserve(SEMANTIC_HASH_BUCKETS);
    const double bucketSize = static_cast<double>(embedding.size()) / SEMANTIC_HASH_BUCKETS;
    for (size_t b = 0; b < SEMANTIC_HASH_BUCKETS; ++b) {
        auto start = static_cast<size_t>(std::floor(b * bucketSize));
        auto end = static_cast<size_t>(std::floor((b + 1) * bucketSize));
        double sum = 0.0;
        for (size_t i = start; i < end && i < embedding.size(); ++i) {
            sum += embedding[i];
        }
        // Normalization does not change the sign of a bucket sum
        hash.push_back(sum > 0.0 ? '1' : '0');
    }
    return hash;
}

// ===== Core Operations =====

std::optional<Embedding> EmbeddingCache::get(const std::string& key,
                                             const Embedding* queryEmbedding) {
    auto result = lookup(key, queryEmbedding);
    if (!result) {
        return std::nullopt;
    }
    return std::move(result->embedding);
}

std::optional<EmbeddingCache::LookupResult>
EmbeddingCache::lookup(const std::string& key, const Embedding* queryEmbedding) {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookupLocked(key, queryEmbedding);
}

std::optional<EmbeddingCache::LookupResult>
EmbeddingCache::lookupLocked(const std::string& key, const Embedding* queryEmbedding) {
    const auto now = std::chrono::steady_clock::now();
    counters_.totalRequests++;

    if (!config_.enabled) {
        counters_.misses++;
        return std::nullopt;
    }

    // 1. Exact key
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        if (it->second.isExpired(now)) {
            counters_.expirations++;
            eraseLocked(it);
        } else {
            touchLocked(it->second, now);
            auto embedding = materializeLocked(key, it->second);
            if (embedding) {
                counters_.hits++;
                return LookupResult{std::move(*embedding), LookupKind::Exact, 1.0, key};
            }
            eraseLocked(it);
        }
    }

    // 2. Semantic fallback
    if (queryEmbedding && !queryEmbedding->empty() && config_.enableSemanticLookup) {
        std::vector<std::string> dropped;
        std::string bestKey;
        Embedding bestEmbedding;
        double bestSimilarity = config_.semanticThreshold;
        bool found = false;

        for (const auto& [entryKey, entry] : entries_) {
            if (entry.isExpired(now)) {
                dropped.push_back(entryKey);
                continue;
            }
            // Scanning is not serving; only the returned vector counts as a decompression
            auto candidate = materializeLocked(entryKey, entry, false);
            if (!candidate) {
                dropped.push_back(entryKey);
                continue;
            }
            double similarity = cosineSimilarity(*queryEmbedding, *candidate);
            if (similarity > bestSimilarity) {
                bestSimilarity = similarity;
                bestKey = entryKey;
                bestEmbedding = std::move(*candidate);
                found = true;
            }
        }

        for (const auto& k : dropped) {
            auto dropIt = entries_.find(k);
            if (dropIt != entries_.end()) {
                if (dropIt->second.isExpired(now)) {
                    counters_.expirations++;
                }
                eraseLocked(dropIt);
            }
        }

        if (found) {
            auto bestIt = entries_.find(bestKey);
            if (bestIt != entries_.end()) {
                touchLocked(bestIt->second, now);
                if (bestIt->second.isCompressed) {
                    counters_.decompressions++;
                }
            }
            counters_.semanticHits++;
            spdlog::debug("Embedding cache semantic hit for '{}' via '{}' (similarity {:.3f})",
                          key, bestKey, bestSimilarity);
            return LookupResult{std::move(bestEmbedding), LookupKind::Semantic, bestSimilarity,
                                bestKey};
        }
    }

    counters_.misses++;
    return std::nullopt;
}

void EmbeddingCache::touchLocked(CacheEntry& entry, std::chrono::steady_clock::time_point now) {
    entry.accessCount++;
    entry.lastAccessed = now;
    entry.accessSequence = ++sequence_;
    if (config_.adaptiveTTL) {
        entry.ttl = computeAdaptiveTTL(entry.accessCount, secondsBetween(entry.createdAt, now),
                                       config_);
    }
}

Result<Embedding> EmbeddingCache::decodeLocked(const CacheEntry& entry) const {
    if (!entry.isCompressed) {
        return entry.embedding;
    }
    if (!compressor_) {
        return Error{ErrorCode::CacheError, "Entry is compressed but no compressor is available"};
    }

    const size_t expectedBytes = entry.dimension * sizeof(float);
    auto decompressed = compressor_->decompress(entry.compressed, expectedBytes);
    if (!decompressed) {
        return Error{ErrorCode::CacheError, decompressed.error().message};
    }
    const auto& bytes = decompressed.value();
    if (bytes.size() != expectedBytes) {
        return Error{ErrorCode::CacheError,
                     fmt::format("decompressed to {} bytes, expected {}", bytes.size(),
                                 expectedBytes)};
    }

    Embedding out(entry.dimension);
    if (expectedBytes > 0) {
        std::memcpy(out.data(), bytes.data(), expectedBytes);
    }
    return out;
}

std::optional<Embedding> EmbeddingCache::materializeLocked(const std::string& key,
                                                           const CacheEntry& entry,
                                                           bool countDecompression) {
    auto decoded = decodeLocked(entry);
    if (!decoded) {
        counters_.cacheErrors++;
        spdlog::warn("Embedding cache entry '{}' unreadable, treating as miss: {}", key,
                     decoded.error().message);
        return std::nullopt;
    }
    if (countDecompression && entry.isCompressed) {
        counters_.decompressions++;
    }
    return std::move(decoded).value();
}

void EmbeddingCache::set(const std::string& key, const Embedding& embedding,
                         const SetOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    insertLocked(key, embedding, options);
}

void EmbeddingCache::insertLocked(const std::string& key, const Embedding& embedding,
                                  const SetOptions& options) {
    if (!config_.enabled || config_.maxEntries == 0) {
        return;
    }

    const auto now = std::chrono::steady_clock::now();

    auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        eraseLocked(existing);
    }

    while (entries_.size() >= config_.maxEntries && !entries_.empty()) {
        evictOneLocked(now);
    }

    CacheEntry entry;
    entry.dimension = embedding.size();
    entry.createdAt = now;
    entry.lastAccessed = now;
    entry.accessSequence = ++sequence_;
    entry.accessCount = options.accessCount.value_or(1);
    entry.ttl = options.customTTL.value_or(config_.baseTTL);
    entry.priority = options.priority;
    entry.source = options.source;
    entry.contentHash = contentHash(embedding);
    entry.semanticHash = semanticHash(embedding);

    const size_t rawBytes = embedding.size() * sizeof(float);
    bool stored = false;
    if (compressor_ && rawBytes >= config_.compressionMinBytes && rawBytes > 0) {
        auto bytes = toBytes(embedding);
        auto compressed = compressor_->compress(bytes, config_.compressionLevel);
        if (!compressed) {
            counters_.cacheErrors++;
            spdlog::warn("Embedding cache compression failed for '{}', storing raw: {}", key,
                         compressed.error().message);
        } else if (compressed.value().compressedSize < rawBytes) {
            auto& value = compressed.value();
            compressedInputBytes_ += value.originalSize;
            compressedOutputBytes_ += value.compressedSize;
            counters_.compressions++;
            entry.compressed = std::move(value.data);
            entry.isCompressed = true;
            entry.byteSize = entry.compressed.size();
            stored = true;
        }
    }
    if (!stored) {
        entry.embedding = embedding;
        entry.byteSize = rawBytes;
    }

    memoryUsage_ += entry.byteSize + key.size();
    entries_.emplace(key, std::move(entry));
}

void EmbeddingCache::evictOneLocked(std::chrono::steady_clock::time_point now) {
    if (entries_.empty()) {
        return;
    }

    // Expired entries go first regardless of policy
    auto victim = std::find_if(entries_.begin(), entries_.end(),
                               [now](const auto& kv) { return kv.second.isExpired(now); });

    if (victim == entries_.end()) {
        switch (config_.evictionPolicy) {
            case EvictionPolicy::LRU:
                victim = std::min_element(entries_.begin(), entries_.end(),
                                          [](const auto& a, const auto& b) {
                                              return a.second.accessSequence <
                                                     b.second.accessSequence;
                                          });
                break;
            case EvictionPolicy::LFU:
                victim = std::min_element(
                    entries_.begin(), entries_.end(), [](const auto& a, const auto& b) {
                        if (a.second.accessCount != b.second.accessCount)
                            return a.second.accessCount < b.second.accessCount;
                        return a.second.accessSequence < b.second.accessSequence;
                    });
                break;
            case EvictionPolicy::Priority:
            case EvictionPolicy::Adaptive:
                victim = std::min_element(
                    entries_.begin(), entries_.end(), [now](const auto& a, const auto& b) {
                        double pa = computePriorityScore(a.second.accessCount,
                                                         secondsBetween(a.second.createdAt, now),
                                                         a.second.priority);
                        double pb = computePriorityScore(b.second.accessCount,
                                                         secondsBetween(b.second.createdAt, now),
                                                         b.second.priority);
                        if (pa != pb)
                            return pa < pb;
                        return a.second.accessSequence < b.second.accessSequence;
                    });
                break;
        }
    }

    spdlog::debug("Embedding cache evicting '{}' (policy={})", victim->first,
                  evictionPolicyToString(config_.evictionPolicy));
    counters_.evictions++;
    eraseLocked(victim);
}

void EmbeddingCache::eraseLocked(EntryMap::iterator it) {
    const size_t bytes = it->second.byteSize + it->first.size();
    memoryUsage_ = memoryUsage_ >= bytes ? memoryUsage_ - bytes : 0;
    entries_.erase(it);
}

bool EmbeddingCache::has(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    if (it->second.isExpired(std::chrono::steady_clock::now())) {
        counters_.expirations++;
        eraseLocked(it);
        return false;
    }
    return true;
}

bool EmbeddingCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    eraseLocked(it);
    return true;
}

void EmbeddingCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    memoryUsage_ = 0;
}

std::vector<std::optional<Embedding>>
EmbeddingCache::getBatch(const std::vector<std::string>& keys) {
    std::vector<std::optional<Embedding>> out;
    out.reserve(keys.size());
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& key : keys) {
        auto hit = lookupLocked(key, nullptr);
        out.push_back(hit ? std::optional<Embedding>(std::move(hit->embedding)) : std::nullopt);
    }
    return out;
}

void EmbeddingCache::setBatch(const std::vector<std::pair<std::string, Embedding>>& items,
                              const SetOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, embedding] : items) {
        insertLocked(key, embedding, options);
    }
}

size_t EmbeddingCache::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.isExpired(now)) {
            auto next = std::next(it);
            eraseLocked(it);
            it = next;
            ++removed;
        } else {
            ++it;
        }
    }
    counters_.expirations += removed;
    if (removed > 0) {
        spdlog::debug("Embedding cache cleanup removed {} expired entries", removed);
    }
    return removed;
}

size_t EmbeddingCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ===== Introspection =====

EmbeddingCacheMetrics EmbeddingCache::getMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    EmbeddingCacheMetrics m = counters_;
    m.size = entries_.size();
    m.memoryUsage = memoryUsage_;
    m.evictionPolicy = config_.evictionPolicy;
    if (m.totalRequests > 0) {
        m.hitRate = static_cast<double>(m.hits) / static_cast<double>(m.totalRequests);
        m.semanticHitRate =
            static_cast<double>(m.semanticHits) / static_cast<double>(m.totalRequests);
    }
    if (!entries_.empty()) {
        double totalTTL = 0.0;
        for (const auto& [key, entry] : entries_) {
            totalTTL += static_cast<double>(entry.ttl.count());
        }
        m.averageTTLSeconds = totalTTL / static_cast<double>(entries_.size());
    } else {
        m.averageTTLSeconds = static_cast<double>(config_.baseTTL.count());
    }
    if (compressedOutputBytes_ > 0) {
        m.compressionRatio = static_cast<double>(compressedInputBytes_) /
                             static_cast<double>(compressedOutputBytes_);
    }
    return m;
}

EmbeddingCacheStats EmbeddingCache::getStats() const {
    EmbeddingCacheStats stats;
    stats.metrics = getMetrics();

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    stats.topEntries.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        EmbeddingCacheEntryInfo info;
        info.key = key;
        info.accessCount = entry.accessCount;
        info.ageSeconds = secondsBetween(entry.createdAt, now);
        info.priorityScore = computePriorityScore(entry.accessCount, info.ageSeconds,
                                                  entry.priority);
        info.source = entry.source;
        info.compressed = entry.isCompressed;
        stats.topEntries.push_back(std::move(info));
    }
    std::sort(stats.topEntries.begin(), stats.topEntries.end(),
              [](const auto& a, const auto& b) {
                  if (a.priorityScore != b.priorityScore)
                      return a.priorityScore > b.priorityScore;
                  return a.key < b.key;
              });
    if (stats.topEntries.size() > TOP_ENTRY_COUNT) {
        stats.topEntries.resize(TOP_ENTRY_COUNT);
    }
    return stats;
}

std::optional<EmbeddingCache::CacheEntry> EmbeddingCache::inspect(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void EmbeddingCache::setEvictionPolicy(EvictionPolicy policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.evictionPolicy = policy;
    spdlog::info("Embedding cache eviction policy set to {}", evictionPolicyToString(policy));
}

EvictionPolicy EmbeddingCache::getEvictionPolicy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.evictionPolicy;
}

void EmbeddingCache::setEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.enabled = enabled;
}

bool EmbeddingCache::isEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.enabled;
}

// ===== Persistence =====

nlohmann::json EmbeddingCache::exportEntries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json out;
    out["version"] = EXPORT_FORMAT_VERSION;
    out["entries"] = nlohmann::json::array();

    const auto now = std::chrono::steady_clock::now();
    for (const auto& [key, entry] : entries_) {
        if (entry.isExpired(now)) {
            continue;
        }
        auto embedding = decodeLocked(entry);
        if (!embedding) {
            spdlog::warn("Skipping unreadable embedding cache entry '{}' on export: {}", key,
                         embedding.error().message);
            continue;
        }
        nlohmann::json j;
        j["key"] = key;
        j["embedding"] = embedding.value();
        j["priority"] = entry.priority;
        j["source"] = entry.source;
        j["ttl_seconds"] = entry.ttl.count();
        j["access_count"] = entry.accessCount;
        out["entries"].push_back(std::move(j));
    }
    return out;
}

Result<size_t> EmbeddingCache::importEntries(const nlohmann::json& data) {
    if (!data.is_object() || !data.contains("entries") || !data["entries"].is_array()) {
        return Error{ErrorCode::InvalidData, "Embedding cache export must contain 'entries'"};
    }

    size_t imported = 0;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        memoryUsage_ = 0;
        for (const auto& j : data["entries"]) {
            SetOptions options;
            options.priority = j.value("priority", 1.0);
            options.source = j.value("source", std::string("import"));
            if (j.contains("ttl_seconds")) {
                options.customTTL = std::chrono::seconds(j["ttl_seconds"].get<int64_t>());
            }
            if (j.contains("access_count")) {
                options.accessCount = j["access_count"].get<uint64_t>();
            }
            insertLocked(j.at("key").get<std::string>(), j.at("embedding").get<Embedding>(),
                         options);
            ++imported;
        }
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::ParseError,
                     fmt::format("Invalid embedding cache entry: {}", e.what())};
    }
    spdlog::info("Imported {} embedding cache entries", imported);
    return imported;
}

Result<void> EmbeddingCache::saveToDisk(const std::filesystem::path& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IOError,
                     fmt::format("Cannot open '{}' for writing", path.string())};
    }
    out << exportEntries().dump();
    if (!out) {
        return Error{ErrorCode::IOError, fmt::format("Failed writing '{}'", path.string())};
    }
    return {};
}

Result<size_t> EmbeddingCache::loadFromDisk(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, fmt::format("Cannot open '{}'", path.string())};
    }
    nlohmann::json data;
    try {
        in >> data;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::ParseError,
                     fmt::format("Failed to parse '{}': {}", path.string(), e.what())};
    }
    return importEntries(data);
}

// ===== Maintenance =====

void EmbeddingCache::setWarmer(Warmer warmer) {
    std::lock_guard<std::mutex> lock(mutex_);
    warmer_ = std::move(warmer);
}

void EmbeddingCache::startMaintenance() {
    std::lock_guard<std::mutex> lock(maintenanceMutex_);
    bool expected = false;
    if (!maintenanceRunning_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::debug("Embedding cache maintenance already running");
        return;
    }

    maintenancePool_ = std::make_unique<boost::asio::thread_pool>(1);
    maintenanceTimer_ = std::make_shared<boost::asio::steady_timer>(maintenancePool_->get_executor());

    spdlog::info("Starting embedding cache maintenance (interval={}ms, warmup_keys={})",
                 config_.maintenanceInterval.count(), config_.warmupKeys.size());

    boost::asio::co_spawn(maintenancePool_->get_executor(), maintenanceLoop(maintenanceTimer_),
                          boost::asio::detached);
}

void EmbeddingCache::stopMaintenance() {
    std::lock_guard<std::mutex> lock(maintenanceMutex_);
    bool expected = true;
    if (!maintenanceRunning_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    auto timer = maintenanceTimer_;
    boost::asio::post(*maintenancePool_, [timer]() { timer->cancel(); });
    maintenancePool_->join();
    maintenanceTimer_.reset();
    maintenancePool_.reset();
    spdlog::info("Embedding cache maintenance stopped");
}

bool EmbeddingCache::isMaintenanceRunning() const {
    return maintenanceRunning_.load(std::memory_order_acquire);
}

boost::asio::awaitable<void>
EmbeddingCache::maintenanceLoop(std::shared_ptr<boost::asio::steady_timer> timer) {
    while (maintenanceRunning_.load(std::memory_order_acquire)) {
        timer->expires_after(config_.maintenanceInterval);
        try {
            co_await timer->async_wait(boost::asio::use_awaitable);
        } catch (const boost::system::system_error& e) {
            if (e.code() == boost::asio::error::operation_aborted) {
                break;
            }
            spdlog::warn("Embedding cache maintenance timer error: {}", e.what());
            break;
        }
        if (!maintenanceRunning_.load(std::memory_order_acquire)) {
            break;
        }
        runMaintenance();
    }
    spdlog::debug("Embedding cache maintenance loop stopped");
    co_return;
}

size_t EmbeddingCache::runMaintenance() {
    const size_t expired = cleanup();
    const size_t warmed = warmMissing();
    if (warmed > 0) {
        spdlog::debug("Embedding cache warmed {} entries", warmed);
    }
    return expired;
}

size_t EmbeddingCache::warmMissing() {
    Warmer warmer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        warmer = warmer_;
    }
    if (!warmer) {
        return 0;
    }

    size_t warmed = 0;
    for (const auto& key : config_.warmupKeys) {
        if (has(key)) {
            continue;
        }
        auto embedding = warmer(key);
        if (!embedding) {
            continue;
        }
        SetOptions options;
        options.source = "warmup";
        set(key, *embedding, options);
        ++warmed;
    }
    return warmed;
}

} // namespace mvsearch::cache
