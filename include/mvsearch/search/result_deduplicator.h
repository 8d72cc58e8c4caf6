#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <mvsearch/core/types.h>
#include <mvsearch/search/search_types.h>

namespace mvsearch::search {

/**
 * @brief Built-in pairwise duplicate detection strategies
 */
enum class DetectionStrategy {
    ExactId,           ///< Identical item identifier
    ExactUrl,          ///< Identical payload url (or website)
    ContentSimilarity, ///< Name exact-match signal plus description Jaccard
    VersionAware,      ///< Names equal once a trailing version token is stripped
    FuzzyMatch,        ///< Edit distance on name plus description similarity
    Custom             ///< User-registered rule
};

constexpr const char* detectionStrategyToString(DetectionStrategy strategy) {
    switch (strategy) {
        case DetectionStrategy::ExactId:
            return "exact_id";
        case DetectionStrategy::ExactUrl:
            return "exact_url";
        case DetectionStrategy::ContentSimilarity:
            return "content_similarity";
        case DetectionStrategy::VersionAware:
            return "version_aware";
        case DetectionStrategy::FuzzyMatch:
            return "fuzzy_match";
        case DetectionStrategy::Custom:
            return "custom";
    }
    return "custom";
}

std::optional<DetectionStrategy> parseDetectionStrategy(std::string_view name);

enum class DuplicateType { Exact, Near, Versioned, Partial };

constexpr const char* duplicateTypeToString(DuplicateType type) {
    switch (type) {
        case DuplicateType::Exact:
            return "exact";
        case DuplicateType::Near:
            return "near";
        case DuplicateType::Versioned:
            return "versioned";
        case DuplicateType::Partial:
            return "partial";
    }
    return "partial";
}

// >= 0.95 exact, >= 0.8 near, >= 0.6 versioned, otherwise partial
DuplicateType duplicateTypeForScore(double similarity);

/**
 * @brief How a duplicate's combined score folds into the kept item
 */
enum class ScoreMergePolicy {
    Max,                ///< Keep the larger combined score
    Sum,                ///< Add the scores so consensus across groups is rewarded
    FollowMergeStrategy ///< Sum when the merge stage used RRF, Max otherwise
};

struct DuplicateMatch {
    bool isDuplicate = false;
    double similarityScore = 0.0;
    double confidence = 0.0;
    DetectionStrategy detectedBy = DetectionStrategy::ExactId;
    std::string detectedByLabel; // rule label, equals the strategy string for built-ins
    DuplicateType duplicateType = DuplicateType::Partial;
};

/**
 * @brief User-registered detection rule, ordered together with the built-ins by priority
 */
struct DuplicateRule {
    using Predicate = std::function<bool(const MergedItem&, const MergedItem&)>;

    std::string id;
    std::string name;
    std::string strategyLabel = "custom";
    int priority = 0; // higher runs first
    bool enabled = true;
    DuplicateType duplicateType = DuplicateType::Near;
    Predicate predicate;
};

struct DeduplicationConfig {
    bool enabled = true;
    std::vector<DetectionStrategy> strategies = {
        DetectionStrategy::ExactId, DetectionStrategy::ExactUrl,
        DetectionStrategy::ContentSimilarity, DetectionStrategy::VersionAware,
        DetectionStrategy::FuzzyMatch};

    double contentSimilarityThreshold = 0.85;
    double fuzzyThreshold = 0.7;
    double nameWeight = 0.7;
    double descriptionWeight = 0.3;

    ScoreMergePolicy scoreMergePolicy = ScoreMergePolicy::FollowMergeStrategy;
    size_t maxComparisonItems = 1000;

    bool enableSimilarityCache = true;
    size_t similarityCacheSize = 10000;
    std::chrono::seconds similarityCacheTTL{300};
};

struct DuplicateGroup {
    std::string keptId;
    std::vector<std::string> duplicateIds;
    std::string detectedBy;
    DuplicateType duplicateType = DuplicateType::Partial;
    double maxSimilarity = 0.0;
};

struct DeduplicationResult {
    std::vector<MergedItem> uniqueItems;
    size_t duplicatesRemoved = 0;
    size_t totalProcessed = 0;
    double averageMergedScore = 0.0; // mean combinedScore of kept items that absorbed duplicates
    double processingTimeMs = 0.0;
    std::vector<DuplicateGroup> groups;
};

struct DeduplicationStats {
    struct StrategyStats {
        uint64_t detections = 0;
        double averageConfidence = 0.0;
    };

    uint64_t totalRuns = 0;
    uint64_t totalProcessed = 0;
    uint64_t totalDuplicatesRemoved = 0;
    uint64_t cacheHits = 0;
    uint64_t cacheMisses = 0;
    size_t cacheSize = 0;
    double averageProcessingTimeMs = 0.0;
    std::map<std::string, StrategyStats> perStrategy;
};

/**
 * @brief Collapses duplicate items in a merged result list
 *
 * The list is stable-sorted by combined score and walked once; each item is compared only
 * against the items already accepted, so the kept item is always the higher scored one.
 * Thread-safe.
 */
class ResultDeduplicator {
public:
    explicit ResultDeduplicator(DeduplicationConfig config = {});

    /**
     * @brief Deduplicate a merged list
     * @param mergeStrategy Strategy the list was produced with; resolves FollowMergeStrategy
     */
    DeduplicationResult detectDuplicates(
        const std::vector<MergedItem>& items,
        std::optional<MergeStrategyKind> mergeStrategy = std::nullopt);

    /**
     * @brief Pairwise check; the first positive rule in priority order wins
     */
    DuplicateMatch areDuplicates(const MergedItem& a, const MergedItem& b);

    // Replaces a rule with the same id
    Result<void> addCustomRule(DuplicateRule rule);
    bool removeCustomRule(const std::string& id);
    std::vector<DuplicateRule> customRules() const;

    void updateConfig(const DeduplicationConfig& config);
    DeduplicationConfig getConfig() const;

    DeduplicationStats getStats() const;
    void resetStats();
    void clearCache();

private:
    struct RuleSlot {
        int priority = 0;
        std::optional<DetectionStrategy> builtin;
        const DuplicateRule* custom = nullptr;
    };

    struct CachedMatch {
        DuplicateMatch match;
        std::chrono::steady_clock::time_point insertedAt;
    };

    std::vector<RuleSlot> orderedRulesLocked() const;
    DuplicateMatch compareLocked(const MergedItem& a, const MergedItem& b,
                                 const std::vector<RuleSlot>& rules);
    DuplicateMatch evaluateLocked(const MergedItem& a, const MergedItem& b,
                                  const std::vector<RuleSlot>& rules) const;
    DuplicateMatch applyBuiltin(DetectionStrategy strategy, const MergedItem& a,
                                const MergedItem& b) const;
    void recordDetectionLocked(const DuplicateMatch& match);
    void cacheStoreLocked(const std::string& key, const DuplicateMatch& match);

    static std::string pairKey(const std::string& a, const std::string& b);

    mutable std::mutex mutex_;
    DeduplicationConfig config_;
    std::vector<DuplicateRule> customRules_;
    std::unordered_map<std::string, CachedMatch> similarityCache_;

    DeduplicationStats stats_;
    std::map<std::string, double> confidenceSums_;
};

/**
 * @brief Priority of a built-in strategy: 100, 90, 80, 70, 60 in declaration order
 */
constexpr int builtinStrategyPriority(DetectionStrategy strategy) {
    switch (strategy) {
        case DetectionStrategy::ExactId:
            return 100;
        case DetectionStrategy::ExactUrl:
            return 90;
        case DetectionStrategy::ContentSimilarity:
            return 80;
        case DetectionStrategy::VersionAware:
            return 70;
        case DetectionStrategy::FuzzyMatch:
            return 60;
        case DetectionStrategy::Custom:
            return 0;
    }
    return 0;
}

} // namespace mvsearch::search
