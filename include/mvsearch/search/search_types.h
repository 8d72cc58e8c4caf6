#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <mvsearch/search/payload.h>

namespace mvsearch::search {

/**
 * @brief How per-vector-type rankings are combined
 */
enum class MergeStrategyKind {
    ReciprocalRankFusion, ///< Sum of 1/(k + rank)
    WeightedAverage,      ///< Weighted mean of raw scores
    Hybrid,               ///< 0.6 * RRF + 0.4 * weighted
    Custom                ///< User hook, RRF when unset
};

constexpr const char* mergeStrategyToString(MergeStrategyKind kind) {
    switch (kind) {
        case MergeStrategyKind::ReciprocalRankFusion:
            return "reciprocal_rank_fusion";
        case MergeStrategyKind::WeightedAverage:
            return "weighted_average";
        case MergeStrategyKind::Hybrid:
            return "hybrid";
        case MergeStrategyKind::Custom:
            return "custom";
    }
    return "reciprocal_rank_fusion";
}

// Accepts the canonical names plus "rrf" and "weighted"
std::optional<MergeStrategyKind> parseMergeStrategy(std::string_view name);

struct SearchQuery {
    std::string text;
    std::vector<std::string> vectorTypes;              // empty = configured defaults
    size_t limit = 10;
    std::optional<nlohmann::json> filter;              // passed through to the vector store
    std::optional<MergeStrategyKind> mergeStrategy;    // per-call override
    std::optional<double> rrfK;                        // per-call override
};

struct ScoredItem {
    std::string id;
    double score = 0.0;
    Payload payload;
    std::string vectorType;
    size_t rank = 0; // 1-based position in the source list
};

struct SourceAttribution {
    std::string vectorType;
    double score = 0.0;
    size_t rank = 0;
    double weight = 0.0;

    bool operator==(const SourceAttribution&) const = default;
};

struct MergedItem : ScoredItem {
    double combinedScore = 0.0;
    std::vector<SourceAttribution> sources;
    size_t mergedFromCount = 0; // distinct vector types among sources

    static MergedItem fromScored(const ScoredItem& item);

    // Append attributions not already present and refresh mergedFromCount
    void absorbSources(const std::vector<SourceAttribution>& other);
    void recountSources();
};

struct VectorTypeResults {
    std::string vectorType;
    std::vector<ScoredItem> items;
};

enum class VectorTypeStatus { Success, Failed, TimedOut, CircuitOpen };

constexpr const char* vectorTypeStatusToString(VectorTypeStatus status) {
    switch (status) {
        case VectorTypeStatus::Success:
            return "success";
        case VectorTypeStatus::Failed:
            return "failed";
        case VectorTypeStatus::TimedOut:
            return "timed_out";
        case VectorTypeStatus::CircuitOpen:
            return "circuit_open";
    }
    return "failed";
}

struct VectorTypeMetrics {
    std::string vectorType;
    size_t resultCount = 0;
    double latencyMs = 0.0;
    double averageScore = 0.0;
    VectorTypeStatus status = VectorTypeStatus::Success;
    std::string error;
};

struct SearchTimings {
    double totalMs = 0.0;
    double embeddingMs = 0.0;
    double searchMs = 0.0;
    double mergeMs = 0.0;
    double dedupMs = 0.0;
    double diversityMs = 0.0;
};

struct SearchResponse {
    std::vector<MergedItem> items;
    std::vector<VectorTypeMetrics> perTypeMetrics;
    double totalTimeMs = 0.0;
    SearchTimings timings;
    MergeStrategyKind strategy = MergeStrategyKind::ReciprocalRankFusion;

    std::vector<std::string> contributingTypes;
    std::vector<std::string> failedTypes;
    std::vector<std::string> timedOutTypes;
    size_t duplicatesRemoved = 0;
    bool embeddingFromCache = false;
    bool fromCache = false;

    bool isDegraded() const { return !failedTypes.empty() || !timedOutTypes.empty(); }
};

} // namespace mvsearch::search
