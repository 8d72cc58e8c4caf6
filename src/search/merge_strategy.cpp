#include <mvsearch/search/merge_strategy.h>

#include <algorithm>
#include <unordered_map>

namespace mvsearch::search {

namespace {

// Items keyed by id, kept in first-seen order
class Accumulator {
public:
    MergedItem& slotFor(const ScoredItem& item, bool& created) {
        auto it = index_.find(item.id);
        if (it != index_.end()) {
            created = false;
            return items_[it->second];
        }
        created = true;
        index_.emplace(item.id, items_.size());
        MergedItem merged = MergedItem::fromScored(item);
        merged.combinedScore = 0.0;
        items_.push_back(std::move(merged));
        return items_.back();
    }

    std::vector<MergedItem>& items() { return items_; }

private:
    std::vector<MergedItem> items_;
    std::unordered_map<std::string, size_t> index_;
};

size_t effectiveRank(const ScoredItem& item, size_t position) {
    return item.rank > 0 ? item.rank : position + 1;
}

void recordSource(MergedItem& merged, const ScoredItem& item, size_t rank, double weight,
                  bool created) {
    merged.sources.push_back(SourceAttribution{item.vectorType, item.score, rank, weight});
    if (!created) {
        if (item.score > merged.score) {
            merged.score = item.score;
        }
        if (rank < merged.rank) {
            merged.rank = rank;
        }
    } else {
        merged.rank = rank;
    }
}

} // namespace

void sortByCombinedScore(std::vector<MergedItem>& items) {
    std::stable_sort(items.begin(), items.end(), [](const MergedItem& a, const MergedItem& b) {
        return a.combinedScore > b.combinedScore;
    });
}

std::vector<MergedItem>
ReciprocalRankFusion::merge(const std::vector<VectorTypeResults>& perType) const {
    Accumulator acc;
    for (const auto& list : perType) {
        const double weight = vectorTypeWeight(options_.weights, list.vectorType);
        for (size_t i = 0; i < list.items.size(); ++i) {
            ScoredItem item = list.items[i];
            if (item.vectorType.empty()) {
                item.vectorType = list.vectorType;
            }
            const size_t rank = effectiveRank(item, i);
            bool created = false;
            MergedItem& merged = acc.slotFor(item, created);
            merged.combinedScore += 1.0 / (options_.rrfK + static_cast<double>(rank));
            recordSource(merged, item, rank, weight, created);
        }
    }

    auto& out = acc.items();
    for (auto& item : out) {
        item.recountSources();
    }
    sortByCombinedScore(out);
    return std::move(out);
}

std::vector<MergedItem>
WeightedAverageMerge::merge(const std::vector<VectorTypeResults>& perType) const {
    Accumulator acc;
    std::unordered_map<std::string, double> weightSums;

    for (const auto& list : perType) {
        const double weight = vectorTypeWeight(options_.weights, list.vectorType);
        for (size_t i = 0; i < list.items.size(); ++i) {
            ScoredItem item = list.items[i];
            if (item.vectorType.empty()) {
                item.vectorType = list.vectorType;
            }
            const size_t rank = effectiveRank(item, i);
            bool created = false;
            MergedItem& merged = acc.slotFor(item, created);
            // combinedScore holds the weighted sum until normalization below
            merged.combinedScore += item.score * weight;
            weightSums[item.id] += weight;
            recordSource(merged, item, rank, weight, created);
        }
    }

    auto& out = acc.items();
    for (auto& item : out) {
        const double total = weightSums[item.id];
        item.combinedScore = total > 0.0 ? item.combinedScore / total : 0.0;
        item.recountSources();
    }
    sortByCombinedScore(out);
    return std::move(out);
}

std::vector<MergedItem> HybridMerge::merge(const std::vector<VectorTypeResults>& perType) const {
    auto rrf = ReciprocalRankFusion(options_).merge(perType);
    auto weighted = WeightedAverageMerge(options_).merge(perType);

    std::unordered_map<std::string, double> weightedScores;
    weightedScores.reserve(weighted.size());
    for (const auto& item : weighted) {
        weightedScores.emplace(item.id, item.combinedScore);
    }

    // Restore first-seen order before the stable sort so ties break the same way as RRF
    std::unordered_map<std::string, size_t> firstSeen;
    size_t position = 0;
    for (const auto& list : perType) {
        for (const auto& item : list.items) {
            firstSeen.emplace(item.id, position++);
        }
    }
    std::sort(rrf.begin(), rrf.end(), [&firstSeen](const MergedItem& a, const MergedItem& b) {
        return firstSeen[a.id] < firstSeen[b.id];
    });

    for (auto& item : rrf) {
        auto it = weightedScores.find(item.id);
        const double weightedScore = it == weightedScores.end() ? 0.0 : it->second;
        item.combinedScore = options_.hybridRrfWeight * item.combinedScore +
                             options_.hybridWeightedWeight * weightedScore;
    }
    sortByCombinedScore(rrf);
    return rrf;
}

std::vector<MergedItem> CustomMerge::merge(const std::vector<VectorTypeResults>& perType) const {
    if (!fn_) {
        return ReciprocalRankFusion(options_).merge(perType);
    }
    return fn_(perType, options_);
}

std::unique_ptr<IMergeStrategy> createMergeStrategy(MergeStrategyKind kind,
                                                    const MergeOptions& options,
                                                    CustomMergeFn custom) {
    switch (kind) {
        case MergeStrategyKind::ReciprocalRankFusion:
            return std::make_unique<ReciprocalRankFusion>(options);
        case MergeStrategyKind::WeightedAverage:
            return std::make_unique<WeightedAverageMerge>(options);
        case MergeStrategyKind::Hybrid:
            return std::make_unique<HybridMerge>(options);
        case MergeStrategyKind::Custom:
            return std::make_unique<CustomMerge>(options, std::move(custom));
    }
    return std::make_unique<ReciprocalRankFusion>(options);
}

} // namespace mvsearch::search
