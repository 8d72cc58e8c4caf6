#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <mvsearch/core/types.h>
#include <mvsearch/search/search_types.h>
#include <mvsearch/search/vector_types.h>

namespace mvsearch::search {

/**
 * @brief Parameters shared by all merge strategies
 */
struct MergeOptions {
    double rrfK = DEFAULT_RRF_K;
    std::map<std::string, double> weights = defaultVectorTypeWeights();
    double hybridRrfWeight = 0.6;
    double hybridWeightedWeight = 0.4;
};

/**
 * @brief Combines per-vector-type ranked lists into one ranking
 *
 * Input lists are iterated in the given order; ties in the combined score keep first-seen order,
 * so callers must pass lists in a deterministic order (see canonicalVectorTypeOrder).
 */
class IMergeStrategy {
public:
    virtual ~IMergeStrategy() = default;

    virtual std::vector<MergedItem> merge(const std::vector<VectorTypeResults>& perType) const = 0;
    virtual MergeStrategyKind kind() const = 0;
};

class ReciprocalRankFusion final : public IMergeStrategy {
public:
    explicit ReciprocalRankFusion(MergeOptions options = {}) : options_(std::move(options)) {}

    std::vector<MergedItem> merge(const std::vector<VectorTypeResults>& perType) const override;
    MergeStrategyKind kind() const override { return MergeStrategyKind::ReciprocalRankFusion; }

private:
    MergeOptions options_;
};

class WeightedAverageMerge final : public IMergeStrategy {
public:
    explicit WeightedAverageMerge(MergeOptions options = {}) : options_(std::move(options)) {}

    std::vector<MergedItem> merge(const std::vector<VectorTypeResults>& perType) const override;
    MergeStrategyKind kind() const override { return MergeStrategyKind::WeightedAverage; }

private:
    MergeOptions options_;
};

class HybridMerge final : public IMergeStrategy {
public:
    explicit HybridMerge(MergeOptions options = {}) : options_(std::move(options)) {}

    std::vector<MergedItem> merge(const std::vector<VectorTypeResults>& perType) const override;
    MergeStrategyKind kind() const override { return MergeStrategyKind::Hybrid; }

private:
    MergeOptions options_;
};

using CustomMergeFn = std::function<std::vector<MergedItem>(
    const std::vector<VectorTypeResults>& perType, const MergeOptions& options)>;

/**
 * @brief Extension point; without a function it ranks exactly like ReciprocalRankFusion
 */
class CustomMerge final : public IMergeStrategy {
public:
    explicit CustomMerge(MergeOptions options = {}, CustomMergeFn fn = {})
        : options_(std::move(options)), fn_(std::move(fn)) {}

    std::vector<MergedItem> merge(const std::vector<VectorTypeResults>& perType) const override;
    MergeStrategyKind kind() const override { return MergeStrategyKind::Custom; }
    bool hasFunction() const { return static_cast<bool>(fn_); }

private:
    MergeOptions options_;
    CustomMergeFn fn_;
};

std::unique_ptr<IMergeStrategy> createMergeStrategy(MergeStrategyKind kind,
                                                    const MergeOptions& options = {},
                                                    CustomMergeFn custom = {});

// Stable sort by combinedScore, descending
void sortByCombinedScore(std::vector<MergedItem>& items);

} // namespace mvsearch::search
