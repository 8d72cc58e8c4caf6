#include <mvsearch/search/result_deduplicator.h>
#include <mvsearch/search/text_similarity.h>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace mvsearch::search {

namespace {

std::string lowerTrimmed(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
        ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
        --end;
    std::string out = s.substr(start, end - start);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

double weightedPair(double nameSignal, double descSignal, double nameWeight, double descWeight) {
    const double total = nameWeight + descWeight;
    if (total <= 0.0)
        return 0.0;
    return (nameSignal * nameWeight + descSignal * descWeight) / total;
}

} // namespace

std::optional<DetectionStrategy> parseDetectionStrategy(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(lower.begin(), lower.end(), '-', '_');
    for (auto s : {DetectionStrategy::ExactId, DetectionStrategy::ExactUrl,
                   DetectionStrategy::ContentSimilarity, DetectionStrategy::VersionAware,
                   DetectionStrategy::FuzzyMatch, DetectionStrategy::Custom}) {
        if (lower == detectionStrategyToString(s))
            return s;
    }
    return std::nullopt;
}

DuplicateType duplicateTypeForScore(double similarity) {
    if (similarity >= 0.95)
        return DuplicateType::Exact;
    if (similarity >= 0.8)
        return DuplicateType::Near;
    if (similarity >= 0.6)
        return DuplicateType::Versioned;
    return DuplicateType::Partial;
}

// ============================================================================
// ResultDeduplicator Implementation
// ============================================================================

ResultDeduplicator::ResultDeduplicator(DeduplicationConfig config) : config_(std::move(config)) {}

std::string ResultDeduplicator::pairKey(const std::string& a, const std::string& b) {
    // Order-independent so (a, b) and (b, a) share an entry
    return a < b ? a + '\x1f' + b : b + '\x1f' + a;
}

std::vector<ResultDeduplicator::RuleSlot> ResultDeduplicator::orderedRulesLocked() const {
    std::vector<RuleSlot> rules;
    rules.reserve(config_.strategies.size() + customRules_.size());
    for (auto strategy : config_.strategies) {
        if (strategy == DetectionStrategy::Custom)
            continue;
        rules.push_back(RuleSlot{builtinStrategyPriority(strategy), strategy, nullptr});
    }
    for (const auto& rule : customRules_) {
        if (rule.enabled && rule.predicate) {
            rules.push_back(RuleSlot{rule.priority, std::nullopt, &rule});
        }
    }
    // Built-ins were pushed first, so they win ties against custom rules
    std::stable_sort(rules.begin(), rules.end(),
                     [](const RuleSlot& a, const RuleSlot& b) { return a.priority > b.priority; });
    return rules;
}

DuplicateMatch ResultDeduplicator::applyBuiltin(DetectionStrategy strategy, const MergedItem& a,
                                                const MergedItem& b) const {
    DuplicateMatch match;
    match.detectedBy = strategy;
    match.detectedByLabel = detectionStrategyToString(strategy);

    switch (strategy) {
        case DetectionStrategy::ExactId: {
            if (!a.id.empty() && a.id == b.id) {
                match.isDuplicate = true;
                match.similarityScore = 1.0;
                match.confidence = 1.0;
                match.duplicateType = DuplicateType::Exact;
            }
            break;
        }
        case DetectionStrategy::ExactUrl: {
            auto ua = a.payload.url();
            auto ub = b.payload.url();
            if (ua && ub && *ua == *ub) {
                match.isDuplicate = true;
                match.similarityScore = 1.0;
                match.confidence = 1.0;
                match.duplicateType = DuplicateType::Exact;
            }
            break;
        }
        case DetectionStrategy::ContentSimilarity: {
            auto na = a.payload.name();
            auto nb = b.payload.name();
            const double nameSignal = (na && nb && lowerTrimmed(*na) == lowerTrimmed(*nb)) ? 1.0 : 0.0;
            auto da = a.payload.description();
            auto db = b.payload.description();
            const double descSignal = (da && db) ? jaccardSimilarity(*da, *db) : 0.0;
            const double score =
                weightedPair(nameSignal, descSignal, config_.nameWeight, config_.descriptionWeight);
            match.similarityScore = score;
            match.confidence = std::min(score + 0.1, 1.0);
            match.duplicateType = duplicateTypeForScore(score);
            match.isDuplicate = score >= config_.contentSimilarityThreshold;
            break;
        }
        case DetectionStrategy::VersionAware: {
            auto na = a.payload.name();
            auto nb = b.payload.name();
            if (!na || !nb)
                break;
            const std::string sa = normalizeName(*na);
            if (sa.empty() || sa != normalizeName(*nb))
                break;
            auto da = a.payload.description();
            auto db = b.payload.description();
            const double descSignal = (da && db) ? stringSimilarity(*da, *db) : 0.0;
            const double score =
                weightedPair(1.0, descSignal, config_.nameWeight, config_.descriptionWeight);
            match.isDuplicate = true;
            match.similarityScore = score;
            match.confidence = std::min(score + 0.15, 1.0);
            match.duplicateType = DuplicateType::Versioned;
            break;
        }
        case DetectionStrategy::FuzzyMatch: {
            auto na = a.payload.name();
            auto nb = b.payload.name();
            const double nameSignal =
                (na && nb) ? normalizedLevenshtein(lowerTrimmed(*na), lowerTrimmed(*nb)) : 0.0;
            auto da = a.payload.description();
            auto db = b.payload.description();
            const double descSignal = (da && db) ? stringSimilarity(*da, *db) : 0.0;
            const double score =
                weightedPair(nameSignal, descSignal, config_.nameWeight, config_.descriptionWeight);
            match.similarityScore = score;
            match.confidence = std::min(score + 0.05, 1.0);
            match.duplicateType = duplicateTypeForScore(score);
            match.isDuplicate = score >= config_.fuzzyThreshold;
            break;
        }
        case DetectionStrategy::Custom:
            break;
    }
    return match;
}

DuplicateMatch ResultDeduplicator::evaluateLocked(const MergedItem& a, const MergedItem& b,
                                                  const std::vector<RuleSlot>& rules) const {
    DuplicateMatch best;
    for (const auto& slot : rules) {
        if (slot.builtin) {
            auto match = applyBuiltin(*slot.builtin, a, b);
            if (match.isDuplicate)
                return match;
            if (match.similarityScore > best.similarityScore)
                best = match;
            continue;
        }

        const DuplicateRule& rule = *slot.custom;
        bool hit = false;
        try {
            hit = rule.predicate(a, b) || rule.predicate(b, a);
        } catch (const std::exception& e) {
            spdlog::warn("Duplicate rule '{}' threw on ({}, {}): {}", rule.id, a.id, b.id,
                         e.what());
        } catch (...) {
            spdlog::warn("Duplicate rule '{}' threw a non-standard exception on ({}, {})",
                         rule.id, a.id, b.id);
        }
        if (hit) {
            DuplicateMatch match;
            match.isDuplicate = true;
            match.similarityScore = 1.0;
            match.confidence = 1.0;
            match.detectedBy = DetectionStrategy::Custom;
            match.detectedByLabel = rule.strategyLabel.empty() ? rule.id : rule.strategyLabel;
            match.duplicateType = rule.duplicateType;
            return match;
        }
    }
    best.isDuplicate = false;
    return best;
}

void ResultDeduplicator::cacheStoreLocked(const std::string& key, const DuplicateMatch& match) {
    const auto now = std::chrono::steady_clock::now();
    if (similarityCache_.size() >= config_.similarityCacheSize) {
        for (auto it = similarityCache_.begin(); it != similarityCache_.end();) {
            if (now - it->second.insertedAt > config_.similarityCacheTTL)
                it = similarityCache_.erase(it);
            else
                ++it;
        }
        if (similarityCache_.size() >= config_.similarityCacheSize &&
            similarityCache_.find(key) == similarityCache_.end()) {
            auto oldest = std::min_element(
                similarityCache_.begin(), similarityCache_.end(), [](const auto& a, const auto& b) {
                    return a.second.insertedAt < b.second.insertedAt;
                });
            similarityCache_.erase(oldest);
        }
    }
    similarityCache_[key] = CachedMatch{match, now};
}

DuplicateMatch ResultDeduplicator::compareLocked(const MergedItem& a, const MergedItem& b,
                                                 const std::vector<RuleSlot>& rules) {
    if (!config_.enableSimilarityCache || config_.similarityCacheSize == 0) {
        return evaluateLocked(a, b, rules);
    }

    const std::string key = pairKey(a.id, b.id);
    auto it = similarityCache_.find(key);
    if (it != similarityCache_.end()) {
        if (std::chrono::steady_clock::now() - it->second.insertedAt <=
            config_.similarityCacheTTL) {
            stats_.cacheHits++;
            return it->second.match;
        }
        similarityCache_.erase(it);
    }
    stats_.cacheMisses++;
    auto match = evaluateLocked(a, b, rules);
    cacheStoreLocked(key, match);
    return match;
}

void ResultDeduplicator::recordDetectionLocked(const DuplicateMatch& match) {
    auto& s = stats_.perStrategy[match.detectedByLabel];
    s.detections++;
    double& sum = confidenceSums_[match.detectedByLabel];
    sum += match.confidence;
    s.averageConfidence = sum / static_cast<double>(s.detections);
}

DuplicateMatch ResultDeduplicator::areDuplicates(const MergedItem& a, const MergedItem& b) {
    std::lock_guard<std::mutex> lock(mutex_);
    return compareLocked(a, b, orderedRulesLocked());
}

DeduplicationResult
ResultDeduplicator::detectDuplicates(const std::vector<MergedItem>& items,
                                     std::optional<MergeStrategyKind> mergeStrategy) {
    const auto start = std::chrono::steady_clock::now();
    DeduplicationResult result;
    result.totalProcessed = items.size();

    std::lock_guard<std::mutex> lock(mutex_);

    if (!config_.enabled || items.size() < 2) {
        result.uniqueItems = items;
        return result;
    }

    bool sumScores = config_.scoreMergePolicy == ScoreMergePolicy::Sum;
    if (config_.scoreMergePolicy == ScoreMergePolicy::FollowMergeStrategy) {
        sumScores = mergeStrategy.value_or(MergeStrategyKind::ReciprocalRankFusion) ==
                    MergeStrategyKind::ReciprocalRankFusion;
    }

    std::vector<MergedItem> sorted = items;
    std::stable_sort(sorted.begin(), sorted.end(), [](const MergedItem& a, const MergedItem& b) {
        return a.combinedScore > b.combinedScore;
    });

    const auto rules = orderedRulesLocked();
    std::vector<MergedItem> unique;
    unique.reserve(sorted.size());
    // Parallel to unique: index into result.groups or npos
    std::vector<size_t> groupIndex;
    groupIndex.reserve(sorted.size());
    constexpr size_t npos = static_cast<size_t>(-1);

    for (size_t i = 0; i < sorted.size(); ++i) {
        auto& item = sorted[i];
        if (i >= config_.maxComparisonItems) {
            unique.push_back(std::move(item));
            groupIndex.push_back(npos);
            continue;
        }

        bool merged = false;
        for (size_t j = 0; j < unique.size(); ++j) {
            auto match = compareLocked(unique[j], item, rules);
            if (!match.isDuplicate)
                continue;

            MergedItem& kept = unique[j];
            kept.absorbSources(item.sources);
            if (sumScores) {
                kept.combinedScore += item.combinedScore;
            } else {
                kept.combinedScore = std::max(kept.combinedScore, item.combinedScore);
            }

            if (groupIndex[j] == npos) {
                groupIndex[j] = result.groups.size();
                DuplicateGroup group;
                group.keptId = kept.id;
                group.detectedBy = match.detectedByLabel;
                group.duplicateType = match.duplicateType;
                result.groups.push_back(std::move(group));
            }
            auto& group = result.groups[groupIndex[j]];
            group.duplicateIds.push_back(item.id);
            group.maxSimilarity = std::max(group.maxSimilarity, match.similarityScore);

            recordDetectionLocked(match);
            spdlog::debug("Duplicate '{}' folded into '{}' by {} ({:.3f})", item.id, kept.id,
                          match.detectedByLabel, match.similarityScore);
            result.duplicatesRemoved++;
            merged = true;
            break;
        }

        if (!merged) {
            unique.push_back(std::move(item));
            groupIndex.push_back(npos);
        }
    }

    if (!result.groups.empty()) {
        double total = 0.0;
        for (size_t j = 0; j < unique.size(); ++j) {
            if (groupIndex[j] != npos)
                total += unique[j].combinedScore;
        }
        result.averageMergedScore = total / static_cast<double>(result.groups.size());
    }

    // Summed scores can overtake earlier items
    std::stable_sort(unique.begin(), unique.end(), [](const MergedItem& a, const MergedItem& b) {
        return a.combinedScore > b.combinedScore;
    });
    result.uniqueItems = std::move(unique);

    result.processingTimeMs =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

    stats_.totalRuns++;
    stats_.totalProcessed += result.totalProcessed;
    stats_.totalDuplicatesRemoved += result.duplicatesRemoved;
    stats_.averageProcessingTimeMs +=
        (result.processingTimeMs - stats_.averageProcessingTimeMs) /
        static_cast<double>(stats_.totalRuns);

    return result;
}

Result<void> ResultDeduplicator::addCustomRule(DuplicateRule rule) {
    if (rule.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Duplicate rule requires an id"};
    }
    if (!rule.predicate) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Duplicate rule '{}' has no predicate", rule.id)};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(customRules_.begin(), customRules_.end(),
                           [&](const DuplicateRule& r) { return r.id == rule.id; });
    if (it != customRules_.end()) {
        *it = std::move(rule);
    } else {
        customRules_.push_back(std::move(rule));
    }
    similarityCache_.clear();
    return {};
}

bool ResultDeduplicator::removeCustomRule(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(customRules_.begin(), customRules_.end(),
                           [&](const DuplicateRule& r) { return r.id == id; });
    if (it == customRules_.end())
        return false;
    customRules_.erase(it);
    similarityCache_.clear();
    return true;
}

std::vector<DuplicateRule> ResultDeduplicator::customRules() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return customRules_;
}

void ResultDeduplicator::updateConfig(const DeduplicationConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    similarityCache_.clear();
}

DeduplicationConfig ResultDeduplicator::getConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

DeduplicationStats ResultDeduplicator::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DeduplicationStats copy = stats_;
    copy.cacheSize = similarityCache_.size();
    return copy;
}

void ResultDeduplicator::resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = DeduplicationStats{};
    confidenceSums_.clear();
}

void ResultDeduplicator::clearCache() {
    std::lock_guard<std::mutex> lock(mutex_);
    similarityCache_.clear();
}

} // namespace mvsearch::search
