#include <mvsearch/search/search_types.h>
#include <mvsearch/search/vector_types.h>

#include <algorithm>
#include <cctype>
#include <set>

namespace mvsearch::search {

// ===== Payload =====

Payload::Payload(nlohmann::json data) : data_(std::move(data)) {
    if (!data_.is_object()) {
        data_ = nlohmann::json::object();
    }
}

std::optional<std::string> Payload::getString(std::string_view key) const {
    auto it = data_.find(std::string(key));
    if (it == data_.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> Payload::getNumber(std::string_view key) const {
    auto it = data_.find(std::string(key));
    if (it == data_.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

std::optional<std::string> Payload::url() const {
    if (auto u = getString("url")) {
        return u;
    }
    return getString("website");
}

bool Payload::contains(std::string_view key) const {
    return data_.find(std::string(key)) != data_.end();
}

void Payload::set(const std::string& key, nlohmann::json value) {
    data_[key] = std::move(value);
}

// ===== Merge strategy names =====

std::optional<MergeStrategyKind> parseMergeStrategy(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "reciprocal_rank_fusion" || lower == "rrf")
        return MergeStrategyKind::ReciprocalRankFusion;
    if (lower == "weighted_average" || lower == "weighted")
        return MergeStrategyKind::WeightedAverage;
    if (lower == "hybrid")
        return MergeStrategyKind::Hybrid;
    if (lower == "custom")
        return MergeStrategyKind::Custom;
    return std::nullopt;
}

// ===== MergedItem =====

MergedItem MergedItem::fromScored(const ScoredItem& item) {
    MergedItem merged;
    static_cast<ScoredItem&>(merged) = item;
    merged.combinedScore = item.score;
    return merged;
}

void MergedItem::absorbSources(const std::vector<SourceAttribution>& other) {
    for (const auto& source : other) {
        if (std::find(sources.begin(), sources.end(), source) == sources.end()) {
            sources.push_back(source);
        }
    }
    recountSources();
}

void MergedItem::recountSources() {
    std::set<std::string> types;
    for (const auto& s : sources) {
        types.insert(s.vectorType);
    }
    mergedFromCount = types.size();
}

// ===== Vector types =====

std::vector<std::string> defaultVectorTypes() {
    return {"semantic", "categories", "functionality", "aliases", "composites"};
}

std::map<std::string, double> defaultVectorTypeWeights() {
    return {{"semantic", 1.0},
            {"categories", 0.8},
            {"functionality", 0.7},
            {"aliases", 0.6},
            {"composites", 0.5}};
}

double vectorTypeWeight(const std::map<std::string, double>& weights, const std::string& type) {
    auto it = weights.find(type);
    return it == weights.end() ? DEFAULT_UNKNOWN_VECTOR_WEIGHT : it->second;
}

std::vector<std::string> canonicalVectorTypeOrder(const std::vector<std::string>& declared,
                                                  const std::vector<std::string>& requested) {
    std::set<std::string> wanted;
    for (const auto& r : requested) {
        if (!r.empty()) {
            wanted.insert(r);
        }
    }

    std::vector<std::string> ordered;
    ordered.reserve(wanted.size());
    for (const auto& d : declared) {
        if (wanted.erase(d) > 0) {
            ordered.push_back(d);
        }
    }
    // std::set iterates sorted
    ordered.insert(ordered.end(), wanted.begin(), wanted.end());
    return ordered;
}

} // namespace mvsearch::search
