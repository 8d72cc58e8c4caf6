#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <mvsearch/search/search_types.h>

namespace mvsearch::search {

/**
 * @brief Deterministic fingerprint of a search request
 *
 * Built from the normalized query text (lowercased, trimmed, whitespace collapsed) and a canonical
 * JSON serialization of limit, filter, vector types, merge strategy and RRF constant. Two
 * requests that differ only in whitespace, case or vector type order share a key.
 */
class CacheKey {
public:
    struct Components {
        std::string queryText;
        size_t limit = 0;
        std::string filter; // canonical JSON or empty
        std::vector<std::string> vectorTypes;
        std::string strategy;
        double rrfK = 0.0;
    };

    static CacheKey fromQuery(const std::string& queryText, size_t limit,
                              const std::optional<nlohmann::json>& filter,
                              const std::vector<std::string>& vectorTypes,
                              MergeStrategyKind strategy, double rrfK);

    static std::string normalizeQueryText(const std::string& text);

    CacheKey() = default;

    size_t hash() const { return hashValue_; }
    const std::string& toString() const { return keyString_; }
    const Components& getComponents() const { return components_; }

    bool operator==(const CacheKey& other) const {
        return hashValue_ == other.hashValue_ && keyString_ == other.keyString_;
    }

    bool operator!=(const CacheKey& other) const { return !(*this == other); }

    /**
     * @brief Glob match against the key string, '*' matches any run of characters
     */
    bool matchesPattern(const std::string& pattern) const;

private:
    std::string keyString_;
    size_t hashValue_ = 0;
    Components components_;

    void buildKey();
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const { return key.hash(); }
};

} // namespace mvsearch::search
