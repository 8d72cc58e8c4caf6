#include <mvsearch/search/cache_key.h>

#include <algorithm>
#include <cctype>
#include <functional>

namespace mvsearch::search {

std::string CacheKey::normalizeQueryText(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

CacheKey CacheKey::fromQuery(const std::string& queryText, size_t limit,
                             const std::optional<nlohmann::json>& filter,
                             const std::vector<std::string>& vectorTypes,
                             MergeStrategyKind strategy, double rrfK) {
    CacheKey key;
    key.components_.queryText = normalizeQueryText(queryText);
    key.components_.limit = limit;
    // nlohmann::json objects keep keys sorted, so dump() is canonical
    if (filter && !filter->is_null()) {
        key.components_.filter = filter->dump();
    }
    key.components_.vectorTypes = vectorTypes;
    std::sort(key.components_.vectorTypes.begin(), key.components_.vectorTypes.end());
    key.components_.vectorTypes.erase(
        std::unique(key.components_.vectorTypes.begin(), key.components_.vectorTypes.end()),
        key.components_.vectorTypes.end());
    key.components_.strategy = mergeStrategyToString(strategy);
    key.components_.rrfK = rrfK;

    key.buildKey();
    return key;
}

void CacheKey::buildKey() {
    nlohmann::json params = {{"limit", components_.limit},
                             {"filter", components_.filter},
                             {"vectorTypes", components_.vectorTypes},
                             {"strategy", components_.strategy},
                             {"rrfK", components_.rrfK}};

    keyString_ = "q:" + components_.queryText + "|p:" + params.dump();

    std::hash<std::string> hasher;
    hashValue_ = hasher(keyString_);
}

bool CacheKey::matchesPattern(const std::string& pattern) const {
    if (pattern.empty() || pattern == "*")
        return true;

    if (pattern.find('*') == std::string::npos) {
        return keyString_.find(pattern) != std::string::npos;
    }

    // Split on '*' and require every part in order
    const bool anchorStart = pattern.front() != '*';
    const bool anchorEnd = pattern.back() != '*';

    size_t pos = 0;
    size_t cursor = 0;
    bool first = true;
    while (pos <= pattern.size()) {
        size_t next = pattern.find('*', pos);
        std::string token =
            (next == std::string::npos) ? pattern.substr(pos) : pattern.substr(pos, next - pos);
        if (!token.empty()) {
            size_t found = keyString_.find(token, cursor);
            if (found == std::string::npos)
                return false;
            if (first && anchorStart && found != 0)
                return false;
            cursor = found + token.size();
            first = false;
        }
        if (next == std::string::npos)
            break;
        pos = next + 1;
    }

    if (anchorEnd) {
        std::string tail = pattern.substr(pattern.find_last_of('*') + 1);
        if (keyString_.size() < tail.size() ||
            keyString_.compare(keyString_.size() - tail.size(), tail.size(), tail) != 0)
            return false;
    }

    return true;
}

} // namespace mvsearch::search
