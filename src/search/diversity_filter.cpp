#include <mvsearch/search/diversity_filter.h>

#include <unordered_map>
#include <unordered_set>

namespace mvsearch::search {

std::vector<MergedItem> applyDiversityFilter(const std::vector<MergedItem>& items,
                                             double threshold) {
    if (threshold <= 0.0) {
        return items;
    }

    std::vector<MergedItem> selected;
    selected.reserve(items.size());
    std::unordered_map<std::string, size_t> categoryCounts;
    std::unordered_set<std::string> names;

    for (const auto& item : items) {
        auto name = item.payload.name();
        if (name && names.count(*name)) {
            continue;
        }

        auto category = item.payload.category();
        if (category && !selected.empty()) {
            auto it = categoryCounts.find(*category);
            const size_t sameCategory = it == categoryCounts.end() ? 0 : it->second;
            const double ratio =
                static_cast<double>(sameCategory) / static_cast<double>(selected.size());
            if (ratio > threshold) {
                continue;
            }
        }

        if (name) {
            names.insert(*name);
        }
        if (category) {
            categoryCounts[*category]++;
        }
        selected.push_back(item);
    }
    return selected;
}

} // namespace mvsearch::search
