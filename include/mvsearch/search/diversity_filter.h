#pragma once

#include <vector>
#include <mvsearch/search/search_types.h>

namespace mvsearch::search {

inline constexpr double DEFAULT_DIVERSITY_THRESHOLD = 0.7;

/**
 * @brief Limit category repetition in a score-sorted list
 *
 * Walks items in order. An item is skipped when the share of already-selected items with its
 * category is above threshold, or when its name equals an already-selected name. Items without a
 * category are only subject to the name rule. A threshold <= 0 returns the input unchanged.
 */
std::vector<MergedItem> applyDiversityFilter(const std::vector<MergedItem>& items,
                                             double threshold = DEFAULT_DIVERSITY_THRESHOLD);

} // namespace mvsearch::search
