#pragma once

#include <set>
#include <string>
#include <string_view>

namespace mvsearch::search {

// Lowercased, whitespace-separated word set
std::set<std::string> wordSet(std::string_view text);

// |A n B| / |A u B| over word sets; two empty inputs score 1.0
double jaccardSimilarity(std::string_view a, std::string_view b);

/**
 * @brief Word-level Jaccard plus a small bonus for long shared prefixes/suffixes
 *
 * A common prefix (or suffix) longer than 3 characters adds (common / minLength) * 0.1.
 * The result is capped at 1.0.
 */
double stringSimilarity(std::string_view a, std::string_view b);

size_t levenshteinDistance(std::string_view s1, std::string_view s2);

// 1 - distance / max(len); 1.0 for two empty strings
double normalizedLevenshtein(std::string_view s1, std::string_view s2);

// Remove a trailing version token such as "v2", "1.4.3" or "2.0-beta"
std::string stripVersionSuffix(std::string_view name);

// Lowercase, drop punctuation, collapse whitespace, strip the version suffix
std::string normalizeName(std::string_view name);

} // namespace mvsearch::search
