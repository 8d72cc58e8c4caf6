#pragma once

#include <map>
#include <string>
#include <vector>

namespace mvsearch::search {

inline constexpr double DEFAULT_UNKNOWN_VECTOR_WEIGHT = 0.5;

// Declaration order used for fan-out and tie-breaking
std::vector<std::string> defaultVectorTypes();

std::map<std::string, double> defaultVectorTypeWeights();

double vectorTypeWeight(const std::map<std::string, double>& weights, const std::string& type);

/**
 * @brief Deterministic, caller-independent iteration order for requested types
 *
 * Types present in declared come first in declaration order, the rest follow sorted.
 * Duplicates and empty names are dropped.
 */
std::vector<std::string> canonicalVectorTypeOrder(const std::vector<std::string>& declared,
                                                  const std::vector<std::string>& requested);

} // namespace mvsearch::search
