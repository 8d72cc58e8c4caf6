#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <mvsearch/core/types.h>
#include <mvsearch/search/search_types.h>

namespace mvsearch::search {

/**
 * @brief Turns query text into an embedding
 *
 * Implementations report provider failures as ErrorCode::EmbeddingError. Calls may arrive from
 * several threads at once.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    virtual Result<Embedding> embed(const std::string& text) = 0;

    virtual bool healthCheck() { return true; }
};

/**
 * @brief Nearest-neighbour search within one vector type
 *
 * Results come back best first; their order defines rank. The filter is opaque to the engine.
 * Failures are reported as ErrorCode::VectorStoreError. Must be callable concurrently.
 */
class IVectorStore {
public:
    virtual ~IVectorStore() = default;

    virtual Result<std::vector<ScoredItem>> searchVectorType(const Embedding& embedding,
                                                             const std::string& vectorType,
                                                             size_t limit,
                                                             const nlohmann::json* filter) = 0;

    virtual bool healthCheck() { return true; }
};

} // namespace mvsearch::search
