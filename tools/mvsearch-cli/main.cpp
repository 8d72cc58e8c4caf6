#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <mvsearch/cache/embedding_cache.h>
#include <mvsearch/config/engine_config.h>
#include <mvsearch/search/multi_vector_search.h>

using namespace mvsearch;
using json = nlohmann::json;

namespace {

constexpr size_t kDimensions = 64;

// Feature hashing over lowercase word tokens, L2 normalized
Embedding hashEmbedding(const std::string& text) {
    Embedding v(kDimensions, 0.0f);
    std::string token;
    auto flush = [&]() {
        if (token.empty())
            return;
        const size_t h = std::hash<std::string>{}(token);
        v[h % kDimensions] += (h & 1) ? 1.0f : -1.0f;
        token.clear();
    };
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            token.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();

    double norm = 0.0;
    for (float x : v)
        norm += static_cast<double>(x) * x;
    if (norm > 0.0) {
        const float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (auto& x : v)
            x *= inv;
    }
    return v;
}

class HashingEmbedder : public search::IEmbeddingProvider {
public:
    Result<Embedding> embed(const std::string& text) override { return hashEmbedding(text); }
};

/**
 * In-memory store: one embedding per item and vector type. The text for a type comes from
 * item["texts"][type] when present, otherwise from name, description and category.
 */
class InMemoryVectorStore : public search::IVectorStore {
public:
    Result<void> load(const json& items, const std::vector<std::string>& types) {
        if (!items.is_array()) {
            return Error{ErrorCode::InvalidData, "Items file must contain a JSON array"};
        }
        for (const auto& item : items) {
            if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) {
                return Error{ErrorCode::InvalidData, "Every item needs a string 'id'"};
            }
            Entry entry;
            entry.id = item["id"].get<std::string>();
            entry.payload = item.value("payload", item);
            for (const auto& type : types) {
                entry.vectors[type] = hashEmbedding(textFor(item, type));
            }
            entries_.push_back(std::move(entry));
        }
        spdlog::info("Loaded {} items over {} vector types", entries_.size(), types.size());
        return {};
    }

    Result<std::vector<search::ScoredItem>> searchVectorType(const Embedding& embedding,
                                                             const std::string& vectorType,
                                                             size_t limit,
                                                             const json* filter) override {
        std::vector<search::ScoredItem> out;
        for (const auto& entry : entries_) {
            auto it = entry.vectors.find(vectorType);
            if (it == entry.vectors.end() || !matches(entry.payload, filter))
                continue;
            const double score = cache::EmbeddingCache::cosineSimilarity(embedding, it->second);
            if (score <= 0.0)
                continue;
            search::ScoredItem item;
            item.id = entry.id;
            item.score = score;
            item.payload = search::Payload(entry.payload);
            out.push_back(std::move(item));
        }
        std::stable_sort(out.begin(), out.end(),
                         [](const auto& a, const auto& b) { return a.score > b.score; });
        if (out.size() > limit)
            out.resize(limit);
        return out;
    }

private:
    struct Entry {
        std::string id;
        json payload;
        std::map<std::string, Embedding> vectors;
    };

    static std::string textFor(const json& item, const std::string& type) {
        if (auto texts = item.find("texts"); texts != item.end() && texts->is_object()) {
            if (auto t = texts->find(type); t != texts->end() && t->is_string())
                return t->get<std::string>();
        }
        std::string text;
        for (const char* key : {"name", "description", "category"}) {
            if (item.contains(key) && item[key].is_string()) {
                text += item[key].get<std::string>();
                text += ' ';
            }
        }
        return text;
    }

    // Equality on every top-level filter key
    static bool matches(const json& payload, const json* filter) {
        if (!filter || !filter->is_object())
            return true;
        for (auto it = filter->begin(); it != filter->end(); ++it) {
            auto field = payload.find(it.key());
            if (field == payload.end() || *field != it.value())
                return false;
        }
        return true;
    }

    std::vector<Entry> entries_;
};

json responseToJson(const search::SearchResponse& response, bool withMetrics) {
    json out;
    out["strategy"] = search::mergeStrategyToString(response.strategy);
    out["fromCache"] = response.fromCache;
    out["degraded"] = response.isDegraded();
    out["duplicatesRemoved"] = response.duplicatesRemoved;
    out["items"] = json::array();
    for (const auto& item : response.items) {
        json j{{"id", item.id},
               {"score", item.combinedScore},
               {"mergedFromCount", item.mergedFromCount},
               {"payload", item.payload.json()}};
        json sources = json::array();
        for (const auto& s : item.sources) {
            sources.push_back(
                {{"vectorType", s.vectorType}, {"score", s.score}, {"rank", s.rank}, {"weight", s.weight}});
        }
        j["sources"] = std::move(sources);
        out["items"].push_back(std::move(j));
    }
    if (withMetrics) {
        json perType = json::array();
        for (const auto& m : response.perTypeMetrics) {
            perType.push_back({{"vectorType", m.vectorType},
                               {"status", search::vectorTypeStatusToString(m.status)},
                               {"resultCount", m.resultCount},
                               {"latencyMs", m.latencyMs},
                               {"averageScore", m.averageScore}});
        }
        out["metrics"] = {{"totalMs", response.timings.totalMs},
                          {"embeddingMs", response.timings.embeddingMs},
                          {"searchMs", response.timings.searchMs},
                          {"mergeMs", response.timings.mergeMs},
                          {"dedupMs", response.timings.dedupMs},
                          {"diversityMs", response.timings.diversityMs},
                          {"perType", std::move(perType)},
                          {"failedTypes", response.failedTypes},
                          {"timedOutTypes", response.timedOutTypes}};
    }
    return out;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"mvsearch - multi-vector search over a JSON item collection"};

    std::string itemsPath;
    std::string query;
    std::string configPath;
    std::string strategy;
    std::string filter;
    std::string logLevel = "warn";
    std::vector<std::string> types;
    size_t limit = 10;
    bool metrics = false;

    app.add_option("items", itemsPath, "JSON file holding an array of items")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("query", query, "Query text")->required();
    app.add_option("-n,--limit", limit, "Maximum number of results")->default_val(10);
    app.add_option("-c,--config", configPath, "Config file (default: MVSEARCH_CONFIG or XDG path)");
    app.add_option("-s,--strategy", strategy, "Merge strategy override")
        ->check(CLI::IsMember({"rrf", "weighted", "hybrid"}));
    app.add_option("-t,--types", types, "Vector types to search");
    app.add_option("-f,--filter", filter, "JSON object matched against item payloads");
    app.add_flag("-m,--metrics", metrics, "Include timing and per-type metrics");
    app.add_option("-l,--log-level", logLevel, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))
        ->default_val("warn");
    CLI11_PARSE(app, argc, argv);

    auto logger = spdlog::stderr_color_mt("mvsearch");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(logLevel));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");

    auto engineConfig = config::loadEngineConfig(configPath);
    if (!engineConfig) {
        spdlog::error("Failed to load config: {}", engineConfig.error().message);
        return 1;
    }

    json items;
    try {
        std::ifstream in(itemsPath);
        items = json::parse(in);
    } catch (const json::exception& e) {
        spdlog::error("Failed to parse {}: {}", itemsPath, e.what());
        return 1;
    }

    auto store = std::make_shared<InMemoryVectorStore>();
    auto searchConfig = engineConfig.value().search;
    if (auto loaded = store->load(items, searchConfig.vectorTypes); !loaded) {
        spdlog::error("{}", loaded.error().message);
        return 1;
    }

    search::SearchQuery request;
    request.text = query;
    request.limit = limit;
    request.vectorTypes = types;
    if (!strategy.empty()) {
        request.mergeStrategy = search::parseMergeStrategy(strategy);
    }
    if (!filter.empty()) {
        try {
            request.filter = json::parse(filter);
        } catch (const json::exception& e) {
            spdlog::error("Invalid --filter: {}", e.what());
            return 1;
        }
    }

    auto embeddingCache =
        std::make_shared<cache::EmbeddingCache>(engineConfig.value().embeddingCache);
    auto breakers = std::make_shared<resilience::CircuitBreakerManager>();
    config::registerBreakers(engineConfig.value(), *breakers);
    search::MultiVectorSearch engine(
        search::MultiVectorSearch::Dependencies{std::make_shared<HashingEmbedder>(), store,
                                                embeddingCache, breakers},
        searchConfig);

    auto result = engine.search(request);
    if (!result) {
        spdlog::error("Search failed: {}", result.error().message);
        std::cout << json{{"error", errorToString(result.error().code)},
                          {"message", result.error().message}}
                         .dump(2)
                  << std::endl;
        return 2;
    }

    std::cout << responseToJson(result.value(), metrics).dump(2) << std::endl;
    return 0;
}
