#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace mvsearch::search {

/**
 * @brief Semi-structured item payload
 *
 * Wraps an arbitrary JSON object returned by the vector store. Accessors never assume a field is
 * present and return nullopt for missing fields, wrong types and empty strings.
 */
class Payload {
public:
    Payload() : data_(nlohmann::json::object()) {}
    explicit Payload(nlohmann::json data);

    std::optional<std::string> getString(std::string_view key) const;
    std::optional<double> getNumber(std::string_view key) const;

    std::optional<std::string> name() const { return getString("name"); }
    std::optional<std::string> description() const { return getString("description"); }
    std::optional<std::string> category() const { return getString("category"); }
    std::optional<std::string> url() const;
    std::optional<std::string> version() const { return getString("version"); }

    bool contains(std::string_view key) const;
    void set(const std::string& key, nlohmann::json value);

    const nlohmann::json& json() const { return data_; }

    bool operator==(const Payload& other) const { return data_ == other.data_; }

private:
    nlohmann::json data_;
};

} // namespace mvsearch::search
