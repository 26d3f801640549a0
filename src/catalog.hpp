#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// One catalog entry, aligned by position with the indexed vectors.
// Values are kept verbatim (meta.json is loosely typed: "year" may be a
// number or a string, "keywords" a list or a string). An empty optional
// means the key was absent or null and is served as null.
struct ItemMetadata {
    std::optional<nlohmann::json> imdb_id;
    std::optional<nlohmann::json> id;
    std::optional<nlohmann::json> title;
    std::optional<nlohmann::json> year;
    std::optional<nlohmann::json> genre;
    std::optional<nlohmann::json> production_country;
    std::optional<nlohmann::json> keywords;
    std::optional<nlohmann::json> mood_tags;
};

struct Catalog {
    int dim = 0;   // declared vector dimension, 0 when absent or unusable
    std::vector<ItemMetadata> items;

    size_t size() const { return items.size(); }
};

// Non-object input yields an item with every field empty.
ItemMetadata parse_item(const nlohmann::json& j);

// Parses the meta.json document.
// Throws AssetFormatError if it is not an object with an "items" array.
Catalog parse_catalog(const nlohmann::json& meta);

// Reads "dim" leniently: integers as-is, floats truncated, integer strings
// parsed, booleans as 0/1. Anything else, or a non-positive value, is 0.
int parse_declared_dim(const nlohmann::json& meta);

// Writes the eight metadata keys, null for empty fields.
void to_json(nlohmann::json& j, const ItemMetadata& item);
