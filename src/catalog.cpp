#include "catalog.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cmath>
#include <limits>

namespace {

std::optional<nlohmann::json> field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

nlohmann::json or_null(const std::optional<nlohmann::json>& value) {
    return value ? *value : nlohmann::json(nullptr);
}

}  // namespace

ItemMetadata parse_item(const nlohmann::json& j) {
    ItemMetadata item;
    if (!j.is_object()) {
        return item;
    }
    item.imdb_id = field(j, "imdbId");
    item.id = field(j, "id");
    item.title = field(j, "title");
    item.year = field(j, "year");
    item.genre = field(j, "genre");
    item.production_country = field(j, "productionCountry");
    item.keywords = field(j, "keywords");
    item.mood_tags = field(j, "moodTags");
    return item;
}

int parse_declared_dim(const nlohmann::json& meta) {
    auto it = meta.find("dim");
    if (it == meta.end()) {
        return 0;
    }

    double v = 0.0;
    if (it->is_boolean()) {
        v = it->get<bool>() ? 1.0 : 0.0;
    } else if (it->is_number_unsigned()) {
        v = static_cast<double>(it->get<uint64_t>());
    } else if (it->is_number_integer()) {
        v = static_cast<double>(it->get<int64_t>());
    } else if (it->is_number_float()) {
        v = std::trunc(it->get<double>());
    } else if (it->is_string()) {
        // "8" and " 8 " count, "8.5" does not
        std::optional<int64_t> parsed = parse_int_string(it->get<std::string>());
        if (!parsed) return 0;
        v = static_cast<double>(*parsed);
    }

    if (!std::isfinite(v) || v <= 0 || v > std::numeric_limits<int>::max()) {
        return 0;
    }
    return static_cast<int>(v);
}

Catalog parse_catalog(const nlohmann::json& meta) {
    if (!meta.is_object() || !meta.contains("items") || !meta["items"].is_array()) {
        throw AssetFormatError("meta.json must be an object with an 'items' array");
    }

    Catalog catalog;
    catalog.dim = parse_declared_dim(meta);

    const auto& items = meta["items"];
    catalog.items.reserve(items.size());
    for (const auto& entry : items) {
        catalog.items.push_back(parse_item(entry));
    }
    return catalog;
}

void to_json(nlohmann::json& j, const ItemMetadata& item) {
    j = nlohmann::json::object();
    j["imdbId"] = or_null(item.imdb_id);
    j["id"] = or_null(item.id);
    j["title"] = or_null(item.title);
    j["year"] = or_null(item.year);
    j["genre"] = or_null(item.genre);
    j["productionCountry"] = or_null(item.production_country);
    j["keywords"] = or_null(item.keywords);
    j["moodTags"] = or_null(item.mood_tags);
}
