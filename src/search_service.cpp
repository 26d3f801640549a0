#include "search_service.hpp"
#include "query_normalizer.hpp"
#include <stdexcept>

void to_json(nlohmann::json& j, const SearchResult& result) {
    to_json(j, *result.item);
    j["score"] = result.score;
    j["similarity"] = result.score;
}

std::vector<SearchResult> join_results(const std::vector<Neighbor>& neighbors,
                                       const Catalog& catalog) {
    std::vector<SearchResult> results;
    results.reserve(neighbors.size());
    for (const auto& neighbor : neighbors) {
        if (neighbor.position < 0 ||
            static_cast<uint64_t>(neighbor.position) >= catalog.items.size()) {
            continue;
        }
        results.push_back(SearchResult{&catalog.items[neighbor.position], neighbor.score});
    }
    return results;
}

SearchService::SearchService(std::unique_ptr<IndexBackend> index, Catalog catalog)
    : index_(std::move(index)), catalog_(std::move(catalog)) {
    if (!index_) {
        throw std::invalid_argument("SearchService requires an index");
    }
}

std::vector<SearchResult> SearchService::search(const std::vector<float>& vector,
                                                int top_k) const {
    std::vector<float> query = normalize_query(vector, catalog_.dim);

    int k = effective_top_k(top_k, catalog_.size());
    if (k == 0) {
        return {};
    }

    std::vector<Neighbor> neighbors = index_->search(query.data(), k);
    return join_results(neighbors, catalog_);
}
