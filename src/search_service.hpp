#pragma once

#include "catalog.hpp"
#include "index_backend.hpp"
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

struct SearchResult {
    const ItemMetadata* item;   // points into the service's catalog
    float score;
};

// Served as the eight metadata keys plus "score" and "similarity", which
// always carry the same value.
void to_json(nlohmann::json& j, const SearchResult& result);

// Maps neighbor positions to catalog items in rank order. Positions outside
// the catalog (including FAISS's -1 for unfilled slots) are skipped.
std::vector<SearchResult> join_results(const std::vector<Neighbor>& neighbors,
                                       const Catalog& catalog);

// The loaded, read-only search state. Built once at startup and shared by
// all request handlers without locking.
class SearchService {
public:
    SearchService(std::unique_ptr<IndexBackend> index, Catalog catalog);

    // Normalizes the query, searches the index and joins metadata.
    // Throws QueryError / ServerFault as normalize_query does.
    std::vector<SearchResult> search(const std::vector<float>& vector, int top_k) const;

    const Catalog& catalog() const { return catalog_; }
    const IndexBackend& index() const { return *index_; }

private:
    std::unique_ptr<IndexBackend> index_;
    Catalog catalog_;
};
