#include "knn_faiss.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <faiss/Index.h>
#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>

FaissIndex::FaissIndex(std::unique_ptr<faiss::Index> index)
    : index_(std::move(index)) {
    if (!index_) {
        throw AssetFormatError("FaissIndex requires a non-null index");
    }
}

FaissIndex::~FaissIndex() = default;

std::unique_ptr<FaissIndex> FaissIndex::load(const std::string& index_path) {
    std::unique_ptr<faiss::Index> index;
    try {
        index.reset(faiss::read_index(index_path.c_str()));
    } catch (const faiss::FaissException& e) {
        throw AssetFormatError("Failed to read FAISS index " + index_path + ": " + e.what());
    }
    if (!index) {
        throw AssetFormatError("Failed to read FAISS index " + index_path);
    }
    if (index->metric_type != faiss::METRIC_INNER_PRODUCT) {
        // Scores will be distances rather than cosine similarities.
        LOG_WARN("FAISS index " + index_path + " does not use inner-product metric");
    }
    return std::make_unique<FaissIndex>(std::move(index));
}

std::vector<Neighbor> FaissIndex::search(const float* query, int k) const {
    std::vector<Neighbor> results;
    if (k <= 0) {
        return results;
    }

    std::vector<float> scores(k);
    std::vector<faiss::idx_t> labels(k);
    index_->search(1, query, k, scores.data(), labels.data());

    results.reserve(k);
    for (int i = 0; i < k; i++) {
        results.emplace_back(scores[i], static_cast<int64_t>(labels[i]));
    }
    return results;
}

size_t FaissIndex::get_count() const {
    return static_cast<size_t>(index_->ntotal);
}

int FaissIndex::get_dim() const {
    return index_->d;
}

std::string FaissIndex::get_backend_name() const {
    return "faiss";
}
