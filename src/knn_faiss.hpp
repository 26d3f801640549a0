#pragma once

#include "index_backend.hpp"
#include <memory>
#include <string>

namespace faiss {
struct Index;
}

// FAISS-backed index, typically an IndexFlatIP or IndexHNSWFlat built with
// METRIC_INNER_PRODUCT over unit vectors by the offline indexing job.
class FaissIndex : public IndexBackend {
public:
    explicit FaissIndex(std::unique_ptr<faiss::Index> index);
    ~FaissIndex() override;

    // Throws AssetFormatError if FAISS cannot read the file.
    static std::unique_ptr<FaissIndex> load(const std::string& index_path);

    std::vector<Neighbor> search(const float* query, int k) const override;
    size_t get_count() const override;
    int get_dim() const override;
    std::string get_backend_name() const override;

private:
    std::unique_ptr<faiss::Index> index_;
};
