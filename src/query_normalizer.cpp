#include "query_normalizer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <climits>
#include <cmath>
#include <string>

std::vector<float> normalize_query(const std::vector<float>& vector, int dim) {
    if (dim <= 0) {
        throw ServerFault("Invalid vector dim in meta.json");
    }
    if (vector.size() != static_cast<size_t>(dim)) {
        throw QueryError("vector must have length " + std::to_string(dim));
    }

    double sum_squares = 0.0;
    for (float v : vector) {
        if (!std::isfinite(v)) {
            throw QueryError("vector contains non-finite values");
        }
        sum_squares += static_cast<double>(v) * v;
    }

    double norm = std::sqrt(sum_squares);
    if (norm == 0.0) {
        throw QueryError("vector norm is 0");
    }

    std::vector<float> unit(vector.size());
    for (size_t i = 0; i < vector.size(); i++) {
        unit[i] = static_cast<float>(vector[i] / norm);
    }
    return unit;
}

int effective_top_k(int requested, size_t catalog_size) {
    size_t cap = std::min<size_t>(catalog_size, INT_MAX);
    size_t k = static_cast<size_t>(std::max(1, requested));
    return static_cast<int>(std::min(k, cap));
}
