#pragma once

#include <cstddef>
#include <vector>

constexpr int kDefaultTopK = 50;
constexpr int kMinTopK = 1;
constexpr int kMaxTopK = 200;

// Validates a raw query against the declared dimension and scales it to unit
// length, so inner-product search ranks by cosine similarity.
//
// Throws ServerFault if dim <= 0, QueryError on a length mismatch, a
// non-finite element, or a zero vector.
std::vector<float> normalize_query(const std::vector<float>& vector, int dim);

// Clamps a requested result count into [1, catalog_size].
int effective_top_k(int requested, size_t catalog_size);
