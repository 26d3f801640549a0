#pragma once

#include <cstdint>
#include <string>
#include <vector>

// One search hit: inner-product score and position into the catalog.
// Position is -1 when the index could not fill the slot.
struct Neighbor {
    float score;
    int64_t position;

    Neighbor(float score, int64_t position) : score(score), position(position) {}
};

// Read-only nearest-neighbor index. Implementations must allow concurrent
// search() calls once constructed.
class IndexBackend {
public:
    virtual ~IndexBackend() = default;

    // query points to dim() floats, already unit-norm. Hits come back in the
    // index's own rank order (best first); callers do not re-sort.
    virtual std::vector<Neighbor> search(const float* query, int k) const = 0;
    virtual size_t get_count() const = 0;
    virtual int get_dim() const = 0;
    virtual std::string get_backend_name() const = 0;
};
