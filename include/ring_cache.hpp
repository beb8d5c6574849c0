#pragma once
#include "utils/eigen_types.hpp"
#include "utils/config.hpp"

#include <vector>

// Result of a cache lookup. Column i of both matrices is storage slot i of every lane
// (storage order, not time order); before the ring wraps this is oldest-first.
struct CacheQuery {
    RowMatrixXf scores;   // [lanes, width]
    RowMatrixXi symbols;  // [lanes, width]

    int width() const { return static_cast<int>(scores.cols()); }
};

// Fixed-capacity ring buffer of (hidden vector, observed symbol) pairs, one ring per batch lane,
// so cache context never leaks between the unrelated sequences of a batch.
//
// All storage is allocated up front: keys live in one [lanes * capacity, key_dim] arena,
// lane l owning rows [l * capacity, (l + 1) * capacity).
//
// Eviction is strict FIFO: the next slot written is always the oldest one.
//
// Usage precondition: insert() always writes every lane, so all lanes fill in lockstep and
// stored() can be checked once per step. Lanes are not synchronized; one writer per cache.
class RingCache {
public:
    RingCache(int capacity, int key_dim, int vocab_size, int lanes);
    RingCache(const CacheConfig& config, int lanes);

    // keys: [lanes, key_dim], symbols: [lanes]. Overwrites the slot under each lane's cursor.
    // Symbols are stored verbatim; keeping them inside [0, vocab_size) is the caller's job.
    void insert(const RowMatrixXf& keys, const Eigen::VectorXi& symbols);

    // probe: [lanes, key_dim]. Dot product of each lane's probe with every valid key of that lane.
    // Returns a [lanes, 0] result while the cache is empty.
    CacheQuery query(const RowMatrixXf& probe) const;

    int capacity() const { return _capacity; }
    int key_dim() const { return _key_dim; }
    int vocab_size() const { return _vocab_size; }
    int lanes() const { return _lanes; }

    int filled(int lane) const { return _filled.at(lane); }
    int write_cursor(int lane) const { return _cursor.at(lane); }

    // Fill level shared by all lanes (the smallest, should they ever diverge).
    int stored() const;
    bool empty() const { return stored() == 0; }

private:
    const int _capacity;
    const int _key_dim;
    const int _vocab_size;
    const int _lanes;

    RowMatrixXf _keys;     // [lanes * capacity, key_dim]
    RowMatrixXi _symbols;  // [lanes, capacity]

    std::vector<int> _cursor;  // next slot to overwrite, per lane
    std::vector<int> _filled;  // valid entries, per lane, capped at capacity
};
