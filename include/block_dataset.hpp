#pragma once
#include "utils/eigen_types.hpp"

#include <filesystem>
#include <vector>

struct Chunk {
    RowMatrixXi input;   // [time, lanes]
    RowMatrixXi target;  // [time, lanes], input shifted one step ahead
};

// Lays a flat token stream out as `lanes` contiguous columns and cuts it into bptt-long chunks.
//
// The stream is truncated to a multiple of lanes; lane l gets tokens [l * n, (l + 1) * n).
// Chunk k covers time steps [k * bptt, k * bptt + len) with len = min(bptt, n - 1 - k * bptt),
// so the last chunk can be short.
class BlockDataset {
public:
    BlockDataset(const std::vector<int>& tokens, int lanes, int bptt);

    // 1D int32/int64 .npy file of token ids.
    static BlockDataset from_npy(const std::filesystem::path& path, int lanes, int bptt);

    int size() const { return _num_chunks; }
    Chunk operator[](int chunk_idx) const;

    int lanes() const { return _data.cols(); }
    int steps_per_lane() const { return _data.rows(); }

    // Tokens that get scored: every lane's tokens except its first.
    long num_targets() const { return static_cast<long>(steps_per_lane() - 1) * lanes(); }

    class iterator {
    public:
        iterator(const BlockDataset& dataset, int idx) : _dataset(dataset), _idx(idx) {}

        Chunk operator*() const { return _dataset[_idx]; }
        iterator& operator++() { ++_idx; return *this; }
        bool operator!=(const iterator& other) const { return _idx != other._idx; }

    private:
        const BlockDataset& _dataset;
        int _idx;
    };

    iterator begin() const { return iterator(*this, 0); }
    iterator end() const { return iterator(*this, _num_chunks); }

private:
    RowMatrixXi _data;  // [steps_per_lane, lanes]
    int _bptt;
    int _num_chunks;
};
