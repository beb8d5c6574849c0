#include "block_dataset.hpp"
#include "utils/weight_utils.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

BlockDataset::BlockDataset(const std::vector<int>& tokens, int lanes, int bptt) : _bptt(bptt) {
    if (lanes <= 0 || bptt <= 0) {
        std::ostringstream oss;
        oss << "BlockDataset: lanes and bptt must be > 0, got lanes=" << lanes << " bptt=" << bptt;
        throw std::invalid_argument(oss.str());
    }

    const int n = static_cast<int>(tokens.size()) / lanes;
    if (n < 2) {
        std::ostringstream oss;
        oss << "BlockDataset: " << tokens.size() << " tokens is not enough for " << lanes
            << " lanes (need at least 2 per lane)";
        throw std::invalid_argument(oss.str());
    }

    // column l is lane l; leftover tokens at the end of the stream are dropped
    _data.resize(n, lanes);
    for (int lane = 0; lane < lanes; ++lane) {
        for (int t = 0; t < n; ++t) {
            _data(t, lane) = tokens[static_cast<size_t>(lane) * n + t];
        }
    }

    _num_chunks = (n - 1 + bptt - 1) / bptt;
}

BlockDataset BlockDataset::from_npy(const std::filesystem::path& path, int lanes, int bptt) {
    try {
        return BlockDataset(weight_utils::load_token_ids(path), lanes, bptt);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load dataset " + path.string() + ": " + std::string(e.what()));
    }
}

Chunk BlockDataset::operator[](int chunk_idx) const {
    if (chunk_idx < 0 || chunk_idx >= _num_chunks) {
        throw std::out_of_range("BlockDataset: chunk " + std::to_string(chunk_idx) + " out of " +
            std::to_string(_num_chunks));
    }

    int start = chunk_idx * _bptt;
    int len = std::min(_bptt, steps_per_lane() - 1 - start);

    return Chunk{
        .input = _data.middleRows(start, len),
        .target = _data.middleRows(start + 1, len)
    };
}
