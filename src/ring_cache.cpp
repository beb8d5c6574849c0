#include "ring_cache.hpp"
#include "utils/weight_utils.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace {
    int checked(int value, const char* name) {
        if (value <= 0) {
            std::ostringstream oss;
            oss << "RingCache: " << name << " must be > 0, got " << value;
            throw std::invalid_argument(oss.str());
        }
        return value;
    }
}

RingCache::RingCache(int capacity, int key_dim, int vocab_size, int lanes)
    : _capacity(checked(capacity, "capacity")),
      _key_dim(checked(key_dim, "key_dim")),
      _vocab_size(checked(vocab_size, "vocab_size")),
      _lanes(checked(lanes, "lanes")),
      _keys(RowMatrixXf::Zero(static_cast<Eigen::Index>(lanes) * capacity, key_dim)),
      _symbols(RowMatrixXi::Zero(lanes, capacity)),
      _cursor(lanes, 0),
      _filled(lanes, 0) {}

RingCache::RingCache(const CacheConfig& config, int lanes)
    : RingCache(config.cache_capacity, config.key_dim, config.vocab_size, lanes) {}

int RingCache::stored() const {
    return *std::min_element(_filled.begin(), _filled.end());
}

void RingCache::insert(const RowMatrixXf& keys, const Eigen::VectorXi& symbols) {
    // check everything before touching a single lane
    weight_utils::assert_tensor_shape(keys, _lanes, _key_dim, "cache insert keys");
    if (symbols.size() != _lanes) {
        std::ostringstream oss;
        oss << "RingCache: insert got " << symbols.size() << " symbols for " << _lanes << " lanes";
        throw std::runtime_error(oss.str());
    }

    for (int lane = 0; lane < _lanes; ++lane) {
        int slot = _cursor[lane];
        _keys.row(static_cast<Eigen::Index>(lane) * _capacity + slot) = keys.row(lane);
        _symbols(lane, slot) = symbols(lane);

        _cursor[lane] = (slot + 1) % _capacity;
        _filled[lane] = std::min(_filled[lane] + 1, _capacity);
    }
}

CacheQuery RingCache::query(const RowMatrixXf& probe) const {
    weight_utils::assert_tensor_shape(probe, _lanes, _key_dim, "cache query probe");

    const int width = stored();

    CacheQuery result;
    result.scores.resize(_lanes, width);
    result.symbols.resize(_lanes, width);
    if (width == 0) return result;

    for (int lane = 0; lane < _lanes; ++lane) {
        // [width, key_dim] x [key_dim] -> one score per valid slot
        auto lane_keys = _keys.middleRows(static_cast<Eigen::Index>(lane) * _capacity, width);
        result.scores.row(lane) = (lane_keys * probe.row(lane).transpose()).transpose();
        result.symbols.row(lane) = _symbols.row(lane).head(width);
    }
    return result;
}
