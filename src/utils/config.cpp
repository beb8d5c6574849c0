#include "utils/config.hpp"
#include "utils/weight_utils.hpp"

#include <stdexcept>
#include <sstream>

namespace fs = std::filesystem;

InterpolationMode parse_mode(const std::string& name) {
    if (name == "linear") return InterpolationMode::Linear;
    if (name == "global") return InterpolationMode::Global;
    throw std::invalid_argument("Unknown interpolation mode '" + name + "', expected 'linear' or 'global'");
}

std::string to_string(InterpolationMode mode) {
    switch (mode) {
        case InterpolationMode::Linear: return "linear";
        case InterpolationMode::Global: return "global";
    }
    throw std::invalid_argument("Invalid InterpolationMode value");
}

namespace {
    void require_positive(int value, const char* name) {
        if (value <= 0) {
            std::ostringstream oss;
            oss << name << " must be > 0, got " << value;
            throw std::invalid_argument(oss.str());
        }
    }
}

void CacheConfig::validate() const {
    require_positive(cache_capacity, "cache_capacity");
    require_positive(key_dim, "key_dim");
    require_positive(vocab_size, "vocab_size");
}

void EvalConfig::validate() const {
    cache.validate();
    require_positive(batch_size, "batch_size");
    require_positive(bptt, "bptt");
}

void ModelConfig::validate() const {
    require_positive(vocab_size, "vocab_size");
    require_positive(emb_dim, "emb_dim");
    require_positive(hid_dim, "hid_dim");
    require_positive(num_layers, "num_layers");
}

ModelConfig ModelConfig::from_weights_dir(const fs::path& dir_path) {
    ModelConfig config;

    auto emb_shape = weight_utils::peek_shape(dir_path / "embeddings.weight.npy");
    if (emb_shape.size() != 2) {
        throw std::runtime_error("embeddings.weight.npy must be 2D");
    }
    config.vocab_size = static_cast<int>(emb_shape[0]);
    config.emb_dim = static_cast<int>(emb_shape[1]);

    // weight_hh is [3 * hid, hid]
    auto hh_shape = weight_utils::peek_shape(dir_path / "rnn.weight_hh_l0.npy");
    if (hh_shape.size() != 2) {
        throw std::runtime_error("rnn.weight_hh_l0.npy must be 2D");
    }
    config.hid_dim = static_cast<int>(hh_shape[1]);

    config.num_layers = 0;
    while (fs::exists(dir_path / ("rnn.weight_ih_l" + std::to_string(config.num_layers) + ".npy"))) {
        ++config.num_layers;
    }

    config.validate();
    return config;
}
