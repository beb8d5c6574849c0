#include "utils/model_weights.hpp"
#include "utils/weight_utils.hpp"
#include <random>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

ModelWeights::ModelWeights(const ModelConfig& config) : _config(config) {
    _config.validate();
    _layers.resize(config.num_layers);
}

namespace {
    fs::path layer_file(const fs::path& dir_path, const std::string& name, int layer_idx) {
        return dir_path / ("rnn." + name + "_l" + std::to_string(layer_idx) + ".npy");
    }

    void assert_linear(const Linear& input, int in_dim, int out_dim, const std::string& name) {
        weight_utils::assert_tensor_shape(input.weight, out_dim, in_dim, name + " weight");
        weight_utils::assert_vector_shape(input.bias, out_dim, name + " bias");
    }

    Eigen::MatrixXf random_2d(std::mt19937& rng, int rows, int cols, float stddev) {
        std::normal_distribution<float> nd(0.0f, stddev);
        return Eigen::MatrixXf::NullaryExpr(rows, cols, [&]() { return nd(rng); });
    }

    Eigen::RowVectorXf random_1d(std::mt19937& rng, int size, float stddev) {
        std::normal_distribution<float> nd(0.0f, stddev);
        return Eigen::RowVectorXf::NullaryExpr(size, [&]() { return nd(rng); });
    }

    Linear random_linear(std::mt19937& rng, int in_dim, int out_dim, float stddev) {
        return Linear{
            .weight = random_2d(rng, out_dim, in_dim, stddev),
            .bias = random_1d(rng, out_dim, stddev)
        };
    }
}

void ModelWeights::verify_sizes() const {
    weight_utils::assert_tensor_shape(_embeddings, _config.vocab_size, _config.emb_dim, "embeddings");

    for (int layer_idx = 0; layer_idx < _config.num_layers; ++layer_idx) {
        const auto& layer = _layers[layer_idx];
        int in_dim = layer_idx == 0 ? _config.emb_dim : _config.hid_dim;

        assert_linear(layer.input, in_dim, 3 * _config.hid_dim, "GRU input projection #" + std::to_string(layer_idx));
        assert_linear(layer.hidden, _config.hid_dim, 3 * _config.hid_dim, "GRU hidden projection #" + std::to_string(layer_idx));
    }

    assert_linear(_project, _config.hid_dim, _config.vocab_size, "output projection");
}

void ModelWeights::init_data_random(unsigned int seed, float stddev) {
    std::mt19937 rng(seed);

    _embeddings = random_2d(rng, _config.vocab_size, _config.emb_dim, stddev);

    for (int layer_idx = 0; layer_idx < _config.num_layers; ++layer_idx) {
        int in_dim = layer_idx == 0 ? _config.emb_dim : _config.hid_dim;
        _layers[layer_idx].input = random_linear(rng, in_dim, 3 * _config.hid_dim, stddev);
        _layers[layer_idx].hidden = random_linear(rng, _config.hid_dim, 3 * _config.hid_dim, stddev);
    }

    _project = random_linear(rng, _config.hid_dim, _config.vocab_size, stddev);
}

void ModelWeights::load_weights(const fs::path& dir_path) {
    load_embeddings(dir_path);

    for (int i = 0; i < _config.num_layers; i++) {
        load_rnn_layer(i, dir_path);
    }

    load_projection(dir_path);

    verify_sizes();
}

void ModelWeights::load_embeddings(const fs::path& dir_path) {
    try {
        _embeddings = weight_utils::load_2d_tensor(dir_path / "embeddings.weight.npy");
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load embeddings: " + std::string(e.what()));
    }
}

void ModelWeights::load_rnn_layer(int layer_idx, const fs::path& dir_path) {
    try {
        auto& layer = _layers[layer_idx];

        layer.input = Linear{
            .weight = weight_utils::load_2d_tensor(layer_file(dir_path, "weight_ih", layer_idx)),
            .bias = weight_utils::load_1d_tensor(layer_file(dir_path, "bias_ih", layer_idx))
        };

        layer.hidden = Linear{
            .weight = weight_utils::load_2d_tensor(layer_file(dir_path, "weight_hh", layer_idx)),
            .bias = weight_utils::load_1d_tensor(layer_file(dir_path, "bias_hh", layer_idx))
        };
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load GRU layer " + std::to_string(layer_idx) + ": " + std::string(e.what()));
    }
}

void ModelWeights::load_projection(const fs::path& dir_path) {
    try {
        _project = Linear{
            .weight = weight_utils::load_2d_tensor(dir_path / "project.weight.npy"),
            .bias = weight_utils::load_1d_tensor(dir_path / "project.bias.npy")
        };
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load output projection: " + std::string(e.what()));
    }
}
