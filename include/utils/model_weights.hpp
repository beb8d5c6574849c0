#pragma once
#include "utils/config.hpp"
#include "layer_weights.hpp"
#include <vector>
#include <filesystem>

// Weights of the recurrent language model: embedding -> stacked GRU -> output projection.
class ModelWeights {
public:
    explicit ModelWeights(const ModelConfig& config);

    // Load all weights from directory (one .npy file per tensor, PyTorch state_dict names)
    void load_weights(const std::filesystem::path& dir_path);

    // N(0, stddev) everywhere, deterministic for a given seed.
    void init_data_random(unsigned int seed = 0, float stddev = 0.1f);

    // Throws if any tensor disagrees with the config.
    void verify_sizes() const;

    // Getters for different components
    const Eigen::MatrixXf& embeddings() const { return _embeddings; }
    const std::vector<GRULayerWeights>& layers() const { return _layers; }
    const Linear& project() const { return _project; }

    const ModelConfig& config() const { return _config; }

private:
    const ModelConfig _config;

    Eigen::MatrixXf _embeddings;  // [vocab_size, emb_dim]

    std::vector<GRULayerWeights> _layers;

    Linear _project;  // [hid_dim -> vocab_size]

    // Helper methods for loading specific components
    void load_embeddings(const std::filesystem::path& dir_path);
    void load_rnn_layer(int layer_idx, const std::filesystem::path& dir_path);
    void load_projection(const std::filesystem::path& dir_path);
};
