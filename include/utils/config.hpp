#pragma once
#include <string>
#include <filesystem>

enum class InterpolationMode {
    Linear,  // mix two separately normalized distributions
    Global   // bump the base logits, then a single softmax
};

InterpolationMode parse_mode(const std::string& name);
std::string to_string(InterpolationMode mode);

// Everything the cache itself needs. Lanes come from EvalConfig::batch_size.
struct CacheConfig {
    int cache_capacity = 500;
    int key_dim = 0;      // must equal the model hidden size
    int vocab_size = 0;

    float alpha = 0.1f;
    float theta = 0.1f;
    InterpolationMode mode = InterpolationMode::Linear;

    void validate() const;
};

struct EvalConfig {
    CacheConfig cache;

    // Only controls how the token stream is partitioned, not the cache.
    int batch_size = 50;
    int bptt = 35;

    bool verbose = false;

    void validate() const;
};

// Shape of the recurrent LM. Can be inferred from a weights directory.
struct ModelConfig {
    int vocab_size = 0;
    int emb_dim = 0;
    int hid_dim = 0;
    int num_layers = 1;

    void validate() const;

    static ModelConfig from_weights_dir(const std::filesystem::path& dir_path);
};
