#include "block_dataset.hpp"
#include "grid_search.hpp"
#include "gru_model.hpp"
#include "streaming_evaluator.hpp"
#include "utils/config.hpp"
#include "utils/model_weights.hpp"

#include <iostream>
#include <chrono>
#include <iomanip>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>
#include <filesystem>

namespace {

struct Args {
    std::optional<std::filesystem::path> model_path;
    std::optional<std::string> random_model;  // "vocab,emb,hid,layers"
    std::filesystem::path data_path;
    EvalConfig eval;
    bool grid = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " (--model_path <weights_dir> | --random_model V,E,H,L) --data <tokens.npy>\n"
              << "    [--alpha 0.1] [--theta 0.1] [--mode linear|global] [--cache_size 500]\n"
              << "    [--batch_size 50] [--bptt 35] [--grid] [--verbose]\n";
}

// Fetches the value after a flag, or throws if there isn't one.
std::string next_value(int argc, char** argv, int& i) {
    if (i + 1 >= argc) throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
    return argv[++i];
}

Args parse_args(int argc, char** argv) {
    Args args;
    bool have_data = false;

    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--model_path") args.model_path = next_value(argc, argv, i);
        else if (flag == "--random_model") args.random_model = next_value(argc, argv, i);
        else if (flag == "--data") { args.data_path = next_value(argc, argv, i); have_data = true; }
        else if (flag == "--alpha") args.eval.cache.alpha = std::stof(next_value(argc, argv, i));
        else if (flag == "--theta") args.eval.cache.theta = std::stof(next_value(argc, argv, i));
        else if (flag == "--mode") args.eval.cache.mode = parse_mode(next_value(argc, argv, i));
        else if (flag == "--cache_size") args.eval.cache.cache_capacity = std::stoi(next_value(argc, argv, i));
        else if (flag == "--batch_size") args.eval.batch_size = std::stoi(next_value(argc, argv, i));
        else if (flag == "--bptt") args.eval.bptt = std::stoi(next_value(argc, argv, i));
        else if (flag == "--grid") args.grid = true;
        else if (flag == "--verbose") args.eval.verbose = true;
        else throw std::invalid_argument("Unknown argument " + flag);
    }

    if (!have_data) throw std::invalid_argument("--data is required");
    if (args.model_path.has_value() == args.random_model.has_value()) {
        throw std::invalid_argument("Pass exactly one of --model_path and --random_model");
    }
    return args;
}

ModelConfig parse_random_model(const std::string& spec) {
    std::vector<int> dims;
    std::stringstream ss(spec);
    std::string item;
    while (std::getline(ss, item, ',')) dims.push_back(std::stoi(item));
    if (dims.size() != 4) {
        throw std::invalid_argument("--random_model expects V,E,H,L, got '" + spec + "'");
    }
    return ModelConfig{.vocab_size = dims[0], .emb_dim = dims[1], .hid_dim = dims[2], .num_layers = dims[3]};
}

}

int main(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto start_time = std::chrono::high_resolution_clock::now();

        ModelConfig model_config = args.model_path
            ? ModelConfig::from_weights_dir(*args.model_path)
            : parse_random_model(*args.random_model);

        ModelWeights weights(model_config);
        if (args.model_path) {
            std::cout << "Loading model from: " << args.model_path->string() << std::endl;
            weights.load_weights(*args.model_path);
        } else {
            std::cout << "Using a random model" << std::endl;
            weights.init_data_random();
        }
        std::cout << "vocab_size: " << model_config.vocab_size << "\n"
                  << "emb_dim: " << model_config.emb_dim << "\n"
                  << "hid_dim: " << model_config.hid_dim << "\n"
                  << "num_layers: " << model_config.num_layers << "\n\n";

        GRULanguageModel model(weights);

        std::cout << "Loading data from: " << args.data_path.string() << std::endl;
        BlockDataset dataset = BlockDataset::from_npy(args.data_path, args.eval.batch_size, args.eval.bptt);
        std::cout << dataset.num_targets() << " target tokens in " << dataset.size() << " chunks\n";

        args.eval.cache.key_dim = model.hidden_dim();
        args.eval.cache.vocab_size = model.vocab_size();

        if (args.grid) {
            std::cout << format_grid_table(grid_search(model, dataset, args.eval));
        } else {
            std::cout << "mode: " << to_string(args.eval.cache.mode)
                      << " alpha: " << args.eval.cache.alpha
                      << " theta: " << args.eval.cache.theta
                      << " cache_size: " << args.eval.cache.cache_capacity << "\n";

            StreamingEvaluator evaluator(model, args.eval);
            double ppl = evaluator.run(dataset);
            std::cout << std::fixed << std::setprecision(4) << ppl << "\n";
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        std::cout << "Evaluation done in " << duration.count() << "ms\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
