#pragma once
#include "block_dataset.hpp"
#include "sequence_model.hpp"
#include "utils/config.hpp"

#include <string>
#include <vector>

// theta takes theta_steps values i * theta_step, alpha takes alpha_steps values j * alpha_step.
// The defaults cover theta in [0, 1) by 0.1 and alpha in [0, 0.5) by 0.01.
struct GridSpec {
    int theta_steps = 10;
    float theta_step = 0.1f;
    int alpha_steps = 50;
    float alpha_step = 0.01f;
};

struct GridResult {
    float theta;
    float alpha;
    double perplexity;
};

// One full evaluation per (theta, alpha), each with a fresh cache and fresh model state.
// Everything but alpha/theta comes from base. Results are theta-major.
std::vector<GridResult> grid_search(const SequenceModel& model, const BlockDataset& dataset,
                                    const EvalConfig& base, const GridSpec& spec = GridSpec{});

// Header line, then one "theta alpha ppl" line per result.
std::string format_grid_table(const std::vector<GridResult>& results);
