#pragma once
#include "utils/eigen_types.hpp"

#include <vector>

// Recurrent state threaded from one step() call to the next. The evaluator only carries it
// around; what the layers mean is up to the model. Empty means "start of sequence".
struct ModelState {
    std::vector<Eigen::MatrixXf> layers;

    bool empty() const { return layers.empty(); }
};

struct StepOutput {
    std::vector<RowMatrixXf> hidden;  // [time] x [lanes, hidden_dim]
    std::vector<RowMatrixXf> logits;  // [time] x [lanes, vocab_size], unnormalized
    ModelState state;
};

// Anything that can run a [time, lanes] block of token ids and give back per-step hidden
// vectors and base logits. The cache never looks inside the model.
class SequenceModel {
public:
    virtual ~SequenceModel() = default;

    // inputs: [time, lanes]. state is taken by value and the updated one is returned,
    // so a model never keeps hidden state of its own between calls.
    virtual StepOutput step(const RowMatrixXi& inputs, ModelState state) const = 0;

    virtual int hidden_dim() const = 0;
    virtual int vocab_size() const = 0;
};
