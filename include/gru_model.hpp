#pragma once
#include "sequence_model.hpp"
#include "utils/model_weights.hpp"

// Embedding -> stacked GRU -> full softmax projection (unnormalized logits).
// Hidden vectors handed to the cache are the top layer's outputs.
class GRULanguageModel : public SequenceModel {
public:
    explicit GRULanguageModel(const ModelWeights& model);

    StepOutput step(const RowMatrixXi& inputs, ModelState state) const override;

    int hidden_dim() const override { return _model.config().hid_dim; }
    int vocab_size() const override { return _model.config().vocab_size; }


    // [lanes, hid_dim] zeros for every layer
    ModelState initial_state(int lanes) const;

    // One GRU cell update. x: [lanes, in_dim], h: [lanes, hid_dim]
    Eigen::MatrixXf gru_cell(const Eigen::MatrixXf& x, const Eigen::MatrixXf& h, const GRULayerWeights& layer) const;

private:
    const ModelWeights& _model;

    Eigen::MatrixXf embed(const Eigen::VectorXi& tokens) const;
};
