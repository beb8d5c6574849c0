#include "gru_model.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

GRULanguageModel::GRULanguageModel(const ModelWeights& model) : _model(model) {}

ModelState GRULanguageModel::initial_state(int lanes) const {
    ModelState state;
    state.layers.assign(_model.config().num_layers, Eigen::MatrixXf::Zero(lanes, hidden_dim()));
    return state;
}

Eigen::MatrixXf GRULanguageModel::embed(const Eigen::VectorXi& tokens) const {
    Eigen::MatrixXf x(tokens.size(), _model.config().emb_dim);
    for (int lane = 0; lane < tokens.size(); ++lane) {
        int token = tokens(lane);
        if (token < 0 || token >= vocab_size()) {
            throw std::runtime_error("Token id " + std::to_string(token) + " outside vocabulary of size " +
                std::to_string(vocab_size()));
        }
        x.row(lane) = _model.embeddings().row(token);
    }
    return x;
}

namespace {
    Eigen::MatrixXf sigmoid(const Eigen::MatrixXf& x) {
        return (1.0f + (-x.array()).exp()).inverse().matrix();
    }
}

Eigen::MatrixXf GRULanguageModel::gru_cell(const Eigen::MatrixXf& x, const Eigen::MatrixXf& h, const GRULayerWeights& layer) const {
    const int H = hidden_dim();

    // gates stacked as [r | z | n] along the columns
    Eigen::MatrixXf gi = layer.input.forward(x);   // [lanes, 3H]
    Eigen::MatrixXf gh = layer.hidden.forward(h);  // [lanes, 3H]

    Eigen::MatrixXf r = sigmoid(gi.leftCols(H) + gh.leftCols(H));
    Eigen::MatrixXf z = sigmoid(gi.middleCols(H, H) + gh.middleCols(H, H));
    Eigen::MatrixXf n = (gi.rightCols(H).array() + r.array() * gh.rightCols(H).array()).tanh().matrix();

    return ((1.0f - z.array()) * n.array() + z.array() * h.array()).matrix();
}

StepOutput GRULanguageModel::step(const RowMatrixXi& inputs, ModelState state) const {
    const int T = inputs.rows();
    const int lanes = inputs.cols();

    if (state.empty()) state = initial_state(lanes);

    if (static_cast<int>(state.layers.size()) != _model.config().num_layers) {
        throw std::runtime_error("GRU state has " + std::to_string(state.layers.size()) + " layers, model has " +
            std::to_string(_model.config().num_layers));
    }
    for (const auto& h : state.layers) {
        if (h.rows() != lanes || h.cols() != hidden_dim()) {
            std::ostringstream oss;
            oss << "GRU state shape mismatch: expected [" << lanes << ", " << hidden_dim()
                << "], got [" << h.rows() << ", " << h.cols() << "]";
            throw std::runtime_error(oss.str());
        }
    }

    StepOutput out;
    out.hidden.reserve(T);
    out.logits.reserve(T);

    for (int t = 0; t < T; ++t) {
        Eigen::MatrixXf x = embed(inputs.row(t).transpose());

        for (int layer_idx = 0; layer_idx < _model.config().num_layers; ++layer_idx) {
            state.layers[layer_idx] = gru_cell(x, state.layers[layer_idx], _model.layers()[layer_idx]);
            x = state.layers[layer_idx];
        }

        out.hidden.emplace_back(x);
        out.logits.emplace_back(_model.project().forward(x));
    }

    out.state = std::move(state);
    return out;
}
