#pragma once
#include <Eigen/Dense>

// Stores weights and biases, PyTorch layout.
// Projects from [in_dim => out_dim], weight is [out_dim, in_dim], bias is [out_dim].
struct Linear {
    Eigen::MatrixXf weight;
    Eigen::RowVectorXf bias;

    // x: [rows, in_dim] -> [rows, out_dim]
    template <typename Derived>
    Eigen::MatrixXf forward(const Eigen::MatrixBase<Derived>& x) const {
        Eigen::MatrixXf y = x * weight.transpose();
        y.rowwise() += bias;
        return y;
    }
};

// One GRU layer. Both projections stack the gates as [r; z; n], so weight is [3 * hid, in].
struct GRULayerWeights {
    Linear input;   // weight_ih / bias_ih
    Linear hidden;  // weight_hh / bias_hh
};
