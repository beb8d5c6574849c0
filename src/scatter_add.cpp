#include "scatter_add.hpp"

#include <cassert>
#include <sstream>
#include <stdexcept>

namespace {
    void check_scatter_shapes(const RowMatrixXf& target, const RowMatrixXi& index, const RowMatrixXf& src) {
        if (index.rows() != target.rows() || src.rows() != target.rows() || index.cols() != src.cols()) {
            std::ostringstream oss;
            oss << "scatter_add shape mismatch: target [" << target.rows() << ", " << target.cols() << "]"
                << ", index [" << index.rows() << ", " << index.cols() << "]"
                << ", src [" << src.rows() << ", " << src.cols() << "]";
            throw std::runtime_error(oss.str());
        }
    }
}

void scatter_add(RowMatrixXf& target, const RowMatrixXi& index, const RowMatrixXf& src) {
    check_scatter_shapes(target, index, src);

    const Eigen::Index lanes = index.rows();
    const Eigen::Index width = index.cols();
    const Eigen::Index vocab = target.cols();

    // Per-element lane offsets: [lanes, width] of lane * vocab.
    Eigen::Matrix<Eigen::Index, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> offsets =
        (Eigen::Matrix<Eigen::Index, Eigen::Dynamic, 1>::LinSpaced(lanes, 0, lanes - 1) * vocab)
            .replicate(1, width);
    offsets += index.cast<Eigen::Index>();

    // Everything is row-major, so the three buffers line up element for element.
    float* flat_target = target.data();
    const Eigen::Index* flat_offsets = offsets.data();
    const float* flat_src = src.data();

    for (Eigen::Index k = 0; k < lanes * width; ++k) {
        assert(flat_offsets[k] >= 0 && flat_offsets[k] < lanes * vocab && "scatter index out of range");
        flat_target[flat_offsets[k]] += flat_src[k];
    }
}

void scatter_add_naive(RowMatrixXf& target, const RowMatrixXi& index, const RowMatrixXf& src) {
    check_scatter_shapes(target, index, src);

    for (int lane = 0; lane < index.rows(); ++lane) {
        for (int slot = 0; slot < index.cols(); ++slot) {
            int symbol = index(lane, slot);
            assert(0 <= symbol && symbol < target.cols() && "scatter index out of range");
            target(lane, symbol) += src(lane, slot);
        }
    }
}
