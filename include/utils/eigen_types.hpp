#pragma once
#include <Eigen/Dense>

// Eigen defaults to column-major. Everything indexed as [lane, vocab] or [time, lane]
// is stored row-major so that a row is contiguous and (row * cols + col) is a valid flat offset.
using RowMatrixXf = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using RowMatrixXi = Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
