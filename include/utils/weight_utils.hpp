#pragma once
#include "utils/eigen_types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace weight_utils {
    // Load 1D tensor (bias vectors)
    Eigen::RowVectorXf load_1d_tensor(const std::filesystem::path& path);

    // Load 2D tensor (weight matrices). .npy files are C-ordered, so this maps row-major.
    Eigen::MatrixXf load_2d_tensor(const std::filesystem::path& path);

    // Token id stream; accepts int32 and int64 arrays of any shape, flattened.
    // Float and unsigned arrays are rejected from the header's dtype, not guessed from word size.
    std::vector<int> load_token_ids(const std::filesystem::path& path);

    // Shape only, without copying data out.
    std::vector<size_t> peek_shape(const std::filesystem::path& path);

    // Verify tensor dimensions match expected shape
    void assert_tensor_shape(const Eigen::MatrixXf& tensor, int rows, int cols, std::string tensor_name = "[no_name]");
    void assert_tensor_shape(const RowMatrixXf& tensor, int rows, int cols, std::string tensor_name = "[no_name]");
    void assert_vector_shape(const Eigen::RowVectorXf& vector, int size, std::string vector_name = "[no_name]");
}
