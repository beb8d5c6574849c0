#include "utils/weight_utils.hpp"
#include <cnpy.h>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace weight_utils {
    namespace {
        cnpy::NpyArray load_float_array(const std::filesystem::path& path, size_t expected_dims) {
            cnpy::NpyArray arr = cnpy::npy_load(path.string());
            if (arr.word_size != sizeof(float)) {
                throw std::runtime_error("Expected float32 data in " + path.string() +
                    ", got word size " + std::to_string(arr.word_size));
            }
            if (arr.fortran_order) {
                throw std::runtime_error("Fortran-ordered arrays are not supported: " + path.string());
            }
            if (arr.shape.size() != expected_dims) {
                throw std::runtime_error("Expected a " + std::to_string(expected_dims) + "D array in " +
                    path.string() + ", got " + std::to_string(arr.shape.size()) + "D");
            }
            return arr;
        }
    }

    Eigen::RowVectorXf load_1d_tensor(const std::filesystem::path& path) {
        cnpy::NpyArray arr = load_float_array(path, 1);
        return Eigen::Map<Eigen::RowVectorXf>(arr.data<float>(), arr.shape[0]);
    }

    Eigen::MatrixXf load_2d_tensor(const std::filesystem::path& path) {
        cnpy::NpyArray arr = load_float_array(path, 2);
        // copy out of the row-major buffer; Eigen::MatrixXf itself is column-major
        return Eigen::Map<RowMatrixXf>(
            arr.data<float>(),
            arr.shape[0],
            arr.shape[1]
        );
    }

    namespace {
        // cnpy drops the dtype kind, so read the 'descr' entry (e.g. '<i8') from the header dict.
        std::string read_npy_descr(const std::filesystem::path& path) {
            std::ifstream file(path, std::ios::binary);
            if (!file) throw std::runtime_error("Cannot open " + path.string());

            char preamble[8];
            if (!file.read(preamble, sizeof(preamble)) || std::string(preamble, 6) != "\x93NUMPY") {
                throw std::runtime_error("Not a .npy file: " + path.string());
            }
            // version 1.x stores a 2-byte header length, 2.x and later a 4-byte one
            const int len_bytes = preamble[6] == 1 ? 2 : 4;
            unsigned char len_buf[4] = {0, 0, 0, 0};
            if (!file.read(reinterpret_cast<char*>(len_buf), len_bytes)) {
                throw std::runtime_error("Truncated .npy header in " + path.string());
            }
            const size_t header_len = len_buf[0] | (len_buf[1] << 8) | (size_t(len_buf[2]) << 16) | (size_t(len_buf[3]) << 24);

            std::string header(header_len, '\0');
            if (!file.read(header.data(), header_len)) {
                throw std::runtime_error("Truncated .npy header in " + path.string());
            }

            size_t key = header.find("'descr'");
            size_t open = key == std::string::npos ? key : header.find('\'', key + 7);
            size_t close = open == std::string::npos ? open : header.find('\'', open + 1);
            if (close == std::string::npos) {
                throw std::runtime_error("No dtype in .npy header of " + path.string());
            }
            return header.substr(open + 1, close - open - 1);
        }
    }

    std::vector<int> load_token_ids(const std::filesystem::path& path) {
        const std::string descr = read_npy_descr(path);
        if (descr.size() < 2 || descr[1] != 'i') {
            throw std::runtime_error("Token ids in " + path.string() +
                " must be a signed integer array, got dtype '" + descr + "'");
        }
        cnpy::NpyArray arr = cnpy::npy_load(path.string());

        std::vector<int> ids;
        ids.reserve(arr.num_vals);
        if (arr.word_size == sizeof(int32_t)) {
            const int32_t* data = arr.data<int32_t>();
            ids.assign(data, data + arr.num_vals);
        } else if (arr.word_size == sizeof(int64_t)) {
            const int64_t* data = arr.data<int64_t>();
            for (size_t i = 0; i < arr.num_vals; ++i) ids.push_back(static_cast<int>(data[i]));
        } else {
            throw std::runtime_error("Token ids in " + path.string() +
                " must be int32 or int64, got word size " + std::to_string(arr.word_size));
        }
        return ids;
    }

    std::vector<size_t> peek_shape(const std::filesystem::path& path) {
        return cnpy::npy_load(path.string()).shape;
    }

    namespace {
        template <typename Matrix>
        void check_shape(const Matrix& tensor, int rows, int cols, const std::string& tensor_name) {
            if (tensor.rows() != rows || tensor.cols() != cols) {
                std::ostringstream oss;
                oss << "Tensor shape mismatch for '" << tensor_name << "'.\n";
                oss << "Expected dimensions [" << rows << ", " << cols << "]\n";
                oss << "Got dimensions [" << tensor.rows() << ", " << tensor.cols() << "]\n";
                throw std::runtime_error(oss.str());
            }
        }
    }

    void assert_tensor_shape(const Eigen::MatrixXf& tensor, int rows, int cols, std::string tensor_name) {
        check_shape(tensor, rows, cols, tensor_name);
    }

    void assert_tensor_shape(const RowMatrixXf& tensor, int rows, int cols, std::string tensor_name) {
        check_shape(tensor, rows, cols, tensor_name);
    }

    void assert_vector_shape(const Eigen::RowVectorXf& vector, int size, std::string vector_name) {
        if (vector.size() != size) {
            std::ostringstream oss;
            oss << "vector shape mismatch for '" << vector_name << "'.\n";
            oss << "Expected dimensions [" << size << "]\n";
            oss << "Got dimensions [" << vector.size() << "]\n";
            throw std::runtime_error(oss.str());
        }
    }
}
