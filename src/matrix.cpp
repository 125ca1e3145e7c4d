#include "../include/matrix.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

Matrix::Matrix() : rows_(0), cols_(0) {}

Matrix::Matrix(size_t rows, size_t cols, float init_val) : rows_(rows), cols_(cols) {
    // Check for overflow in size calculation
    if (cols != 0 && rows > SIZE_MAX / cols) {
        throw std::runtime_error("Matrix dimensions too large - would cause overflow");
    }

    try {
        data_.resize(rows * cols, init_val);
    } catch (const std::bad_alloc& e) {
        throw std::runtime_error("Failed to allocate memory for matrix: " + std::string(e.what()));
    }
}

float& Matrix::operator()(size_t row, size_t col) {
    if (row >= rows_ || col >= cols_) {
        throw std::out_of_range("Matrix index (" + std::to_string(row) + ", " +
                                std::to_string(col) + ") out of range for " +
                                std::to_string(rows_) + "x" + std::to_string(cols_));
    }
    return data_[row * cols_ + col];
}

const float& Matrix::operator()(size_t row, size_t col) const {
    if (row >= rows_ || col >= cols_) {
        throw std::out_of_range("Matrix index (" + std::to_string(row) + ", " +
                                std::to_string(col) + ") out of range for " +
                                std::to_string(rows_) + "x" + std::to_string(cols_));
    }
    return data_[row * cols_ + col];
}

Vector Matrix::row(size_t row) const {
    if (row >= rows_) {
        throw std::out_of_range("Matrix row " + std::to_string(row) + " out of range");
    }
    auto first = data_.begin() + static_cast<std::ptrdiff_t>(row * cols_);
    return Vector(first, first + static_cast<std::ptrdiff_t>(cols_));
}

void Matrix::set_row(size_t row, const Vector& values) {
    if (row >= rows_) {
        throw std::out_of_range("Matrix row " + std::to_string(row) + " out of range");
    }
    if (values.size() != cols_) {
        throw std::invalid_argument("Row length " + std::to_string(values.size()) +
                                    " does not match matrix width " + std::to_string(cols_));
    }
    std::copy(values.begin(), values.end(), data_.begin() + static_cast<std::ptrdiff_t>(row * cols_));
}

void Matrix::add_to_row(size_t row, const Vector& values) {
    if (row >= rows_) {
        throw std::out_of_range("Matrix row " + std::to_string(row) + " out of range");
    }
    if (values.size() != cols_) {
        throw std::invalid_argument("Row length " + std::to_string(values.size()) +
                                    " does not match matrix width " + std::to_string(cols_));
    }
    float* dst = data_.data() + row * cols_;
    for (size_t j = 0; j < cols_; ++j) {
        dst[j] += values[j];
    }
}

Matrix Matrix::transpose() const {
    Matrix result(cols_, rows_);
#pragma omp parallel for
    for (size_t i = 0; i < rows_; ++i) {
        for (size_t j = 0; j < cols_; ++j) {
            result.data_[j * rows_ + i] = data_[i * cols_ + j];
        }
    }
    return result;
}

void Matrix::fill(float value) {
    std::fill(data_.begin(), data_.end(), value);
}

void Matrix::randomize(float min_val, float max_val, std::mt19937& gen) {
    std::uniform_real_distribution<float> dis(min_val, max_val);
    for (auto& value : data_) {
        value = dis(gen);
    }
}

void Matrix::add_bias(const Matrix& bias) {
    if (bias.rows() != 1 || bias.cols() != cols_) {
        throw std::invalid_argument("Bias of shape " + std::to_string(bias.rows()) + "x" +
                                    std::to_string(bias.cols()) + " cannot be added to " +
                                    std::to_string(rows_) + "x" + std::to_string(cols_));
    }
#pragma omp parallel for
    for (size_t i = 0; i < rows_; ++i) {
        for (size_t j = 0; j < cols_; ++j) {
            data_[i * cols_ + j] += bias.data_[j];
        }
    }
}

void Matrix::apply_softmax() {
#pragma omp parallel for
    for (size_t i = 0; i < rows_; ++i) {
        float* row_data = data_.data() + i * cols_;
        float max_val = *std::max_element(row_data, row_data + cols_);
        float sum = 0.0f;
        for (size_t j = 0; j < cols_; ++j) {
            row_data[j] = std::exp(row_data[j] - max_val);
            sum += row_data[j];
        }
        for (size_t j = 0; j < cols_; ++j) {
            row_data[j] /= sum;
        }
    }
}

void Matrix::apply_tanh() {
    for (auto& value : data_) {
        value = std::tanh(value);
    }
}

Matrix Matrix::column_sum() const {
    Matrix result(1, cols_);
    for (size_t i = 0; i < rows_; ++i) {
        for (size_t j = 0; j < cols_; ++j) {
            result.data_[j] += data_[i * cols_ + j];
        }
    }
    return result;
}

float Matrix::squared_norm() const {
    float sum = 0.0f;
    for (float value : data_) {
        sum += value * value;
    }
    return sum;
}

Matrix& Matrix::operator+=(const Matrix& other) {
    if (rows_ != other.rows_ || cols_ != other.cols_) {
        throw std::invalid_argument("Matrix dimensions must match for addition: " +
                                    std::to_string(rows_) + "x" + std::to_string(cols_) + " vs " +
                                    std::to_string(other.rows_) + "x" + std::to_string(other.cols_));
    }
    for (size_t i = 0; i < data_.size(); ++i) {
        data_[i] += other.data_[i];
    }
    return *this;
}

Matrix& Matrix::operator-=(const Matrix& other) {
    if (rows_ != other.rows_ || cols_ != other.cols_) {
        throw std::invalid_argument("Matrix dimensions must match for subtraction: " +
                                    std::to_string(rows_) + "x" + std::to_string(cols_) + " vs " +
                                    std::to_string(other.rows_) + "x" + std::to_string(other.cols_));
    }
    for (size_t i = 0; i < data_.size(); ++i) {
        data_[i] -= other.data_[i];
    }
    return *this;
}

Matrix& Matrix::operator*=(float scalar) {
    for (auto& value : data_) {
        value *= scalar;
    }
    return *this;
}

Matrix& Matrix::operator/=(float scalar) {
    if (scalar == 0.0f) {
        throw std::invalid_argument("Matrix division by zero");
    }
    for (auto& value : data_) {
        value /= scalar;
    }
    return *this;
}

Matrix operator+(const Matrix& a, const Matrix& b) {
    Matrix result(a);
    result += b;
    return result;
}

Matrix operator-(const Matrix& a, const Matrix& b) {
    Matrix result(a);
    result -= b;
    return result;
}

Matrix operator*(const Matrix& m, float scalar) {
    Matrix result(m);
    result *= scalar;
    return result;
}

Matrix matmul(const Matrix& a, const Matrix& b) {
    if (a.cols() != b.rows()) {
        throw std::invalid_argument("Matrix dimensions mismatch for multiplication: " +
                                    std::to_string(a.rows()) + "x" + std::to_string(a.cols()) +
                                    " * " + std::to_string(b.rows()) + "x" +
                                    std::to_string(b.cols()));
    }

    Matrix result(a.rows(), b.cols());
    const size_t inner = a.cols();
    const size_t out_cols = b.cols();
    const float* a_data = a.data();
    const float* b_data = b.data();
    float* r_data = result.data();

#pragma omp parallel for
    for (size_t i = 0; i < a.rows(); ++i) {
        for (size_t k = 0; k < inner; ++k) {
            const float a_ik = a_data[i * inner + k];
            for (size_t j = 0; j < out_cols; ++j) {
                r_data[i * out_cols + j] += a_ik * b_data[k * out_cols + j];
            }
        }
    }
    return result;
}

Matrix hadamard(const Matrix& a, const Matrix& b) {
    if (a.rows() != b.rows() || a.cols() != b.cols()) {
        throw std::invalid_argument("Matrix dimensions must match for elementwise product");
    }
    Matrix result(a.rows(), a.cols());
    for (size_t i = 0; i < a.size(); ++i) {
        result.data()[i] = a.data()[i] * b.data()[i];
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const Matrix& m) {
    os << "Matrix " << m.rows() << "x" << m.cols() << ":\n";
    for (size_t i = 0; i < m.rows(); ++i) {
        for (size_t j = 0; j < m.cols(); ++j) {
            os << m(i, j) << (j + 1 < m.cols() ? " " : "");
        }
        os << "\n";
    }
    return os;
}
