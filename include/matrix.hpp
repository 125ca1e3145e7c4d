#pragma once
#include <cstddef>
#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>
#include <cereal/types/vector.hpp>
#include "vector.hpp"

/**
 * @brief A row-major 2D matrix used by every layer of the predictor.
 *
 * Rows are sequence positions (pieces or tokens) and columns are features
 * throughout the code base. Features include:
 * - Bounds-checked element access
 * - Row extraction and assignment
 * - Neural network helpers (bias broadcast, row-wise softmax, tanh)
 * - Binary serialization through cereal
 */
class Matrix {
  private:
    std::vector<float> data_;  ///< Matrix data storage
    size_t rows_;              ///< Number of rows
    size_t cols_;              ///< Number of columns

  public:
    /**
     * @brief Default constructor, creates an empty 0x0 matrix.
     */
    Matrix();

    /**
     * @brief Constructs a matrix with specified dimensions.
     * @param rows Number of rows
     * @param cols Number of columns
     * @param init_val Initial value for all elements (default: 0.0f)
     * @throws std::runtime_error if the element count would overflow
     */
    Matrix(size_t rows, size_t cols, float init_val = 0.0f);

    size_t rows() const {
        return rows_;
    }

    size_t cols() const {
        return cols_;
    }

    size_t size() const {
        return data_.size();
    }

    bool empty() const {
        return data_.empty();
    }

    float* data() {
        return data_.data();
    }

    const float* data() const {
        return data_.data();
    }

    /**
     * @brief Element access with bounds checking.
     * @throws std::out_of_range if the indices are outside the matrix
     */
    float& operator()(size_t row, size_t col);
    const float& operator()(size_t row, size_t col) const;

    /**
     * @brief Copies one row into a Vector.
     * @param row Row index
     * @return Vector of length cols()
     */
    Vector row(size_t row) const;

    /**
     * @brief Overwrites one row.
     * @throws std::invalid_argument if the vector length differs from cols()
     */
    void set_row(size_t row, const Vector& values);

    /**
     * @brief Adds a vector to one row in place.
     */
    void add_to_row(size_t row, const Vector& values);

    Matrix transpose() const;

    void fill(float value);

    /**
     * @brief Fills the matrix with uniform values in [min_val, max_val].
     */
    void randomize(float min_val, float max_val, std::mt19937& gen);

    /**
     * @brief Adds a 1 x cols bias row to every row.
     * @throws std::invalid_argument on shape mismatch
     */
    void add_bias(const Matrix& bias);

    /**
     * @brief Row-wise numerically stable softmax in place.
     */
    void apply_softmax();

    void apply_tanh();

    /**
     * @brief Sums the rows into a 1 x cols matrix.
     */
    Matrix column_sum() const;

    float squared_norm() const;

    Matrix& operator+=(const Matrix& other);
    Matrix& operator-=(const Matrix& other);
    Matrix& operator*=(float scalar);
    Matrix& operator/=(float scalar);

    template <class Archive>
    void serialize(Archive& ar) {
        ar(rows_, cols_, data_);
    }
};

Matrix operator+(const Matrix& a, const Matrix& b);
Matrix operator-(const Matrix& a, const Matrix& b);
Matrix operator*(const Matrix& m, float scalar);

/**
 * @brief Matrix product a x b.
 * @throws std::invalid_argument if a.cols() != b.rows()
 */
Matrix matmul(const Matrix& a, const Matrix& b);

/**
 * @brief Elementwise product.
 * @throws std::invalid_argument on shape mismatch
 */
Matrix hadamard(const Matrix& a, const Matrix& b);

std::ostream& operator<<(std::ostream& os, const Matrix& m);
