#pragma once

#include <cstddef>
#include <initializer_list>
#include <iostream>
#include <vector>
#include <cereal/types/vector.hpp>

/**
 * @brief Dense float vector used for single rows, biases seen as rows
 * and output distributions.
 */
class Vector {
  private:
    std::vector<float> data_;

  public:
    // Constructors
    Vector() = default;
    explicit Vector(size_t size, float default_value = 0.0f);
    Vector(const std::initializer_list<float>& list);

    template <typename Iterator>
    Vector(Iterator first, Iterator last) : data_(first, last) {}

    // Data access
    float* data() { return data_.data(); }
    const float* data() const { return data_.data(); }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    // Element access
    float& operator[](size_t i) { return data_[i]; }
    const float& operator[](size_t i) const { return data_[i]; }

    /**
     * @brief Bounds-checked element access.
     * @throws std::out_of_range if the index is past the end
     */
    float& at(size_t i);
    const float& at(size_t i) const;

    // Iterator access
    auto begin() { return data_.begin(); }
    auto end() { return data_.end(); }
    auto begin() const { return data_.begin(); }
    auto end() const { return data_.end(); }

    Vector& operator+=(const Vector& other);
    Vector& operator-=(const Vector& other);
    Vector& operator*=(float scalar);
    Vector& operator/=(float scalar);

    void fill(float value);
    float sum() const;

    /**
     * @brief Index of the largest element (first one on ties).
     * @throws std::runtime_error on an empty vector
     */
    size_t argmax() const;

    template <class Archive>
    void serialize(Archive& ar) {
        ar(data_);
    }
};

Vector operator+(const Vector& a, const Vector& b);
Vector operator-(const Vector& a, const Vector& b);
Vector operator*(const Vector& v, float scalar);
std::ostream& operator<<(std::ostream& os, const Vector& v);
