#include "../include/vector.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

Vector::Vector(size_t size, float default_value) : data_(size, default_value) {}

Vector::Vector(const std::initializer_list<float>& list) : data_(list) {}

float& Vector::at(size_t i) {
    if (i >= data_.size()) {
        throw std::out_of_range("Vector index " + std::to_string(i) + " out of range (size " +
                                std::to_string(data_.size()) + ")");
    }
    return data_[i];
}

const float& Vector::at(size_t i) const {
    if (i >= data_.size()) {
        throw std::out_of_range("Vector index " + std::to_string(i) + " out of range (size " +
                                std::to_string(data_.size()) + ")");
    }
    return data_[i];
}

Vector& Vector::operator+=(const Vector& other) {
    if (data_.size() != other.size()) {
        throw std::invalid_argument("Vector dimensions must match for addition");
    }
    for (size_t i = 0; i < data_.size(); ++i) {
        data_[i] += other.data_[i];
    }
    return *this;
}

Vector& Vector::operator-=(const Vector& other) {
    if (data_.size() != other.size()) {
        throw std::invalid_argument("Vector dimensions must match for subtraction");
    }
    for (size_t i = 0; i < data_.size(); ++i) {
        data_[i] -= other.data_[i];
    }
    return *this;
}

Vector& Vector::operator*=(float scalar) {
    for (auto& value : data_) {
        value *= scalar;
    }
    return *this;
}

Vector& Vector::operator/=(float scalar) {
    if (scalar == 0.0f) {
        throw std::invalid_argument("Vector division by zero");
    }
    for (auto& value : data_) {
        value /= scalar;
    }
    return *this;
}

void Vector::fill(float value) {
    std::fill(data_.begin(), data_.end(), value);
}

float Vector::sum() const {
    return std::accumulate(data_.begin(), data_.end(), 0.0f);
}

size_t Vector::argmax() const {
    if (data_.empty()) {
        throw std::runtime_error("argmax of an empty vector");
    }
    return static_cast<size_t>(std::distance(data_.begin(),
                                             std::max_element(data_.begin(), data_.end())));
}

Vector operator+(const Vector& a, const Vector& b) {
    Vector result(a);
    result += b;
    return result;
}

Vector operator-(const Vector& a, const Vector& b) {
    Vector result(a);
    result -= b;
    return result;
}

Vector operator*(const Vector& v, float scalar) {
    Vector result(v);
    result *= scalar;
    return result;
}

std::ostream& operator<<(std::ostream& os, const Vector& v) {
    os << "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0) {
            os << ", ";
        }
        os << v[i];
    }
    return os << "]";
}
