#pragma once
#include "matrix.hpp"
#include <vector>

/**
 * @brief Averages the input gradients returned by the property heads.
 *
 * The result is the elementwise sum of the gradients divided by their count,
 * i.e. the gradient every head agrees to send to the shared encoder.
 *
 * @throws std::invalid_argument on an empty list or mismatching shapes
 */
Matrix merge_head_gradients(const std::vector<Matrix>& head_gradients);
