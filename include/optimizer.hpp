#pragma once
#include "components.hpp"
#include <vector>

/**
 * @brief Implements the Adam optimizer, optionally rectified (RAdam).
 *
 * The optimizer keeps first and second moment estimates for every
 * registered Parameter and applies one update per step() from the gradients
 * accumulated since the previous step:
 * m_t = β₁m_{t-1} + (1-β₁)g_t
 * v_t = β₂v_{t-1} + (1-β₂)g_t²
 * θ_t = θ_{t-1} - α·r_t·m̂_t/(√v̂_t + ε)
 *
 * With rectification, r_t corrects the variance of the adaptive learning
 * rate and the first steps fall back to momentum SGD while that variance is
 * intractable.
 *
 * References: https://arxiv.org/abs/1412.6980, https://arxiv.org/abs/1908.03265
 */
class Optimizer {
  private:
    std::vector<Parameter*> parameters;  ///< Parameters being optimized
    std::vector<Matrix> first_moments;   ///< m per parameter
    std::vector<Matrix> second_moments;  ///< v per parameter
    float learning_rate;                 ///< Learning rate (α in the paper)
    float beta1;                         ///< Exponential decay rate for momentum (β₁)
    float beta2;                         ///< Exponential decay rate for RMSprop (β₂)
    float epsilon;                       ///< Small constant for numerical stability (ε)
    bool rectified;                      ///< Whether to apply the RAdam rectification
    float clip_threshold;                ///< Gradient norm clipping threshold, 0 disables
    size_t t;                            ///< Number of timesteps for bias correction

    void clip_gradients();

  public:
    /**
     * @brief Constructs an optimizer with specified hyperparameters.
     *
     * @param lr Learning rate (default: 0.001)
     * @param b1 Beta1 coefficient for momentum (default: 0.9)
     * @param b2 Beta2 coefficient for RMSprop (default: 0.999)
     * @param eps Epsilon for numerical stability (default: 1e-8)
     * @param rectify Whether to use RAdam (default: true)
     * @param clip Global gradient norm threshold, 0 to disable (default: 0)
     * @throws std::invalid_argument on out-of-range hyperparameters
     */
    Optimizer(float lr = 0.001f, float b1 = 0.9f, float b2 = 0.999f, float eps = 1e-8f,
              bool rectify = true, float clip = 0.0f);

    /**
     * @brief Registers a parameter; its gradient is zeroed.
     */
    void add_parameter(Parameter& param);

    void add_parameters(const ParameterList& params);

    /**
     * @brief Performs one optimization step and zeros the gradients.
     */
    void step();

    /**
     * @brief Zeros out all accumulated gradients.
     */
    void zero_grad();

    size_t get_step_count() const {
        return t;
    }

    size_t get_parameter_count() const {
        return parameters.size();
    }

    float get_learning_rate() const {
        return learning_rate;
    }
};
