#include "../include/optimizer.hpp"
#include <cmath>
#include <stdexcept>

Optimizer::Optimizer(float lr, float b1, float b2, float eps, bool rectify, float clip)
    : learning_rate(lr),
      beta1(b1),
      beta2(b2),
      epsilon(eps),
      rectified(rectify),
      clip_threshold(clip),
      t(0) {
    if (lr <= 0.0f) {
        throw std::invalid_argument("Learning rate must be positive");
    }
    if (b1 < 0.0f || b1 >= 1.0f || b2 < 0.0f || b2 >= 1.0f) {
        throw std::invalid_argument("Adam betas must be in [0, 1)");
    }
    if (eps <= 0.0f || clip < 0.0f) {
        throw std::invalid_argument("Epsilon must be positive and the clip threshold non-negative");
    }
}

void Optimizer::add_parameter(Parameter& param) {
    parameters.push_back(&param);
    first_moments.emplace_back(param.value.rows(), param.value.cols());
    second_moments.emplace_back(param.value.rows(), param.value.cols());
    param.zero_grad();
}

void Optimizer::add_parameters(const ParameterList& params) {
    for (auto* param : params) {
        add_parameter(*param);
    }
}

void Optimizer::clip_gradients() {
    float squared_norm = 0.0f;
    for (const auto* param : parameters) {
        squared_norm += param->grad.squared_norm();
    }
    const float norm = std::sqrt(squared_norm);
    if (norm > clip_threshold) {
        const float scale = clip_threshold / norm;
        for (auto* param : parameters) {
            param->grad *= scale;
        }
    }
}

void Optimizer::step() {
    if (clip_threshold > 0.0f) {
        clip_gradients();
    }

    t++;
    const float step = static_cast<float>(t);
    const float bias_correction1 = 1.0f - std::pow(beta1, step);
    const float bias_correction2 = 1.0f - std::pow(beta2, step);

    // Rectification term of RAdam
    bool adaptive = true;
    float rectification = 1.0f;
    if (rectified) {
        const float rho_inf = 2.0f / (1.0f - beta2) - 1.0f;
        const float rho_t =
            rho_inf - 2.0f * step * std::pow(beta2, step) / bias_correction2;
        if (rho_t > 4.0f) {
            rectification = std::sqrt(((rho_t - 4.0f) * (rho_t - 2.0f) * rho_inf) /
                                      ((rho_inf - 4.0f) * (rho_inf - 2.0f) * rho_t));
        } else {
            adaptive = false;
        }
    }

    for (size_t i = 0; i < parameters.size(); ++i) {
        float* value = parameters[i]->value.data();
        const float* grad = parameters[i]->grad.data();
        float* m = first_moments[i].data();
        float* v = second_moments[i].data();
        const size_t size = parameters[i]->value.size();

#pragma omp parallel for
        for (size_t j = 0; j < size; ++j) {
            m[j] = beta1 * m[j] + (1.0f - beta1) * grad[j];
            v[j] = beta2 * v[j] + (1.0f - beta2) * grad[j] * grad[j];

            const float m_hat = m[j] / bias_correction1;
            if (adaptive) {
                const float v_hat = v[j] / bias_correction2;
                value[j] -= learning_rate * rectification * m_hat / (std::sqrt(v_hat) + epsilon);
            } else {
                value[j] -= learning_rate * m_hat;
            }
        }
    }
    zero_grad();
}

void Optimizer::zero_grad() {
    for (auto* param : parameters) {
        param->zero_grad();
    }
}
