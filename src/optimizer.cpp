#include "charrnn/optimizer.h"
#include <cmath>
#include <stdexcept>

void Optimizer::step(const ParameterList& parameters) {
    for (const auto& p : parameters) {
        *p.value = update(*p.value, *p.gradient, p.name);
    }
}

// ==================== SGD ====================

Matrix SGD::update(const Matrix& parameters, const Matrix& gradients,
                   const std::string& /*param_id*/) {
    // θ = θ - α * ∇θ
    return parameters - gradients * learning_rate;
}

// ==================== Adam ====================

Matrix Adam::update(const Matrix& parameters, const Matrix& gradients,
                    const std::string& param_id) {
    if (m.find(param_id) == m.end()) {
        m[param_id] = Matrix(parameters.getRows(), parameters.getCols());
        v[param_id] = Matrix(parameters.getRows(), parameters.getCols());
        t[param_id] = 0;
    }
    
    int time_step = ++t[param_id];
    
    m[param_id] = m[param_id] * beta1 + gradients * (1.0 - beta1);
    v[param_id] = v[param_id] * beta2 + gradients.hadamard(gradients) * (1.0 - beta2);
    
    // Bias correction
    Matrix m_hat = m[param_id] / (1.0 - std::pow(beta1, time_step));
    Matrix v_hat = v[param_id] / (1.0 - std::pow(beta2, time_step));
    
    Matrix denominator = v_hat.apply([this](double x) {
        return std::sqrt(x) + epsilon;
    });
    
    return parameters - m_hat.divide(denominator) * learning_rate;
}

std::unique_ptr<Optimizer> makeOptimizer(const std::string& name, double learning_rate) {
    if (name == "sgd") {
        return std::make_unique<SGD>(learning_rate);
    }
    if (name == "adam") {
        return std::make_unique<Adam>(learning_rate);
    }
    throw std::invalid_argument("Unknown optimizer '" + name + "' (expected sgd or adam)");
}
