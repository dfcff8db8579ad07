#include "charrnn/activation.h"
#include <cmath>
#include <algorithm>
#include <vector>

// ==================== Sigmoid ====================

Matrix Sigmoid::forward(const Matrix& input) const {
    return input.apply([](double x) {
        return 1.0 / (1.0 + std::exp(-x));
    });
}

Matrix Sigmoid::backward(const Matrix& output, const Matrix& output_gradient) const {
    // σ'(x) = σ(x) * (1 - σ(x))
    Matrix derivative = output.apply([](double s) {
        return s * (1.0 - s);
    });
    return derivative.hadamard(output_gradient);
}

// ==================== Tanh ====================

Matrix Tanh::forward(const Matrix& input) const {
    return input.apply([](double x) {
        return std::tanh(x);
    });
}

Matrix Tanh::backward(const Matrix& output, const Matrix& output_gradient) const {
    // tanh'(x) = 1 - tanh²(x)
    Matrix derivative = output.apply([](double t) {
        return 1.0 - t * t;
    });
    return derivative.hadamard(output_gradient);
}

// ==================== Softmax ====================

Matrix Softmax::forward(const Matrix& input) const {
    Matrix result(input.getRows(), input.getCols());
    
    // Each row is one distribution
    for (size_t i = 0; i < input.getRows(); ++i) {
        // Shift by the max for numerical stability
        double max_val = input.get(i, 0);
        for (size_t j = 1; j < input.getCols(); ++j) {
            max_val = std::max(max_val, input.get(i, j));
        }
        
        double sum = 0.0;
        std::vector<double> exp_vals(input.getCols());
        for (size_t j = 0; j < input.getCols(); ++j) {
            exp_vals[j] = std::exp(input.get(i, j) - max_val);
            sum += exp_vals[j];
        }
        
        for (size_t j = 0; j < input.getCols(); ++j) {
            result.set(i, j, exp_vals[j] / sum);
        }
    }
    
    return result;
}
