#ifndef CHARRNN_ACTIVATION_H
#define CHARRNN_ACTIVATION_H

#include "matrix.h"

/**
 * @file activation.h
 * @brief Element-wise and row-wise activation functions
 * 
 * Recurrent cells only keep the activated values around, so backward() is
 * expressed in terms of the forward OUTPUT rather than its input.
 */

/**
 * @brief Sigmoid activation function
 * σ(x) = 1 / (1 + e^(-x))
 */
class Sigmoid {
public:
    Matrix forward(const Matrix& input) const;
    
    /**
     * @param output Result of forward() for the same input
     * @param output_gradient Gradient w.r.t. the activated output
     * @return Gradient w.r.t. the pre-activation input
     */
    Matrix backward(const Matrix& output, const Matrix& output_gradient) const;
};

/**
 * @brief Hyperbolic tangent activation function
 * tanh(x) = (e^x - e^(-x)) / (e^x + e^(-x))
 */
class Tanh {
public:
    Matrix forward(const Matrix& input) const;
    Matrix backward(const Matrix& output, const Matrix& output_gradient) const;
};

/**
 * @brief Row-wise softmax
 * softmax(x_i) = e^(x_i - max) / sum(e^(x_j - max))
 * 
 * Only the forward pass exists: training goes through the fused gradient of
 * SoftmaxCrossEntropyLoss.
 */
class Softmax {
public:
    Matrix forward(const Matrix& input) const;
};

#endif // CHARRNN_ACTIVATION_H
