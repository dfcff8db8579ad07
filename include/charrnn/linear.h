#ifndef CHARRNN_LINEAR_H
#define CHARRNN_LINEAR_H

#include "matrix.h"
#include "parameter.h"
#include <random>
#include <string>

/**
 * @brief Hidden state to output scores: y = h * W_hy^T + b_y
 * 
 * No output activation; callers get raw logits and apply softmax where a
 * distribution is needed.
 */
class LinearProjection {
private:
    size_t input_size;
    size_t output_size;
    
    Matrix W_hy;  // (output_size x input_size)
    Matrix b_y;   // (output_size x 1)
    Matrix dW_hy;
    Matrix db_y;
    
public:
    LinearProjection(size_t input_size, size_t output_size);
    
    void initializeWeights(std::mt19937& gen);
    
    /**
     * @param hidden (batch_size x input_size)
     * @return Logits (batch_size x output_size)
     */
    Matrix project(const Matrix& hidden) const;
    
    /**
     * @brief Accumulate gradients for one projected step
     * @param hidden The input given to project()
     * @param grad_output Gradient w.r.t. the logits
     * @return Gradient w.r.t. hidden
     */
    Matrix backward(const Matrix& hidden, const Matrix& grad_output);
    
    void resetGradients();
    
    ParameterList parameters(const std::string& prefix);
    
    size_t getInputSize() const { return input_size; }
    size_t getOutputSize() const { return output_size; }
    size_t getParameterCount() const { return output_size * input_size + output_size; }
};

#endif // CHARRNN_LINEAR_H
