#ifndef CHARRNN_RNN_H
#define CHARRNN_RNN_H

#include "matrix.h"
#include "activation.h"
#include "parameter.h"
#include <random>
#include <string>

/**
 * @file rnn.h
 * @brief Vanilla (Elman) recurrent cell
 * 
 * At each time step t:
 *   h(t) = tanh(W_xh * x(t) + W_hh * h(t-1) + b_h)
 * 
 * Where:
 *   x(t)   = input at time t          (batch_size x input_size)
 *   h(t)   = hidden state at time t   (batch_size x hidden_size)
 * 
 * The cell only computes the state update. Mapping h(t) to vocabulary
 * scores is the job of LinearProjection; RecurrentPredictor chains the two.
 */
class RNNCell {
public:
    struct State {
        Matrix hidden;
    };
    
    /// Values saved by step() for the backward pass
    struct Cache {
        Matrix input;
        Matrix prev_hidden;
        Matrix hidden;
    };
    
    static constexpr const char* kTypeName = "rnn";
    
private:
    size_t input_size;
    size_t hidden_size;
    
    // Parameters
    Matrix W_xh;  // Input to hidden weights (hidden_size x input_size)
    Matrix W_hh;  // Hidden to hidden weights (hidden_size x hidden_size)
    Matrix b_h;   // Hidden bias (hidden_size x 1)
    
    // Gradients
    Matrix dW_xh;
    Matrix dW_hh;
    Matrix db_h;
    
    Tanh activation;
    
public:
    RNNCell(size_t input_size, size_t hidden_size);
    
    /**
     * @brief Xavier weights, zero bias
     */
    void initializeWeights(std::mt19937& gen);
    
    State zeroState(size_t batch_size) const;
    
    /**
     * @brief Forward pass for one time step
     * @param input Input at current time step (batch_size x input_size)
     * @param prev Previous state
     * @param cache Filled for backward() when non-null
     * @return New state
     */
    State step(const Matrix& input, const State& prev, Cache* cache = nullptr) const;
    
    /**
     * @brief Backward pass for one time step
     * 
     * Accumulates parameter gradients.
     * 
     * @param cache Values saved by step() at this time step
     * @param grad_state Total gradient w.r.t. the state this step produced
     * @return Gradient w.r.t. the previous state
     */
    State backward(const Cache& cache, const State& grad_state);
    
    void resetGradients();
    
    ParameterList parameters(const std::string& prefix);
    
    size_t getInputSize() const { return input_size; }
    size_t getHiddenSize() const { return hidden_size; }
    size_t getParameterCount() const {
        return input_size * hidden_size + hidden_size * hidden_size + hidden_size;
    }
};

#endif // CHARRNN_RNN_H
