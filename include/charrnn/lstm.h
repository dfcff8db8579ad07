#ifndef CHARRNN_LSTM_H
#define CHARRNN_LSTM_H

#include "matrix.h"
#include "activation.h"
#include "parameter.h"
#include <random>
#include <string>

/**
 * @file lstm.h
 * @brief Long Short-Term Memory cell
 * 
 * ═══════════════════════════════════════════════════════════════════════════
 * WHY LSTM?
 * ═══════════════════════════════════════════════════════════════════════════
 * 
 * In a vanilla RNN the gradient reaching h(1) is a product of T Jacobians
 * of tanh(W_hh·h). Values below 1 multiplied many times vanish, so the cell
 * cannot learn long-range dependencies. The LSTM adds a separate memory
 * vector C that is updated mostly by addition:
 * 
 * 1. FORGET GATE (f): what to remove from memory
 *    f(t) = σ(W_f·x(t) + U_f·h(t-1) + b_f)
 * 
 * 2. INPUT GATE (i) and CANDIDATE (C̃): what to write
 *    i(t) = σ(W_i·x(t) + U_i·h(t-1) + b_i)
 *    C̃(t) = tanh(W_c·x(t) + U_c·h(t-1) + b_c)
 * 
 * 3. OUTPUT GATE (o): what to expose
 *    o(t) = σ(W_o·x(t) + U_o·h(t-1) + b_o)
 * 
 * 4. MEMORY AND HIDDEN STATE
 *    C(t) = f(t) ⊙ C(t-1) + i(t) ⊙ C̃(t)
 *    h(t) = o(t) ⊙ tanh(C(t))
 * 
 * Gradient flow: ∂L/∂C(1) = ∂L/∂C(T) · ∏f(t), and f stays close to 1
 * while the cell wants to remember.
 */
class LSTMCell {
public:
    struct State {
        Matrix hidden;
        Matrix cell;
    };
    
    struct Cache {
        Matrix input, prev_hidden, prev_cell;
        Matrix forget_gate, input_gate, candidate, output_gate;
        Matrix cell, cell_tanh;
    };
    
    static constexpr const char* kTypeName = "lstm";
    
private:
    size_t input_size;
    size_t hidden_size;
    
    // Parameters (4 sets: forget, input, candidate, output)
    Matrix W_f, W_i, W_c, W_o;  // Input weights (hidden × input)
    Matrix U_f, U_i, U_c, U_o;  // Hidden weights (hidden × hidden)
    Matrix b_f, b_i, b_c, b_o;  // Biases (hidden × 1)
    
    // Gradients
    Matrix dW_f, dW_i, dW_c, dW_o;
    Matrix dU_f, dU_i, dU_c, dU_o;
    Matrix db_f, db_i, db_c, db_o;
    
    Sigmoid sigmoid;
    Tanh tanh_activation;
    
    Matrix gatePreActivation(const Matrix& input, const Matrix& prev_hidden,
                             const Matrix& W, const Matrix& U, const Matrix& b) const;
    
public:
    LSTMCell(size_t input_size, size_t hidden_size);
    
    /**
     * @brief Xavier weights; forget-gate bias 1.0, other biases 0
     */
    void initializeWeights(std::mt19937& gen);
    
    State zeroState(size_t batch_size) const;
    
    /**
     * @brief Forward pass for one time step
     * @param input Current input x(t) (batch_size x input_size)
     * @param prev Previous hidden and memory state
     * @param cache Filled for backward() when non-null
     */
    State step(const Matrix& input, const State& prev, Cache* cache = nullptr) const;
    
    /**
     * @brief Backward pass for one time step (accumulates gradients)
     * @param grad_state Gradients w.r.t. h(t) and C(t)
     * @return Gradients w.r.t. h(t-1) and C(t-1)
     */
    State backward(const Cache& cache, const State& grad_state);
    
    void resetGradients();
    
    ParameterList parameters(const std::string& prefix);
    
    size_t getInputSize() const { return input_size; }
    size_t getHiddenSize() const { return hidden_size; }
    size_t getParameterCount() const {
        return 4 * (input_size * hidden_size +    // W matrices
                    hidden_size * hidden_size +   // U matrices
                    hidden_size);                 // biases
    }
};

#endif // CHARRNN_LSTM_H
