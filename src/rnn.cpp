#include "charrnn/rnn.h"
#include "charrnn/errors.h"
#include <string>

RNNCell::RNNCell(size_t input_size, size_t hidden_size)
    : input_size(input_size),
      hidden_size(hidden_size),
      W_xh(hidden_size, input_size),
      W_hh(hidden_size, hidden_size),
      b_h(hidden_size, 1),
      dW_xh(hidden_size, input_size),
      dW_hh(hidden_size, hidden_size),
      db_h(hidden_size, 1) {}

void RNNCell::initializeWeights(std::mt19937& gen) {
    W_xh.xavierInit(input_size, hidden_size, gen);
    W_hh.xavierInit(hidden_size, hidden_size, gen);
    b_h.zeros();
}

RNNCell::State RNNCell::zeroState(size_t batch_size) const {
    return State{Matrix(batch_size, hidden_size)};
}

RNNCell::State RNNCell::step(const Matrix& input, const State& prev, Cache* cache) const {
    if (input.getCols() != input_size) {
        throw ShapeMismatchError("RNNCell expects " + std::to_string(input_size) +
                                 " input features, got " + std::to_string(input.getCols()));
    }
    
    // h(t) = tanh(x(t) * W_xh^T + h(t-1) * W_hh^T + b_h)
    Matrix pre_activation = (input * W_xh.transpose() + prev.hidden * W_hh.transpose())
                                .addRowVector(b_h);
    Matrix hidden = activation.forward(pre_activation);
    
    if (cache) {
        cache->input = input;
        cache->prev_hidden = prev.hidden;
        cache->hidden = hidden;
    }
    return State{hidden};
}

RNNCell::State RNNCell::backward(const Cache& cache, const State& grad_state) {
    Matrix grad_pre = activation.backward(cache.hidden, grad_state.hidden);
    
    // dL/dW_xh = grad_pre^T * x,  dL/dW_hh = grad_pre^T * h(t-1)
    dW_xh += grad_pre.transpose() * cache.input;
    dW_hh += grad_pre.transpose() * cache.prev_hidden;
    db_h += grad_pre.sumCols();
    
    return State{grad_pre * W_hh};
}

void RNNCell::resetGradients() {
    dW_xh.zeros();
    dW_hh.zeros();
    db_h.zeros();
}

ParameterList RNNCell::parameters(const std::string& prefix) {
    return {
        {prefix + "W_xh", &W_xh, &dW_xh},
        {prefix + "W_hh", &W_hh, &dW_hh},
        {prefix + "b_h", &b_h, &db_h},
    };
}
