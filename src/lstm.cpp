#include "charrnn/lstm.h"
#include "charrnn/errors.h"
#include <string>

LSTMCell::LSTMCell(size_t input_size, size_t hidden_size)
    : input_size(input_size), hidden_size(hidden_size),
      W_f(hidden_size, input_size), W_i(hidden_size, input_size),
      W_c(hidden_size, input_size), W_o(hidden_size, input_size),
      U_f(hidden_size, hidden_size), U_i(hidden_size, hidden_size),
      U_c(hidden_size, hidden_size), U_o(hidden_size, hidden_size),
      b_f(hidden_size, 1), b_i(hidden_size, 1),
      b_c(hidden_size, 1), b_o(hidden_size, 1),
      dW_f(hidden_size, input_size), dW_i(hidden_size, input_size),
      dW_c(hidden_size, input_size), dW_o(hidden_size, input_size),
      dU_f(hidden_size, hidden_size), dU_i(hidden_size, hidden_size),
      dU_c(hidden_size, hidden_size), dU_o(hidden_size, hidden_size),
      db_f(hidden_size, 1), db_i(hidden_size, 1),
      db_c(hidden_size, 1), db_o(hidden_size, 1) {}

void LSTMCell::initializeWeights(std::mt19937& gen) {
    for (Matrix* w : {&W_f, &W_i, &W_c, &W_o}) {
        w->xavierInit(input_size, hidden_size, gen);
    }
    for (Matrix* u : {&U_f, &U_i, &U_c, &U_o}) {
        u->xavierInit(hidden_size, hidden_size, gen);
    }
    
    // Forget gate starts open: remember by default
    b_f.fill(1.0);
    b_i.zeros();
    b_c.zeros();
    b_o.zeros();
}

LSTMCell::State LSTMCell::zeroState(size_t batch_size) const {
    return State{Matrix(batch_size, hidden_size), Matrix(batch_size, hidden_size)};
}

Matrix LSTMCell::gatePreActivation(const Matrix& input, const Matrix& prev_hidden,
                                   const Matrix& W, const Matrix& U, const Matrix& b) const {
    return (input * W.transpose() + prev_hidden * U.transpose()).addRowVector(b);
}

LSTMCell::State LSTMCell::step(const Matrix& input, const State& prev, Cache* cache) const {
    if (input.getCols() != input_size) {
        throw ShapeMismatchError("LSTMCell expects " + std::to_string(input_size) +
                                 " input features, got " + std::to_string(input.getCols()));
    }
    
    Matrix f = sigmoid.forward(gatePreActivation(input, prev.hidden, W_f, U_f, b_f));
    Matrix i = sigmoid.forward(gatePreActivation(input, prev.hidden, W_i, U_i, b_i));
    Matrix g = tanh_activation.forward(gatePreActivation(input, prev.hidden, W_c, U_c, b_c));
    Matrix o = sigmoid.forward(gatePreActivation(input, prev.hidden, W_o, U_o, b_o));
    
    // C(t) = f ⊙ C(t-1) + i ⊙ C̃
    Matrix cell = f.hadamard(prev.cell) + i.hadamard(g);
    Matrix cell_tanh = tanh_activation.forward(cell);
    
    // h(t) = o ⊙ tanh(C(t))
    Matrix hidden = o.hadamard(cell_tanh);
    
    if (cache) {
        cache->input = input;
        cache->prev_hidden = prev.hidden;
        cache->prev_cell = prev.cell;
        cache->forget_gate = f;
        cache->input_gate = i;
        cache->candidate = g;
        cache->output_gate = o;
        cache->cell = cell;
        cache->cell_tanh = cell_tanh;
    }
    return State{hidden, cell};
}

LSTMCell::State LSTMCell::backward(const Cache& cache, const State& grad_state) {
    const Matrix& grad_hidden = grad_state.hidden;
    
    // Output gate
    Matrix grad_o_pre = sigmoid.backward(cache.output_gate,
                                         grad_hidden.hadamard(cache.cell_tanh));
    
    // Memory: through tanh(C(t)) plus whatever flowed back from C(t+1)
    Matrix grad_cell = tanh_activation.backward(cache.cell_tanh,
                                                grad_hidden.hadamard(cache.output_gate)) +
                       grad_state.cell;
    
    // Input gate and candidate
    Matrix grad_i_pre = sigmoid.backward(cache.input_gate,
                                         grad_cell.hadamard(cache.candidate));
    Matrix grad_c_pre = tanh_activation.backward(cache.candidate,
                                                 grad_cell.hadamard(cache.input_gate));
    
    // Forget gate
    Matrix grad_f_pre = sigmoid.backward(cache.forget_gate,
                                         grad_cell.hadamard(cache.prev_cell));
    
    dW_f += grad_f_pre.transpose() * cache.input;
    dW_i += grad_i_pre.transpose() * cache.input;
    dW_c += grad_c_pre.transpose() * cache.input;
    dW_o += grad_o_pre.transpose() * cache.input;
    
    dU_f += grad_f_pre.transpose() * cache.prev_hidden;
    dU_i += grad_i_pre.transpose() * cache.prev_hidden;
    dU_c += grad_c_pre.transpose() * cache.prev_hidden;
    dU_o += grad_o_pre.transpose() * cache.prev_hidden;
    
    db_f += grad_f_pre.sumCols();
    db_i += grad_i_pre.sumCols();
    db_c += grad_c_pre.sumCols();
    db_o += grad_o_pre.sumCols();
    
    Matrix grad_prev_hidden = grad_f_pre * U_f + grad_i_pre * U_i +
                              grad_c_pre * U_c + grad_o_pre * U_o;
    Matrix grad_prev_cell = grad_cell.hadamard(cache.forget_gate);
    
    return State{grad_prev_hidden, grad_prev_cell};
}

void LSTMCell::resetGradients() {
    dW_f.zeros(); dW_i.zeros(); dW_c.zeros(); dW_o.zeros();
    dU_f.zeros(); dU_i.zeros(); dU_c.zeros(); dU_o.zeros();
    db_f.zeros(); db_i.zeros(); db_c.zeros(); db_o.zeros();
}

ParameterList LSTMCell::parameters(const std::string& prefix) {
    return {
        {prefix + "W_f", &W_f, &dW_f}, {prefix + "W_i", &W_i, &dW_i},
        {prefix + "W_c", &W_c, &dW_c}, {prefix + "W_o", &W_o, &dW_o},
        {prefix + "U_f", &U_f, &dU_f}, {prefix + "U_i", &U_i, &dU_i},
        {prefix + "U_c", &U_c, &dU_c}, {prefix + "U_o", &U_o, &dU_o},
        {prefix + "b_f", &b_f, &db_f}, {prefix + "b_i", &b_i, &db_i},
        {prefix + "b_c", &b_c, &db_c}, {prefix + "b_o", &b_o, &db_o},
    };
}
