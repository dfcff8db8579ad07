#include "charrnn/linear.h"
#include "charrnn/errors.h"

LinearProjection::LinearProjection(size_t input_size, size_t output_size)
    : input_size(input_size),
      output_size(output_size),
      W_hy(output_size, input_size),
      b_y(output_size, 1),
      dW_hy(output_size, input_size),
      db_y(output_size, 1) {}

void LinearProjection::initializeWeights(std::mt19937& gen) {
    W_hy.xavierInit(input_size, output_size, gen);
    b_y.zeros();
}

Matrix LinearProjection::project(const Matrix& hidden) const {
    if (hidden.getCols() != input_size) {
        throw ShapeMismatchError("LinearProjection expects " + std::to_string(input_size) +
                                 " features, got " + std::to_string(hidden.getCols()));
    }
    return (hidden * W_hy.transpose()).addRowVector(b_y);
}

Matrix LinearProjection::backward(const Matrix& hidden, const Matrix& grad_output) {
    dW_hy += grad_output.transpose() * hidden;
    db_y += grad_output.sumCols();
    return grad_output * W_hy;
}

void LinearProjection::resetGradients() {
    dW_hy.zeros();
    db_y.zeros();
}

ParameterList LinearProjection::parameters(const std::string& prefix) {
    return {
        {prefix + "W_hy", &W_hy, &dW_hy},
        {prefix + "b_y", &b_y, &db_y},
    };
}
