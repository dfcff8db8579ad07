#include "charrnn/loss.h"
#include "charrnn/activation.h"
#include "charrnn/errors.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace {

void checkTargets(const Matrix& logits, const std::vector<int>& targets) {
    if (targets.size() != logits.getRows()) {
        throw ShapeMismatchError("Got " + std::to_string(targets.size()) + " targets for " +
                                 std::to_string(logits.getRows()) + " predictions");
    }
    for (int target : targets) {
        if (target < 0 || static_cast<size_t>(target) >= logits.getCols()) {
            throw VocabularyLookupError("Target class " + std::to_string(target) +
                                        " is outside [0, " +
                                        std::to_string(logits.getCols()) + ")");
        }
    }
}

} // namespace

double SoftmaxCrossEntropyLoss::calculate(const Matrix& logits,
                                          const std::vector<int>& targets) const {
    checkTargets(logits, targets);
    if (targets.empty()) {
        return 0.0;
    }
    
    // log softmax(z)[y] = z_y - max - log Σ exp(z_j - max)
    double sum = 0.0;
    for (size_t n = 0; n < logits.getRows(); ++n) {
        double max_val = logits.get(n, 0);
        for (size_t j = 1; j < logits.getCols(); ++j) {
            max_val = std::max(max_val, logits.get(n, j));
        }
        double denom = 0.0;
        for (size_t j = 0; j < logits.getCols(); ++j) {
            denom += std::exp(logits.get(n, j) - max_val);
        }
        double log_prob = logits.get(n, static_cast<size_t>(targets[n])) - max_val -
                          std::log(denom);
        sum += -log_prob;
    }
    return sum / static_cast<double>(logits.getRows());
}

Matrix SoftmaxCrossEntropyLoss::gradient(const Matrix& logits,
                                         const std::vector<int>& targets) const {
    checkTargets(logits, targets);
    if (targets.empty()) {
        return Matrix(logits.getRows(), logits.getCols());
    }
    
    Matrix grad = Softmax().forward(logits);
    for (size_t n = 0; n < grad.getRows(); ++n) {
        size_t y = static_cast<size_t>(targets[n]);
        grad.set(n, y, grad.get(n, y) - 1.0);
    }
    return grad / static_cast<double>(logits.getRows());
}
