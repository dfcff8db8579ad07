#ifndef CHARRNN_LOSS_H
#define CHARRNN_LOSS_H

#include "matrix.h"
#include <vector>

/**
 * @brief Softmax followed by categorical cross-entropy
 * 
 * Takes raw logits (one row per prediction) and the integer class of each
 * row. Fusing the two keeps the gradient in its simple form:
 * 
 *   L        = -(1/N) * Σ_n log softmax(z_n)[y_n]
 *   ∂L/∂z_n  = (softmax(z_n) - onehot(y_n)) / N
 */
class SoftmaxCrossEntropyLoss {
public:
    /**
     * @throws ShapeMismatchError if targets.size() != logits.getRows()
     * @throws VocabularyLookupError if a target is outside [0, logits.getCols())
     */
    double calculate(const Matrix& logits, const std::vector<int>& targets) const;
    
    Matrix gradient(const Matrix& logits, const std::vector<int>& targets) const;
};

#endif // CHARRNN_LOSS_H
