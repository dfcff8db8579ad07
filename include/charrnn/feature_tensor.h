#ifndef CHARRNN_FEATURE_TENSOR_H
#define CHARRNN_FEATURE_TENSOR_H

#include "matrix.h"
#include <vector>
#include <array>

/**
 * @brief Three-axis (batch, time, depth) tensor
 * 
 * Stored as one (batch x depth) Matrix per time step, which is the layout
 * the recurrent cells consume one step at a time.
 */
class FeatureTensor {
private:
    std::vector<Matrix> steps;
    size_t batch_size;
    size_t seq_length;
    size_t depth;

public:
    FeatureTensor();
    FeatureTensor(size_t batch_size, size_t seq_length, size_t depth);
    
    /**
     * @brief Build from per-step matrices that all share one shape
     * @throws ShapeMismatchError if the steps disagree
     */
    explicit FeatureTensor(std::vector<Matrix> time_steps);
    
    size_t getBatchSize() const { return batch_size; }
    size_t getSeqLength() const { return seq_length; }
    size_t getDepth() const { return depth; }
    std::array<size_t, 3> shape() const { return {batch_size, seq_length, depth}; }
    
    double get(size_t b, size_t t, size_t k) const;
    void set(size_t b, size_t t, size_t k, double value);
    
    const Matrix& step(size_t t) const;
    const std::vector<Matrix>& timeSteps() const { return steps; }
    
    /**
     * @brief True when every (batch, time) slice has exactly one 1 and the rest 0
     */
    bool isOneHot() const;
};

#endif // CHARRNN_FEATURE_TENSOR_H
