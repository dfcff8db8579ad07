#ifndef CHARRNN_PREDICTOR_H
#define CHARRNN_PREDICTOR_H

#include "matrix.h"
#include "feature_tensor.h"
#include "vocabulary.h"
#include "linear.h"
#include "loss.h"
#include "optimizer.h"
#include "parameter.h"
#include "rnn.h"
#include "lstm.h"
#include <iostream>
#include <random>
#include <vector>

/**
 * @brief Life cycle of a predictor
 * 
 * Uninitialized -> Training on the first optimizer step; sampling marks it
 * Ready. Training may resume after sampling. The mode is bookkeeping only:
 * there is no dropout, so forward() computes the same thing in every mode.
 */
enum class PredictorMode {
    Uninitialized,
    Training,
    Ready
};

const char* toString(PredictorMode mode);

/**
 * @brief One recurrent cell followed by a linear projection to class scores
 * 
 * Cell is RNNCell or LSTMCell. Both expose the same step/backward surface,
 * so composition is resolved at compile time.
 * 
 * Shapes: input (batch, time, input_size) -> logits, one
 * (batch x output_size) matrix per time step.
 */
template <typename Cell>
class RecurrentPredictor {
public:
    using State = typename Cell::State;
    
    struct Output {
        std::vector<Matrix> logits;   // one (batch x output_size) per time step
        State final_state;
    };
    
private:
    Cell cell;
    LinearProjection projection;
    SoftmaxCrossEntropyLoss loss_fn;
    PredictorMode mode;
    
    void checkInputs(const FeatureTensor& inputs) const;
    void checkTargets(const FeatureTensor& inputs, const IndexBatch& targets) const;
    
    /// Row b * T + t holds the prediction for batch element b at time t
    static Matrix flattenLogits(const std::vector<Matrix>& logits);
    static std::vector<int> flattenTargets(const IndexBatch& targets);
    
public:
    /**
     * @param input_size One-hot width (vocabulary size)
     * @param hidden_size Recurrent state width
     * @param output_size Number of classes scored at each step
     * @param gen Source of the initial weights
     */
    RecurrentPredictor(size_t input_size, size_t hidden_size, size_t output_size,
                       std::mt19937& gen);
    
    /**
     * @brief Run the whole sequence from a zero state
     * 
     * Deterministic: same parameters and input give bit-identical output.
     */
    Output forward(const FeatureTensor& inputs) const;
    Output forward(const FeatureTensor& inputs, const State& initial_state) const;
    
    /**
     * @brief Mean cross-entropy over every (batch, time) position, no gradients
     */
    double loss(const FeatureTensor& inputs, const IndexBatch& targets) const;
    
    /**
     * @brief Forward, loss and backpropagation through time
     * 
     * Adds to the gradient accumulators; call zeroGradients() first.
     * 
     * @return The loss of this forward pass
     */
    double computeGradients(const FeatureTensor& inputs, const IndexBatch& targets);
    
    void zeroGradients();
    
    /// L2 norm over every gradient accumulator
    double gradientNorm();
    
    /// Rescale gradients so their global norm is at most max_norm
    void clipGradients(double max_norm);
    
    /**
     * @brief One optimizer step; moves the predictor to Training
     */
    void applyGradients(Optimizer& optimizer);
    
    ParameterList parameters();
    
    State zeroState(size_t batch_size) const { return cell.zeroState(batch_size); }
    
    PredictorMode getMode() const { return mode; }
    void markReady() { mode = PredictorMode::Ready; }
    
    size_t getInputSize() const { return cell.getInputSize(); }
    size_t getHiddenSize() const { return cell.getHiddenSize(); }
    size_t getOutputSize() const { return projection.getOutputSize(); }
    size_t getParameterCount() const {
        return cell.getParameterCount() + projection.getParameterCount();
    }
    static const char* cellType() { return Cell::kTypeName; }
    
    void summary(std::ostream& out = std::cout) const;
};

using CharRNN = RecurrentPredictor<RNNCell>;
using CharLSTM = RecurrentPredictor<LSTMCell>;

extern template class RecurrentPredictor<RNNCell>;
extern template class RecurrentPredictor<LSTMCell>;

#endif // CHARRNN_PREDICTOR_H
