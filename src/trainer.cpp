#include "charrnn/trainer.h"
#include "charrnn/errors.h"
#include <cmath>
#include <iomanip>
#include <stdexcept>
#include <string>

double TrainingHistory::initialLoss() const {
    if (losses.empty()) {
        throw std::logic_error("Training history is empty");
    }
    return losses.front();
}

double TrainingHistory::finalLoss() const {
    if (losses.empty()) {
        throw std::logic_error("Training history is empty");
    }
    return losses.back();
}

void logEpoch(std::ostream& log, int epoch, int epochs, double loss) {
    log << "Epoch " << std::setw(4) << epoch << "/" << epochs
        << " | Loss: " << std::fixed << std::setprecision(6) << loss << std::endl;
}

template <typename Cell>
TrainingHistory trainPredictor(RecurrentPredictor<Cell>& predictor,
                               const FeatureTensor& inputs,
                               const IndexBatch& targets,
                               const TrainingConfig& config,
                               Optimizer& optimizer,
                               std::ostream& log,
                               bool verbose) {
    config.validate();
    
    TrainingHistory history;
    history.losses.reserve(static_cast<size_t>(config.epochs));
    
    for (int epoch = 1; epoch <= config.epochs; ++epoch) {
        predictor.zeroGradients();
        double loss = predictor.computeGradients(inputs, targets);
        
        if (!std::isfinite(loss)) {
            throw NumericDivergenceError("Loss became non-finite at epoch " +
                                         std::to_string(epoch), epoch, loss);
        }
        
        if (config.clip_norm > 0.0) {
            predictor.clipGradients(config.clip_norm);
        }
        predictor.applyGradients(optimizer);
        history.losses.push_back(loss);
        
        if (verbose && epoch % config.log_every == 0) {
            logEpoch(log, epoch, config.epochs, loss);
        }
    }
    
    return history;
}

template TrainingHistory trainPredictor<RNNCell>(RecurrentPredictor<RNNCell>&,
                                                 const FeatureTensor&, const IndexBatch&,
                                                 const TrainingConfig&, Optimizer&,
                                                 std::ostream&, bool);
template TrainingHistory trainPredictor<LSTMCell>(RecurrentPredictor<LSTMCell>&,
                                                  const FeatureTensor&, const IndexBatch&,
                                                  const TrainingConfig&, Optimizer&,
                                                  std::ostream&, bool);
