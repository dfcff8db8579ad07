#ifndef CHARRNN_TRAINER_H
#define CHARRNN_TRAINER_H

#include "predictor.h"
#include "dataset.h"
#include "config.h"
#include "optimizer.h"
#include <iostream>
#include <vector>

/**
 * @brief Loss observed at every epoch (index 0 is epoch 1)
 */
struct TrainingHistory {
    std::vector<double> losses;
    
    bool empty() const { return losses.empty(); }
    double initialLoss() const;
    double finalLoss() const;
};

/**
 * @brief Full-batch training for a fixed number of epochs
 * 
 * Each epoch: zero gradients, forward over the whole batch, cross-entropy
 * against the shifted targets, backpropagation through time, optional
 * gradient clipping, one optimizer step. There is no early stopping and no
 * validation split; the loss is only reported, every config.log_every
 * epochs, as
 * 
 *   Epoch   10/100 | Loss: 2.437712
 * 
 * @throws NumericDivergenceError as soon as the loss is NaN or infinite
 */
template <typename Cell>
TrainingHistory trainPredictor(RecurrentPredictor<Cell>& predictor,
                               const FeatureTensor& inputs,
                               const IndexBatch& targets,
                               const TrainingConfig& config,
                               Optimizer& optimizer,
                               std::ostream& log = std::cout,
                               bool verbose = true);

template <typename Cell>
TrainingHistory trainPredictor(RecurrentPredictor<Cell>& predictor,
                               const CharDataset& dataset,
                               const TrainingConfig& config,
                               Optimizer& optimizer,
                               std::ostream& log = std::cout,
                               bool verbose = true) {
    return trainPredictor(predictor, dataset.inputs, dataset.targets,
                          config, optimizer, log, verbose);
}

/**
 * @brief Print one progress line in the trainer's format
 */
void logEpoch(std::ostream& log, int epoch, int epochs, double loss);

#endif // CHARRNN_TRAINER_H
