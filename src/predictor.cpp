#include "charrnn/predictor.h"
#include "charrnn/errors.h"
#include <cmath>
#include <iomanip>
#include <string>

const char* toString(PredictorMode mode) {
    switch (mode) {
        case PredictorMode::Uninitialized: return "uninitialized";
        case PredictorMode::Training: return "training";
        case PredictorMode::Ready: return "ready";
    }
    return "unknown";
}

template <typename Cell>
RecurrentPredictor<Cell>::RecurrentPredictor(size_t input_size, size_t hidden_size,
                                             size_t output_size, std::mt19937& gen)
    : cell(input_size, hidden_size),
      projection(hidden_size, output_size),
      mode(PredictorMode::Uninitialized) {
    if (input_size == 0 || hidden_size == 0 || output_size == 0) {
        throw std::invalid_argument("Predictor sizes must be positive");
    }
    cell.initializeWeights(gen);
    projection.initializeWeights(gen);
}

template <typename Cell>
void RecurrentPredictor<Cell>::checkInputs(const FeatureTensor& inputs) const {
    if (inputs.getSeqLength() == 0 || inputs.getBatchSize() == 0) {
        throw ShapeMismatchError("Input tensor is empty");
    }
    if (inputs.getDepth() != cell.getInputSize()) {
        throw ShapeMismatchError("Input depth " + std::to_string(inputs.getDepth()) +
                                 " does not match predictor input size " +
                                 std::to_string(cell.getInputSize()));
    }
}

template <typename Cell>
void RecurrentPredictor<Cell>::checkTargets(const FeatureTensor& inputs,
                                            const IndexBatch& targets) const {
    if (targets.size() != inputs.getBatchSize()) {
        throw ShapeMismatchError("Got " + std::to_string(targets.size()) +
                                 " target rows for a batch of " +
                                 std::to_string(inputs.getBatchSize()));
    }
    for (const auto& row : targets) {
        if (row.size() != inputs.getSeqLength()) {
            throw ShapeMismatchError("Target row of length " + std::to_string(row.size()) +
                                     " for a sequence of length " +
                                     std::to_string(inputs.getSeqLength()));
        }
    }
}

template <typename Cell>
Matrix RecurrentPredictor<Cell>::flattenLogits(const std::vector<Matrix>& logits) {
    const size_t steps = logits.size();
    const size_t batch = logits[0].getRows();
    Matrix flat(batch * steps, logits[0].getCols());
    for (size_t t = 0; t < steps; ++t) {
        for (size_t b = 0; b < batch; ++b) {
            flat.setRow(b * steps + t, logits[t].row(b));
        }
    }
    return flat;
}

template <typename Cell>
std::vector<int> RecurrentPredictor<Cell>::flattenTargets(const IndexBatch& targets) {
    std::vector<int> flat;
    for (const auto& row : targets) {
        flat.insert(flat.end(), row.begin(), row.end());
    }
    return flat;
}

template <typename Cell>
typename RecurrentPredictor<Cell>::Output
RecurrentPredictor<Cell>::forward(const FeatureTensor& inputs) const {
    return forward(inputs, cell.zeroState(inputs.getBatchSize()));
}

template <typename Cell>
typename RecurrentPredictor<Cell>::Output
RecurrentPredictor<Cell>::forward(const FeatureTensor& inputs, const State& initial_state) const {
    checkInputs(inputs);

    Output output{{}, initial_state};
    output.logits.reserve(inputs.getSeqLength());
    for (const auto& x : inputs.timeSteps()) {
        output.final_state = cell.step(x, output.final_state);
        output.logits.push_back(projection.project(output.final_state.hidden));
    }
    return output;
}

template <typename Cell>
double RecurrentPredictor<Cell>::loss(const FeatureTensor& inputs,
                                      const IndexBatch& targets) const {
    checkTargets(inputs, targets);
    Output output = forward(inputs);
    return loss_fn.calculate(flattenLogits(output.logits), flattenTargets(targets));
}

template <typename Cell>
double RecurrentPredictor<Cell>::computeGradients(const FeatureTensor& inputs,
                                                  const IndexBatch& targets) {
    checkInputs(inputs);
    checkTargets(inputs, targets);

    const size_t steps = inputs.getSeqLength();
    const size_t batch = inputs.getBatchSize();

    // Forward, keeping every step's cache
    std::vector<typename Cell::Cache> caches(steps);
    std::vector<Matrix> hiddens;
    std::vector<Matrix> logits;
    State state = cell.zeroState(batch);
    for (size_t t = 0; t < steps; ++t) {
        state = cell.step(inputs.step(t), state, &caches[t]);
        hiddens.push_back(state.hidden);
        logits.push_back(projection.project(state.hidden));
    }

    Matrix flat_logits = flattenLogits(logits);
    std::vector<int> flat_targets = flattenTargets(targets);
    double loss_value = loss_fn.calculate(flat_logits, flat_targets);
    Matrix flat_grad = loss_fn.gradient(flat_logits, flat_targets);

    // Backpropagation through time
    State grad_next = cell.zeroState(batch);
    for (size_t t = steps; t-- > 0;) {
        Matrix grad_logits(batch, projection.getOutputSize());
        for (size_t b = 0; b < batch; ++b) {
            grad_logits.setRow(b, flat_grad.row(b * steps + t));
        }

        State grad_state = grad_next;
        grad_state.hidden += projection.backward(hiddens[t], grad_logits);
        grad_next = cell.backward(caches[t], grad_state);
    }

    return loss_value;
}

template <typename Cell>
void RecurrentPredictor<Cell>::zeroGradients() {
    cell.resetGradients();
    projection.resetGradients();
}

template <typename Cell>
double RecurrentPredictor<Cell>::gradientNorm() {
    double total = 0.0;
    for (const auto& p : parameters()) {
        total += p.gradient->squaredNorm();
    }
    return std::sqrt(total);
}

template <typename Cell>
void RecurrentPredictor<Cell>::clipGradients(double max_norm) {
    if (max_norm <= 0.0) {
        throw std::invalid_argument("Clip norm must be positive");
    }
    double norm = gradientNorm();
    if (norm <= max_norm) {
        return;
    }
    double scale = max_norm / norm;
    for (const auto& p : parameters()) {
        *p.gradient *= scale;
    }
}

template <typename Cell>
void RecurrentPredictor<Cell>::applyGradients(Optimizer& optimizer) {
    optimizer.step(parameters());
    mode = PredictorMode::Training;
}

template <typename Cell>
ParameterList RecurrentPredictor<Cell>::parameters() {
    ParameterList params = cell.parameters("cell.");
    ParameterList head = projection.parameters("projection.");
    params.insert(params.end(), head.begin(), head.end());
    return params;
}

template <typename Cell>
void RecurrentPredictor<Cell>::summary(std::ostream& out) const {
    out << "\n╔══════════════════════════════════════════════════════════════╗\n";
    out << "║                   RECURRENT PREDICTOR SUMMARY                ║\n";
    out << "╚══════════════════════════════════════════════════════════════╝\n\n";
    out << "Cell:           " << Cell::kTypeName << "\n";
    out << "  Input size:   " << cell.getInputSize() << "\n";
    out << "  Hidden size:  " << cell.getHiddenSize() << "\n";
    out << "  Parameters:   " << cell.getParameterCount() << "\n";
    out << "Projection:\n";
    out << "  Output size:  " << projection.getOutputSize() << "\n";
    out << "  Parameters:   " << projection.getParameterCount() << "\n";
    out << "Mode:           " << toString(mode) << "\n";
    out << "Total parameters: " << getParameterCount() << "\n";
    out << "═══════════════════════════════════════════════════════════════\n\n";
}

template class RecurrentPredictor<RNNCell>;
template class RecurrentPredictor<LSTMCell>;
