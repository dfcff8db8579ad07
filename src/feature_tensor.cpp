#include "charrnn/feature_tensor.h"
#include "charrnn/errors.h"
#include <string>
#include <utility>

FeatureTensor::FeatureTensor() : batch_size(0), seq_length(0), depth(0) {}

FeatureTensor::FeatureTensor(size_t batch_size, size_t seq_length, size_t depth)
    : steps(seq_length, Matrix(batch_size, depth)),
      batch_size(batch_size),
      seq_length(seq_length),
      depth(depth) {}

FeatureTensor::FeatureTensor(std::vector<Matrix> time_steps)
    : steps(std::move(time_steps)), batch_size(0), seq_length(0), depth(0) {
    if (steps.empty()) {
        return;
    }
    batch_size = steps[0].getRows();
    depth = steps[0].getCols();
    seq_length = steps.size();
    for (size_t t = 1; t < steps.size(); ++t) {
        if (steps[t].getRows() != batch_size || steps[t].getCols() != depth) {
            throw ShapeMismatchError("Time step " + std::to_string(t) + " has shape " +
                                     std::to_string(steps[t].getRows()) + "x" +
                                     std::to_string(steps[t].getCols()) + ", expected " +
                                     std::to_string(batch_size) + "x" + std::to_string(depth));
        }
    }
}

double FeatureTensor::get(size_t b, size_t t, size_t k) const {
    return step(t).get(b, k);
}

void FeatureTensor::set(size_t b, size_t t, size_t k, double value) {
    if (t >= seq_length) {
        throw std::out_of_range("Time index out of bounds");
    }
    steps[t].set(b, k, value);
}

const Matrix& FeatureTensor::step(size_t t) const {
    if (t >= seq_length) {
        throw std::out_of_range("Time index out of bounds");
    }
    return steps[t];
}

bool FeatureTensor::isOneHot() const {
    for (const auto& m : steps) {
        for (size_t b = 0; b < batch_size; ++b) {
            size_t ones = 0;
            for (size_t k = 0; k < depth; ++k) {
                double v = m.get(b, k);
                if (v == 1.0) {
                    ++ones;
                } else if (v != 0.0) {
                    return false;
                }
            }
            if (ones != 1) return false;
        }
    }
    return true;
}
