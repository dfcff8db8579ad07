#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <random>
#include "charrnn/predictor.h"
#include "charrnn/vocabulary.h"

namespace {

// Small batch with repeated characters so the recurrent weights matter
FeatureTensor makeInputs() {
    return encodeOneHot({{0, 1, 2, 1}, {3, 3, 4, 0}}, 5, 4, 2);
}

IndexBatch makeTargets() {
    return {{1, 2, 1, 4}, {3, 4, 0, 2}};
}

// Compare computeGradients() against central differences of loss()
template <typename Cell>
void checkGradients(RecurrentPredictor<Cell>& predictor) {
    const FeatureTensor inputs = makeInputs();
    const IndexBatch targets = makeTargets();
    const double eps = 1e-5;

    predictor.zeroGradients();
    predictor.computeGradients(inputs, targets);

    for (const auto& p : predictor.parameters()) {
        for (size_t i = 0; i < p.value->getRows(); ++i) {
            for (size_t j = 0; j < p.value->getCols(); ++j) {
                const double original = p.value->get(i, j);

                p.value->set(i, j, original + eps);
                double loss_plus = predictor.loss(inputs, targets);
                p.value->set(i, j, original - eps);
                double loss_minus = predictor.loss(inputs, targets);
                p.value->set(i, j, original);

                double numeric = (loss_plus - loss_minus) / (2.0 * eps);
                double analytic = p.gradient->get(i, j);
                double tolerance = 1e-6 + 1e-4 * std::max(std::abs(numeric), std::abs(analytic));
                EXPECT_NEAR(analytic, numeric, tolerance)
                    << p.name << "(" << i << "," << j << ")";
            }
        }
    }
}

} // namespace

TEST(GradientCheckTest, VanillaCell) {
    std::mt19937 gen(7);
    CharRNN predictor(5, 4, 5, gen);
    checkGradients(predictor);
}

TEST(GradientCheckTest, LSTMCell) {
    std::mt19937 gen(11);
    CharLSTM predictor(5, 3, 5, gen);
    checkGradients(predictor);
}

TEST(GradientCheckTest, GradientsAccumulateUntilZeroed) {
    std::mt19937 gen(3);
    CharRNN predictor(5, 4, 5, gen);
    const FeatureTensor inputs = makeInputs();
    const IndexBatch targets = makeTargets();

    predictor.zeroGradients();
    predictor.computeGradients(inputs, targets);
    double once = predictor.gradientNorm();
    predictor.computeGradients(inputs, targets);
    EXPECT_NEAR(predictor.gradientNorm(), 2.0 * once, 1e-9);

    predictor.zeroGradients();
    EXPECT_EQ(predictor.gradientNorm(), 0.0);
}

TEST(GradientCheckTest, ClippingBoundsTheNorm) {
    std::mt19937 gen(3);
    CharLSTM predictor(5, 4, 5, gen);
    predictor.zeroGradients();
    predictor.computeGradients(makeInputs(), makeTargets());

    double norm = predictor.gradientNorm();
    ASSERT_GT(norm, 0.0);
    predictor.clipGradients(norm / 4.0);
    EXPECT_NEAR(predictor.gradientNorm(), norm / 4.0, 1e-9);

    EXPECT_THROW(predictor.clipGradients(0.0), std::invalid_argument);
}
