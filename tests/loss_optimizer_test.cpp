#include <gtest/gtest.h>
#include <cmath>
#include "charrnn/loss.h"
#include "charrnn/optimizer.h"
#include "charrnn/parameter.h"
#include "charrnn/errors.h"

TEST(SoftmaxCrossEntropyTest, UniformLogitsGiveLogOfClassCount) {
    SoftmaxCrossEntropyLoss loss;
    Matrix logits(3, 17, 0.5);
    EXPECT_NEAR(loss.calculate(logits, {0, 5, 16}), std::log(17.0), 1e-12);
}

TEST(SoftmaxCrossEntropyTest, GradientRowsSumToZero) {
    SoftmaxCrossEntropyLoss loss;
    Matrix logits({{2.0, -1.0, 0.5}, {0.0, 3.0, 1.0}});
    Matrix grad = loss.gradient(logits, {0, 2});

    for (size_t i = 0; i < grad.getRows(); ++i) {
        EXPECT_NEAR(grad.row(i).sum(), 0.0, 1e-12);
    }
    // Target entries pull down, the others push up
    EXPECT_LT(grad.get(0, 0), 0.0);
    EXPECT_GT(grad.get(0, 1), 0.0);
    EXPECT_LT(grad.get(1, 2), 0.0);
}

TEST(SoftmaxCrossEntropyTest, ConfidentCorrectPredictionHasSmallLoss) {
    SoftmaxCrossEntropyLoss loss;
    Matrix logits({{20.0, 0.0, 0.0}});
    EXPECT_LT(loss.calculate(logits, {0}), 1e-6);
    EXPECT_GT(loss.calculate(logits, {1}), 19.0);
}

TEST(SoftmaxCrossEntropyTest, RejectsBadTargets) {
    SoftmaxCrossEntropyLoss loss;
    Matrix logits(2, 3);
    EXPECT_THROW(loss.calculate(logits, {0}), ShapeMismatchError);
    EXPECT_THROW(loss.calculate(logits, {0, 3}), VocabularyLookupError);
    EXPECT_THROW(loss.gradient(logits, {-1, 0}), VocabularyLookupError);
}

TEST(OptimizerTest, SGDStepsAgainstTheGradient) {
    SGD sgd(0.1);
    Matrix w({{1.0, 2.0}});
    Matrix g({{0.5, -1.0}});
    Matrix updated = sgd.update(w, g, "w");
    EXPECT_DOUBLE_EQ(updated.get(0, 0), 0.95);
    EXPECT_DOUBLE_EQ(updated.get(0, 1), 2.1);
}

TEST(OptimizerTest, AdamFirstStepMovesByLearningRate) {
    Adam adam(0.01);
    Matrix w({{1.0, -1.0}});
    Matrix g({{3.0, -0.2}});
    Matrix updated = adam.update(w, g, "w");
    // Bias-corrected first step is lr * sign(g)
    EXPECT_NEAR(updated.get(0, 0), 0.99, 1e-6);
    EXPECT_NEAR(updated.get(0, 1), -0.99, 1e-6);
}

TEST(OptimizerTest, StepUpdatesEveryParameterInPlace) {
    Matrix w(2, 2, 1.0);
    Matrix dw(2, 2, 1.0);
    Matrix b(2, 1, 0.0);
    Matrix db(2, 1, -2.0);
    ParameterList params = {{"w", &w, &dw}, {"b", &b, &db}};

    SGD sgd(0.5);
    sgd.step(params);
    EXPECT_DOUBLE_EQ(w.get(1, 1), 0.5);
    EXPECT_DOUBLE_EQ(b.get(0, 0), 1.0);
}

TEST(OptimizerTest, FactoryByName) {
    auto adam = makeOptimizer("adam", 0.02);
    auto sgd = makeOptimizer("sgd", 0.5);
    EXPECT_EQ(adam->getName(), "Adam");
    EXPECT_DOUBLE_EQ(adam->getLearningRate(), 0.02);
    EXPECT_EQ(sgd->getName(), "SGD");
    EXPECT_THROW(makeOptimizer("rmsprop", 0.1), std::invalid_argument);
}
