#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <random>
#include "charrnn/matrix.h"
#include "charrnn/activation.h"

TEST(MatrixTest, MultiplyAndTranspose) {
    Matrix a({{1, 2, 3}, {4, 5, 6}});
    Matrix b({{7, 8}, {9, 10}, {11, 12}});

    Matrix c = a * b;
    ASSERT_EQ(c.getRows(), 2u);
    ASSERT_EQ(c.getCols(), 2u);
    EXPECT_DOUBLE_EQ(c.get(0, 0), 58);
    EXPECT_DOUBLE_EQ(c.get(0, 1), 64);
    EXPECT_DOUBLE_EQ(c.get(1, 0), 139);
    EXPECT_DOUBLE_EQ(c.get(1, 1), 154);

    Matrix t = a.transpose();
    EXPECT_EQ(t.getRows(), 3u);
    EXPECT_DOUBLE_EQ(t.get(2, 1), 6);
}

TEST(MatrixTest, ShapeErrorsThrow) {
    Matrix a(2, 3);
    Matrix b(2, 2);
    EXPECT_THROW(a + b, std::invalid_argument);
    EXPECT_THROW(a * a, std::invalid_argument);
    EXPECT_THROW(a.hadamard(b), std::invalid_argument);
    EXPECT_THROW(a.get(2, 0), std::out_of_range);
    EXPECT_THROW(a.addRowVector(Matrix(2, 1)), std::invalid_argument);
}

TEST(MatrixTest, OverflowingShapeIsRejected) {
    const size_t huge = size_t(1) << (sizeof(size_t) * 4);
    EXPECT_THROW(Matrix(huge, huge), std::length_error);
    EXPECT_THROW(Matrix(huge, huge, 1.0), std::length_error);
    EXPECT_NO_THROW(Matrix(0, huge));
}

TEST(MatrixTest, BiasAndColumnSums) {
    Matrix x({{1, 2}, {3, 4}, {5, 6}});
    Matrix bias(2, 1);
    bias.set(0, 0, 10);
    bias.set(1, 0, 20);

    Matrix y = x.addRowVector(bias);
    EXPECT_DOUBLE_EQ(y.get(0, 0), 11);
    EXPECT_DOUBLE_EQ(y.get(2, 1), 26);

    Matrix s = x.sumCols();
    ASSERT_EQ(s.getRows(), 2u);
    ASSERT_EQ(s.getCols(), 1u);
    EXPECT_DOUBLE_EQ(s.get(0, 0), 9);
    EXPECT_DOUBLE_EQ(s.get(1, 0), 12);
}

TEST(MatrixTest, ArgmaxPrefersFirstOnTies) {
    Matrix m({{0.1, 0.7, 0.7, 0.2}});
    EXPECT_EQ(m.argmaxRow(0), 1u);
}

TEST(MatrixTest, FiniteCheck) {
    Matrix m(2, 2, 1.0);
    EXPECT_TRUE(m.allFinite());
    m.set(1, 1, std::numeric_limits<double>::quiet_NaN());
    EXPECT_FALSE(m.allFinite());
}

TEST(MatrixTest, SeededInitialisationIsReproducible) {
    std::mt19937 gen_a(42);
    std::mt19937 gen_b(42);
    Matrix a(4, 5);
    Matrix b(4, 5);
    a.xavierInit(4, 5, gen_a);
    b.xavierInit(4, 5, gen_b);
    EXPECT_EQ(a, b);

    double limit = std::sqrt(6.0 / 9.0);
    for (double v : a.values()) {
        EXPECT_LE(std::abs(v), limit);
    }
}

TEST(ActivationTest, SoftmaxRowsSumToOne) {
    Matrix logits({{1000.0, 1001.0, 999.0}, {-3.0, 0.0, 3.0}});
    Matrix p = Softmax().forward(logits);
    for (size_t i = 0; i < p.getRows(); ++i) {
        double total = 0.0;
        for (size_t j = 0; j < p.getCols(); ++j) {
            EXPECT_TRUE(std::isfinite(p.get(i, j)));
            total += p.get(i, j);
        }
        EXPECT_NEAR(total, 1.0, 1e-12);
    }
    EXPECT_EQ(p.argmaxRow(0), 1u);
}

TEST(ActivationTest, BackwardUsesActivatedOutput) {
    Matrix x({{0.3, -1.2}});
    Tanh tanh_fn;
    Sigmoid sigmoid;
    Matrix ones = Matrix::ones(1, 2);

    Matrix dt = tanh_fn.backward(tanh_fn.forward(x), ones);
    Matrix ds = sigmoid.backward(sigmoid.forward(x), ones);
    for (size_t j = 0; j < 2; ++j) {
        double t = std::tanh(x.get(0, j));
        double s = 1.0 / (1.0 + std::exp(-x.get(0, j)));
        EXPECT_NEAR(dt.get(0, j), 1.0 - t * t, 1e-12);
        EXPECT_NEAR(ds.get(0, j), s * (1.0 - s), 1e-12);
    }
}
