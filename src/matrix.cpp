#include "charrnn/matrix.h"
#include <cmath>
#include <limits>
#include <random>
#include <string>

namespace {

void requireSameShape(const Matrix& a, const Matrix& b, const char* op) {
    if (!a.sameShape(b)) {
        throw std::invalid_argument(std::string("Matrix dimensions must match for ") + op +
                                    " (" + std::to_string(a.getRows()) + "x" +
                                    std::to_string(a.getCols()) + " vs " +
                                    std::to_string(b.getRows()) + "x" +
                                    std::to_string(b.getCols()) + ")");
    }
}

// rows * cols, refusing shapes whose element count does not fit in size_t
size_t elementCount(size_t rows, size_t cols) {
    if (cols != 0 && rows > std::numeric_limits<size_t>::max() / cols) {
        throw std::length_error("Matrix of " + std::to_string(rows) + "x" +
                                std::to_string(cols) + " elements is too large");
    }
    return rows * cols;
}

} // namespace

// Default constructor
Matrix::Matrix() : rows(0), cols(0) {}

// Constructor with dimensions
Matrix::Matrix(size_t rows, size_t cols)
    : data(elementCount(rows, cols), 0.0), rows(rows), cols(cols) {}

// Constructor with dimensions and initial value
Matrix::Matrix(size_t rows, size_t cols, double value)
    : data(elementCount(rows, cols), value), rows(rows), cols(cols) {}

// Constructor from nested rows
Matrix::Matrix(const std::vector<std::vector<double>>& values)
    : rows(values.size()), cols(values.empty() ? 0 : values[0].size()) {
    data.reserve(rows * cols);
    for (const auto& r : values) {
        if (r.size() != cols) {
            throw std::invalid_argument("All rows must have the same length");
        }
        data.insert(data.end(), r.begin(), r.end());
    }
}

Matrix Matrix::operator+(const Matrix& other) const {
    requireSameShape(*this, other, "addition");
    Matrix result(rows, cols);
    for (size_t k = 0; k < data.size(); ++k) {
        result.data[k] = data[k] + other.data[k];
    }
    return result;
}

Matrix Matrix::operator-(const Matrix& other) const {
    requireSameShape(*this, other, "subtraction");
    Matrix result(rows, cols);
    for (size_t k = 0; k < data.size(); ++k) {
        result.data[k] = data[k] - other.data[k];
    }
    return result;
}

// Matrix multiplication
Matrix Matrix::operator*(const Matrix& other) const {
    if (cols != other.rows) {
        throw std::invalid_argument("Matrix dimensions incompatible for multiplication (" +
                                    std::to_string(rows) + "x" + std::to_string(cols) + " * " +
                                    std::to_string(other.rows) + "x" +
                                    std::to_string(other.cols) + ")");
    }

    Matrix result(rows, other.cols);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t k = 0; k < cols; ++k) {
            const double a = data[i * cols + k];
            if (a == 0.0) continue;  // one-hot inputs are mostly zeros
            for (size_t j = 0; j < other.cols; ++j) {
                result.data[i * other.cols + j] += a * other.data[k * other.cols + j];
            }
        }
    }
    return result;
}

Matrix Matrix::operator*(double scalar) const {
    Matrix result(rows, cols);
    for (size_t k = 0; k < data.size(); ++k) {
        result.data[k] = data[k] * scalar;
    }
    return result;
}

Matrix Matrix::operator/(double scalar) const {
    if (scalar == 0.0) {
        throw std::invalid_argument("Division by zero");
    }
    return (*this) * (1.0 / scalar);
}

Matrix& Matrix::operator+=(const Matrix& other) {
    requireSameShape(*this, other, "addition");
    for (size_t k = 0; k < data.size(); ++k) {
        data[k] += other.data[k];
    }
    return *this;
}

Matrix& Matrix::operator-=(const Matrix& other) {
    requireSameShape(*this, other, "subtraction");
    for (size_t k = 0; k < data.size(); ++k) {
        data[k] -= other.data[k];
    }
    return *this;
}

Matrix& Matrix::operator*=(double scalar) {
    for (double& v : data) {
        v *= scalar;
    }
    return *this;
}

// Hadamard product (element-wise multiplication)
Matrix Matrix::hadamard(const Matrix& other) const {
    requireSameShape(*this, other, "Hadamard product");
    Matrix result(rows, cols);
    for (size_t k = 0; k < data.size(); ++k) {
        result.data[k] = data[k] * other.data[k];
    }
    return result;
}

Matrix Matrix::divide(const Matrix& other) const {
    requireSameShape(*this, other, "element-wise division");
    Matrix result(rows, cols);
    for (size_t k = 0; k < data.size(); ++k) {
        if (other.data[k] == 0.0) {
            throw std::invalid_argument("Division by zero in element-wise division");
        }
        result.data[k] = data[k] / other.data[k];
    }
    return result;
}

Matrix Matrix::transpose() const {
    Matrix result(cols, rows);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result.data[j * rows + i] = data[i * cols + j];
        }
    }
    return result;
}

Matrix Matrix::addRowVector(const Matrix& bias) const {
    if (bias.rows != cols || bias.cols != 1) {
        throw std::invalid_argument("Bias must be a (" + std::to_string(cols) +
                                    "x1) column vector");
    }
    Matrix result(*this);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result.data[i * cols + j] += bias.data[j];
        }
    }
    return result;
}

double Matrix::sum() const {
    double total = 0.0;
    for (double v : data) {
        total += v;
    }
    return total;
}

Matrix Matrix::sumCols() const {
    Matrix result(cols, 1);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result.data[j] += data[i * cols + j];
        }
    }
    return result;
}

double Matrix::squaredNorm() const {
    double total = 0.0;
    for (double v : data) {
        total += v * v;
    }
    return total;
}

// First index wins on ties
size_t Matrix::argmaxRow(size_t row) const {
    if (row >= rows || cols == 0) {
        throw std::out_of_range("Matrix row index out of bounds");
    }
    size_t best = 0;
    for (size_t j = 1; j < cols; ++j) {
        if (data[row * cols + j] > data[row * cols + best]) {
            best = j;
        }
    }
    return best;
}

bool Matrix::allFinite() const {
    for (double v : data) {
        if (!std::isfinite(v)) return false;
    }
    return true;
}

Matrix Matrix::apply(const std::function<double(double)>& func) const {
    Matrix result(rows, cols);
    for (size_t k = 0; k < data.size(); ++k) {
        result.data[k] = func(data[k]);
    }
    return result;
}

void Matrix::fill(double value) {
    for (double& v : data) {
        v = value;
    }
}

void Matrix::zeros() {
    fill(0.0);
}

// Uniform initialisation from a caller-owned generator
void Matrix::randomize(double min, double max, std::mt19937& gen) {
    std::uniform_real_distribution<double> dis(min, max);
    for (double& v : data) {
        v = dis(gen);
    }
}

// Xavier/Glorot initialization
void Matrix::xavierInit(size_t fan_in, size_t fan_out, std::mt19937& gen) {
    double limit = std::sqrt(6.0 / static_cast<double>(fan_in + fan_out));
    randomize(-limit, limit, gen);
}

double Matrix::get(size_t i, size_t j) const {
    if (i >= rows || j >= cols) {
        throw std::out_of_range("Matrix index out of bounds");
    }
    return data[i * cols + j];
}

void Matrix::set(size_t i, size_t j, double value) {
    if (i >= rows || j >= cols) {
        throw std::out_of_range("Matrix index out of bounds");
    }
    data[i * cols + j] = value;
}

Matrix Matrix::row(size_t i) const {
    if (i >= rows) {
        throw std::out_of_range("Matrix row index out of bounds");
    }
    Matrix result(1, cols);
    for (size_t j = 0; j < cols; ++j) {
        result.data[j] = data[i * cols + j];
    }
    return result;
}

void Matrix::setRow(size_t i, const Matrix& row_vector) {
    if (i >= rows) {
        throw std::out_of_range("Matrix row index out of bounds");
    }
    if (row_vector.rows != 1 || row_vector.cols != cols) {
        throw std::invalid_argument("Row vector must be (1x" + std::to_string(cols) + ")");
    }
    for (size_t j = 0; j < cols; ++j) {
        data[i * cols + j] = row_vector.data[j];
    }
}

bool Matrix::sameShape(const Matrix& other) const {
    return (rows == other.rows && cols == other.cols);
}

bool Matrix::operator==(const Matrix& other) const {
    return sameShape(other) && data == other.data;
}

Matrix Matrix::ones(size_t rows, size_t cols) {
    return Matrix(rows, cols, 1.0);
}

Matrix operator*(double scalar, const Matrix& matrix) {
    return matrix * scalar;
}
