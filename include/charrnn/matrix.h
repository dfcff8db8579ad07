#ifndef CHARRNN_MATRIX_H
#define CHARRNN_MATRIX_H

#include <vector>
#include <functional>
#include <stdexcept>
#include <random>
#include <cmath>

/**
 * @brief Dense row-major matrix of doubles
 * 
 * Every tensor in the library is built on this class: one-hot time steps
 * (batch x vocab), recurrent states (batch x hidden), weights and their
 * gradients. Shape errors throw std::invalid_argument, bad indices throw
 * std::out_of_range.
 */
class Matrix {
private:
    std::vector<double> data;
    size_t rows;
    size_t cols;

public:
    // Constructors
    Matrix();
    Matrix(size_t rows, size_t cols);
    Matrix(size_t rows, size_t cols, double value);
    Matrix(const std::vector<std::vector<double>>& values);
    
    // Arithmetic operations
    Matrix operator+(const Matrix& other) const;
    Matrix operator-(const Matrix& other) const;
    Matrix operator*(const Matrix& other) const;  // Matrix multiplication
    Matrix operator*(double scalar) const;
    Matrix operator/(double scalar) const;
    
    // Compound assignment operators
    Matrix& operator+=(const Matrix& other);
    Matrix& operator-=(const Matrix& other);
    Matrix& operator*=(double scalar);
    
    // Element-wise operations
    Matrix hadamard(const Matrix& other) const;  // Element-wise multiplication
    Matrix divide(const Matrix& other) const;     // Element-wise division
    
    Matrix transpose() const;
    
    /**
     * @brief Add a (cols x 1) column vector to every row
     * 
     * Used for the bias terms: (batch x n) + b(n x 1)
     */
    Matrix addRowVector(const Matrix& bias) const;
    
    // Reductions
    double sum() const;
    Matrix sumCols() const;          // Sum over rows, returned as (cols x 1)
    double squaredNorm() const;
    size_t argmaxRow(size_t row) const;
    bool allFinite() const;
    
    // Apply function to all elements
    Matrix apply(const std::function<double(double)>& func) const;
    
    // Initialization methods (explicit generator, no hidden global state)
    void fill(double value);
    void zeros();
    void randomize(double min, double max, std::mt19937& gen);
    void xavierInit(size_t fan_in, size_t fan_out, std::mt19937& gen);
    
    // Getters and setters
    double get(size_t i, size_t j) const;
    void set(size_t i, size_t j, double value);
    size_t getRows() const { return rows; }
    size_t getCols() const { return cols; }
    size_t size() const { return data.size(); }
    const std::vector<double>& values() const { return data; }
    
    Matrix row(size_t i) const;
    void setRow(size_t i, const Matrix& row_vector);
    
    // Utility functions
    bool sameShape(const Matrix& other) const;
    bool operator==(const Matrix& other) const;
    bool operator!=(const Matrix& other) const { return !(*this == other); }
    
    // Static factory methods
    static Matrix ones(size_t rows, size_t cols);
};

// scalar * matrix
Matrix operator*(double scalar, const Matrix& matrix);

#endif // CHARRNN_MATRIX_H
