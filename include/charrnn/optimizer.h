#ifndef CHARRNN_OPTIMIZER_H
#define CHARRNN_OPTIMIZER_H

#include "matrix.h"
#include "parameter.h"
#include <memory>
#include <string>
#include <unordered_map>

/**
 * @brief Base class for optimization algorithms
 */
class Optimizer {
protected:
    double learning_rate;
    
public:
    explicit Optimizer(double learning_rate = 0.01) : learning_rate(learning_rate) {}
    virtual ~Optimizer() = default;
    
    /**
     * @brief Compute updated parameter values
     * @param parameters Current parameter values
     * @param gradients Computed gradients
     * @param param_id Unique identifier for parameter (for stateful optimizers)
     * @return Updated parameters
     */
    virtual Matrix update(const Matrix& parameters, const Matrix& gradients,
                          const std::string& param_id) = 0;
    
    /**
     * @brief Apply update() to every parameter of a model in place
     */
    void step(const ParameterList& parameters);
    
    virtual std::string getName() const = 0;
    
    double getLearningRate() const { return learning_rate; }
};

/**
 * @brief Stochastic Gradient Descent optimizer
 * Update: θ = θ - α * ∇θ
 */
class SGD : public Optimizer {
public:
    explicit SGD(double learning_rate = 0.01) : Optimizer(learning_rate) {}
    
    Matrix update(const Matrix& parameters, const Matrix& gradients,
                  const std::string& param_id) override;
    
    std::string getName() const override { return "SGD"; }
};

/**
 * @brief Adam optimizer (Adaptive Moment Estimation)
 * 
 * m = β₁ * m + (1 - β₁) * ∇θ
 * v = β₂ * v + (1 - β₂) * ∇θ²
 * m̂ = m / (1 - β₁^t)
 * v̂ = v / (1 - β₂^t)
 * θ = θ - α * m̂ / (√v̂ + ε)
 */
class Adam : public Optimizer {
private:
    double beta1;    // First moment decay rate (typically 0.9)
    double beta2;    // Second moment decay rate (typically 0.999)
    double epsilon;  // Small constant for numerical stability
    
    std::unordered_map<std::string, Matrix> m;  // First moment
    std::unordered_map<std::string, Matrix> v;  // Second moment
    std::unordered_map<std::string, int> t;     // Time step
    
public:
    explicit Adam(double learning_rate = 0.001, double beta1 = 0.9,
                  double beta2 = 0.999, double epsilon = 1e-8)
        : Optimizer(learning_rate), beta1(beta1), beta2(beta2), epsilon(epsilon) {}
    
    Matrix update(const Matrix& parameters, const Matrix& gradients,
                  const std::string& param_id) override;
    
    std::string getName() const override { return "Adam"; }
};

/**
 * @brief Create an optimizer by name ("sgd" or "adam")
 * @throws std::invalid_argument for any other name
 */
std::unique_ptr<Optimizer> makeOptimizer(const std::string& name, double learning_rate);

#endif // CHARRNN_OPTIMIZER_H
