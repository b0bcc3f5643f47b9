#pragma once

#include <Eigen/Dense>

#include <cstddef>
#include <memory>
#include <string>

namespace survmix {

// Settings for the full-batch optimizers used to fit low-dimensional objectives such as the prior.
struct OptimizationOptions {
    std::size_t max_iterations{1000};
    double tolerance{1e-6};          // stop once the gradient norm falls below this
    double learning_rate{0.1};       // initial step of gradient descent

    int history{6};                  // L-BFGS correction pairs
    int max_linesearch{20};
    std::string linesearch{"strong_wolfe"};  // "armijo", "wolfe" or "strong_wolfe"

    bool verbose{false};
};

struct OptimizationResult {
    Eigen::VectorXd parameters;
    double objective_value{0.0};
    double gradient_norm{0.0};
    std::size_t iterations{0};
    bool converged{false};
};

// A smooth objective over an unconstrained parameter vector.
class ObjectiveFunction {
public:
    virtual ~ObjectiveFunction() = default;

    [[nodiscard]] virtual double value(const Eigen::VectorXd& parameters) const = 0;

    [[nodiscard]] virtual Eigen::VectorXd gradient(const Eigen::VectorXd& parameters) const = 0;

    // Override when value and gradient share work.
    [[nodiscard]] virtual double value_and_gradient(const Eigen::VectorXd& parameters,
                                                    Eigen::VectorXd& gradient) const {
        gradient = this->gradient(parameters);
        return value(parameters);
    }
};

class Optimizer {
public:
    virtual ~Optimizer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual OptimizationResult minimize(const ObjectiveFunction& function,
                                                      Eigen::VectorXd start,
                                                      const OptimizationOptions& options) const = 0;
};

// Steepest descent with a backtracking step; also the fallback when L-BFGS breaks down.
class GradientDescentOptimizer final : public Optimizer {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] OptimizationResult minimize(const ObjectiveFunction& function,
                                              Eigen::VectorXd start,
                                              const OptimizationOptions& options) const override;
};

class LBFGSOptimizer final : public Optimizer {
public:
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] OptimizationResult minimize(const ObjectiveFunction& function,
                                              Eigen::VectorXd start,
                                              const OptimizationOptions& options) const override;
};

// "lbfgs" or "gradient_descent"; anything else is std::invalid_argument.
[[nodiscard]] std::unique_ptr<Optimizer> make_optimizer(const std::string& name);

}  // namespace survmix
