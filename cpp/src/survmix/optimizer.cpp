#include "survmix/optimizer.hpp"

#include <LBFGS.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace survmix {
namespace {

constexpr double kShrink = 0.5;
constexpr double kGrow = 1.05;
constexpr double kMinStep = 1e-8;
constexpr int kMaxBacktracks = 12;

void check_options(const OptimizationOptions& options) {
    if (options.max_iterations == 0) {
        throw std::invalid_argument("max_iterations must be positive");
    }
    if (!(options.tolerance > 0.0)) {
        throw std::invalid_argument("tolerance must be positive");
    }
    if (!(options.learning_rate > 0.0)) {
        throw std::invalid_argument("learning_rate must be positive");
    }
}

// Adapts an ObjectiveFunction to the functor signature LBFGSpp expects.
class LBFGSObjective {
public:
    explicit LBFGSObjective(const ObjectiveFunction& function) : function_(function) {}

    double operator()(const Eigen::VectorXd& x, Eigen::VectorXd& grad) {
        Eigen::VectorXd g;
        const double value = function_.value_and_gradient(x, g);
        if (g.size() != x.size()) {
            throw std::invalid_argument("objective gradient has the wrong dimension");
        }
        grad = g;
        return value;
    }

private:
    const ObjectiveFunction& function_;
};

LBFGSpp::LINE_SEARCH_TERMINATION_CONDITION linesearch_condition(const std::string& name) {
    if (name == "armijo") {
        return LBFGSpp::LBFGS_LINESEARCH_BACKTRACKING_ARMIJO;
    }
    if (name == "wolfe") {
        return LBFGSpp::LBFGS_LINESEARCH_BACKTRACKING_WOLFE;
    }
    if (name == "strong_wolfe") {
        return LBFGSpp::LBFGS_LINESEARCH_BACKTRACKING_STRONG_WOLFE;
    }
    throw std::invalid_argument("Unknown line search: " + name);
}

}  // namespace

std::string GradientDescentOptimizer::name() const {
    return "gradient_descent";
}

OptimizationResult GradientDescentOptimizer::minimize(const ObjectiveFunction& function,
                                                      Eigen::VectorXd start,
                                                      const OptimizationOptions& options) const {
    check_options(options);

    OptimizationResult result;
    result.parameters = std::move(start);
    Eigen::VectorXd gradient;
    double objective = function.value_and_gradient(result.parameters, gradient);
    double step_size = options.learning_rate;

    Eigen::VectorXd candidate;
    Eigen::VectorXd candidate_gradient;
    for (std::size_t iter = 0; iter < options.max_iterations; ++iter) {
        if (gradient.norm() <= options.tolerance) {
            result.converged = true;
            break;
        }
        result.iterations = iter + 1;

        // Halve the step until the objective does not increase.
        double step = step_size;
        double candidate_objective = objective;
        bool accepted = false;
        for (int attempt = 0; attempt < kMaxBacktracks && step >= kMinStep; ++attempt, step *= kShrink) {
            candidate = result.parameters - step * gradient;
            candidate_objective = function.value_and_gradient(candidate, candidate_gradient);
            if (std::isfinite(candidate_objective) && candidate_objective <= objective) {
                accepted = true;
                break;
            }
        }
        if (!accepted) {
            step_size *= kShrink;
            if (step_size < kMinStep) {
                break;
            }
            continue;
        }

        result.parameters.swap(candidate);
        gradient.swap(candidate_gradient);
        objective = candidate_objective;
        step_size = std::min(step * kGrow, 4.0 * options.learning_rate);

        if (options.verbose && result.iterations % 100 == 0) {
            std::cout << "gradient_descent iter " << result.iterations << ": objective = " << objective
                      << ", |g| = " << gradient.norm() << std::endl;
        }
    }

    result.objective_value = objective;
    result.gradient_norm = gradient.norm();
    result.converged = result.converged || result.gradient_norm <= options.tolerance;
    return result;
}

std::string LBFGSOptimizer::name() const {
    return "lbfgs";
}

OptimizationResult LBFGSOptimizer::minimize(const ObjectiveFunction& function,
                                            Eigen::VectorXd start,
                                            const OptimizationOptions& options) const {
    check_options(options);

    LBFGSpp::LBFGSParam<double> param;
    param.epsilon = options.tolerance;
    param.max_iterations = static_cast<int>(options.max_iterations);
    param.m = options.history;
    param.max_linesearch = options.max_linesearch;
    param.linesearch = linesearch_condition(options.linesearch);

    LBFGSpp::LBFGSSolver<double> solver(param);
    LBFGSObjective objective(function);

    Eigen::VectorXd x = std::move(start);
    double fx = 0.0;
    int iterations = 0;
    try {
        iterations = solver.minimize(objective, x, fx);
    } catch (const std::invalid_argument&) {
        throw;
    } catch (const std::runtime_error& error) {
        // Line-search breakdown; x holds the last accepted iterate.
        if (options.verbose) {
            std::cout << "lbfgs stopped early (" << error.what() << "), continuing with gradient descent" << std::endl;
        }
        return GradientDescentOptimizer().minimize(function, std::move(x), options);
    } catch (const std::logic_error& error) {
        // LBFGSpp reports a non-descent search direction as a logic_error.
        if (options.verbose) {
            std::cout << "lbfgs stopped early (" << error.what() << "), continuing with gradient descent" << std::endl;
        }
        return GradientDescentOptimizer().minimize(function, std::move(x), options);
    }

    OptimizationResult result;
    result.iterations = static_cast<std::size_t>(iterations);
    result.objective_value = fx;
    result.gradient_norm = function.gradient(x).norm();
    result.parameters = std::move(x);
    // LBFGSpp scales its stopping rule by |x|; polish with gradient descent if the absolute test fails.
    result.converged = result.gradient_norm <= options.tolerance;
    if (!result.converged) {
        return GradientDescentOptimizer().minimize(function, std::move(result.parameters), options);
    }
    if (options.verbose) {
        std::cout << "lbfgs converged in " << iterations << " iterations: objective = " << fx << std::endl;
    }
    return result;
}

std::unique_ptr<Optimizer> make_optimizer(const std::string& name) {
    if (name == "lbfgs") {
        return std::make_unique<LBFGSOptimizer>();
    }
    if (name == "gradient_descent") {
        return std::make_unique<GradientDescentOptimizer>();
    }
    throw std::invalid_argument("Unknown optimizer: " + name);
}

}  // namespace survmix
