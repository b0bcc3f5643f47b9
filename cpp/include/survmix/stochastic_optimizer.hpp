#pragma once

#include "survmix/parameter_bundle.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <memory>
#include <string>

namespace survmix {

// First-order update rule for mini-batch training. Holds per-parameter state between steps.
class StochasticOptimizer {
public:
    virtual ~StochasticOptimizer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    virtual void step(ParameterBundle& parameters, const Eigen::VectorXd& gradient) = 0;
};

class SGDOptimizer final : public StochasticOptimizer {
public:
    explicit SGDOptimizer(double learning_rate);

    [[nodiscard]] std::string name() const override;

    void step(ParameterBundle& parameters, const Eigen::VectorXd& gradient) override;

private:
    double learning_rate_;
};

class RMSPropOptimizer final : public StochasticOptimizer {
public:
    explicit RMSPropOptimizer(double learning_rate, double decay = 0.99, double epsilon = 1e-8);

    [[nodiscard]] std::string name() const override;

    void step(ParameterBundle& parameters, const Eigen::VectorXd& gradient) override;

private:
    double learning_rate_;
    double decay_;
    double epsilon_;
    Eigen::VectorXd square_average_;
};

class AdamOptimizer final : public StochasticOptimizer {
public:
    explicit AdamOptimizer(double learning_rate, double beta1 = 0.9, double beta2 = 0.999, double epsilon = 1e-8);

    [[nodiscard]] std::string name() const override;

    void step(ParameterBundle& parameters, const Eigen::VectorXd& gradient) override;

private:
    double learning_rate_;
    double beta1_;
    double beta2_;
    double epsilon_;
    Eigen::VectorXd first_moment_;
    Eigen::VectorXd second_moment_;
    std::uint64_t steps_{0};
};

// "Adam", "RMSProp" or "SGD".
[[nodiscard]] std::unique_ptr<StochasticOptimizer> make_stochastic_optimizer(const std::string& name,
                                                                             double learning_rate);

}  // namespace survmix
