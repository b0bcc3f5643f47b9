#include "survmix/stochastic_optimizer.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>

namespace survmix {
namespace {

void check_learning_rate(double learning_rate) {
    if (!(learning_rate > 0.0)) {
        throw std::invalid_argument("learning rate must be positive");
    }
}

void check_gradient(const ParameterBundle& parameters, const Eigen::VectorXd& gradient) {
    if (gradient.size() != parameters.size()) {
        throw std::invalid_argument("gradient size does not match the parameter bundle");
    }
}

}  // namespace

SGDOptimizer::SGDOptimizer(double learning_rate)
    : learning_rate_(learning_rate) {
    check_learning_rate(learning_rate_);
}

std::string SGDOptimizer::name() const {
    return "SGD";
}

void SGDOptimizer::step(ParameterBundle& parameters, const Eigen::VectorXd& gradient) {
    check_gradient(parameters, gradient);
    parameters.apply_step(-learning_rate_ * gradient);
}

RMSPropOptimizer::RMSPropOptimizer(double learning_rate, double decay, double epsilon)
    : learning_rate_(learning_rate), decay_(decay), epsilon_(epsilon) {
    check_learning_rate(learning_rate_);
}

std::string RMSPropOptimizer::name() const {
    return "RMSProp";
}

void RMSPropOptimizer::step(ParameterBundle& parameters, const Eigen::VectorXd& gradient) {
    check_gradient(parameters, gradient);
    if (square_average_.size() != gradient.size()) {
        square_average_ = Eigen::VectorXd::Zero(gradient.size());
    }
    square_average_ = decay_ * square_average_ + (1.0 - decay_) * gradient.cwiseAbs2();
    const Eigen::VectorXd update = -learning_rate_ * (gradient.array() / (square_average_.array().sqrt() + epsilon_)).matrix();
    parameters.apply_step(update);
}

AdamOptimizer::AdamOptimizer(double learning_rate, double beta1, double beta2, double epsilon)
    : learning_rate_(learning_rate), beta1_(beta1), beta2_(beta2), epsilon_(epsilon) {
    check_learning_rate(learning_rate_);
}

std::string AdamOptimizer::name() const {
    return "Adam";
}

void AdamOptimizer::step(ParameterBundle& parameters, const Eigen::VectorXd& gradient) {
    check_gradient(parameters, gradient);
    if (first_moment_.size() != gradient.size()) {
        first_moment_ = Eigen::VectorXd::Zero(gradient.size());
        second_moment_ = Eigen::VectorXd::Zero(gradient.size());
        steps_ = 0;
    }
    ++steps_;
    first_moment_ = beta1_ * first_moment_ + (1.0 - beta1_) * gradient;
    second_moment_ = beta2_ * second_moment_ + (1.0 - beta2_) * gradient.cwiseAbs2();

    const double t = static_cast<double>(steps_);
    const double bias1 = 1.0 - std::pow(beta1_, t);
    const double bias2 = 1.0 - std::pow(beta2_, t);
    const Eigen::ArrayXd denom = (second_moment_.array() / bias2).sqrt() + epsilon_;
    const Eigen::VectorXd update = -(learning_rate_ / bias1) * (first_moment_.array() / denom).matrix();
    parameters.apply_step(update);
}

std::unique_ptr<StochasticOptimizer> make_stochastic_optimizer(const std::string& name, double learning_rate) {
    if (name == "Adam") {
        return std::make_unique<AdamOptimizer>(learning_rate);
    }
    if (name == "RMSProp") {
        return std::make_unique<RMSPropOptimizer>(learning_rate);
    }
    if (name == "SGD") {
        return std::make_unique<SGDOptimizer>(learning_rate);
    }
    throw std::invalid_argument("Optimizer " + name + " is not implemented");
}

}  // namespace survmix
