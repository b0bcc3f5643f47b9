#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "survmix/stochastic_optimizer.hpp"

#include <cmath>
#include <stdexcept>

using Catch::Matchers::WithinAbs;

namespace {

survmix::ParameterBundle make_bundle(double a, double b) {
    Eigen::VectorXd values(2);
    values << a, b;
    return survmix::ParameterBundle(values);
}

Eigen::VectorXd vec2(double a, double b) {
    Eigen::VectorXd v(2);
    v << a, b;
    return v;
}

}  // namespace

TEST_CASE("SGD takes a plain gradient step", "[stochastic_optimizer]") {
    survmix::SGDOptimizer sgd(0.1);
    auto bundle = make_bundle(1.0, -1.0);
    const auto version = bundle.version();

    sgd.step(bundle, vec2(2.0, -4.0));
    REQUIRE_THAT(bundle.values()(0), WithinAbs(0.8, 1e-15));
    REQUIRE_THAT(bundle.values()(1), WithinAbs(-0.6, 1e-15));
    REQUIRE(bundle.version() == version + 1);
}

TEST_CASE("Adam first step moves every coordinate by the learning rate", "[stochastic_optimizer]") {
    survmix::AdamOptimizer adam(0.01);
    auto bundle = make_bundle(0.0, 0.0);

    // Bias correction makes the first update lr * sign(g) regardless of magnitude.
    adam.step(bundle, vec2(5.0, -0.001));
    REQUIRE_THAT(bundle.values()(0), WithinAbs(-0.01, 1e-9));
    REQUIRE_THAT(bundle.values()(1), WithinAbs(0.01, 1e-6));
}

TEST_CASE("RMSProp first step is normalised by the running average", "[stochastic_optimizer]") {
    survmix::RMSPropOptimizer rmsprop(0.01);
    auto bundle = make_bundle(0.0, 0.0);

    // square average after one step is 0.01 g^2, so the step is lr / sqrt(0.01) = 10 lr.
    rmsprop.step(bundle, vec2(3.0, -0.5));
    REQUIRE_THAT(bundle.values()(0), WithinAbs(-0.1, 1e-6));
    REQUIRE_THAT(bundle.values()(1), WithinAbs(0.1, 1e-6));
}

TEST_CASE("Stochastic optimizers descend a quadratic", "[stochastic_optimizer]") {
    for (const char* name : {"Adam", "RMSProp", "SGD"}) {
        auto optimizer = survmix::make_stochastic_optimizer(name, 0.01);
        REQUIRE(optimizer->name() == name);

        auto bundle = make_bundle(3.0, -2.0);
        for (int i = 0; i < 2000; ++i) {
            // f(x) = 0.5 * ||x - c||^2 with c = (1, 1)
            const Eigen::VectorXd gradient = bundle.values() - vec2(1.0, 1.0);
            optimizer->step(bundle, gradient);
        }
        REQUIRE_THAT(bundle.values()(0), WithinAbs(1.0, 0.05));
        REQUIRE_THAT(bundle.values()(1), WithinAbs(1.0, 0.05));
    }
}

TEST_CASE("Stochastic optimizers reject bad input", "[stochastic_optimizer]") {
    REQUIRE_THROWS_AS(survmix::make_stochastic_optimizer("Adagrad", 0.1), std::invalid_argument);
    REQUIRE_THROWS_AS(survmix::make_stochastic_optimizer("Adam", 0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(survmix::SGDOptimizer(-1.0), std::invalid_argument);

    auto optimizer = survmix::make_stochastic_optimizer("Adam", 0.1);
    auto bundle = make_bundle(0.0, 0.0);
    REQUIRE_THROWS_AS(optimizer->step(bundle, Eigen::VectorXd::Zero(3)), std::invalid_argument);
    REQUIRE(bundle.version() == 0);
}
