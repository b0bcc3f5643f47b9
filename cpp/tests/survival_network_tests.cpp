#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "survmix/survival_network.hpp"

#include <cmath>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

survmix::SurvivalNetworkOptions make_options(std::vector<int> layers, survmix::HeadActivation activation) {
    survmix::SurvivalNetworkOptions options;
    options.input_dim = 3;
    options.k = 2;
    options.layers = std::move(layers);
    options.temperature = 2.0;
    options.activation = activation;
    options.seed = 1234;
    return options;
}

Eigen::MatrixXd random_matrix(std::mt19937& rng, Eigen::Index rows, Eigen::Index cols) {
    std::normal_distribution<double> normal(0.0, 1.0);
    Eigen::MatrixXd m(rows, cols);
    for (Eigen::Index i = 0; i < m.size(); ++i) {
        m.data()[i] = normal(rng);
    }
    return m;
}

// Linear functional of the network outputs; its gradient w.r.t. the outputs is (A, B, C).
double contract(const survmix::MixtureParameters& out, const survmix::MixtureParameters& weights) {
    return out.shape.cwiseProduct(weights.shape).sum() +
           out.scale.cwiseProduct(weights.scale).sum() +
           out.logits.cwiseProduct(weights.logits).sum();
}

}  // namespace

TEST_CASE("SurvivalNetwork produces [n, K] outputs", "[network]") {
    survmix::SurvivalNetwork network(make_options({4, 3}, survmix::HeadActivation::Selu));
    REQUIRE(network.component_count() == 2);
    REQUIRE(network.input_dim() == 3);

    std::mt19937 rng(1);
    const auto out = network.forward(random_matrix(rng, 5, 3));
    REQUIRE(out.shape.rows() == 5);
    REQUIRE(out.shape.cols() == 2);
    REQUIRE(out.scale.rows() == 5);
    REQUIRE(out.logits.cols() == 2);

    const auto prior = network.shape_scale();
    REQUIRE(prior.shape.rows() == 1);
    REQUIRE(prior.shape.cols() == 2);
    REQUIRE(prior.logits.size() == 0);
    REQUIRE((prior.shape.array() == -1.0).all());
    REQUIRE((prior.scale.array() == -1.0).all());
}

TEST_CASE("SurvivalNetwork initialisation is seeded", "[network]") {
    const survmix::SurvivalNetwork a(make_options({4}, survmix::HeadActivation::Selu));
    const survmix::SurvivalNetwork b(make_options({4}, survmix::HeadActivation::Selu));
    auto other = make_options({4}, survmix::HeadActivation::Selu);
    other.seed = 99;
    const survmix::SurvivalNetwork c(other);

    REQUIRE(a.parameters().values().isApprox(b.parameters().values(), 0.0));
    REQUIRE_FALSE(a.parameters().values().isApprox(c.parameters().values()));
}

TEST_CASE("Gate logits scale with the inverse temperature", "[network]") {
    auto hot = make_options({}, survmix::HeadActivation::Selu);
    hot.temperature = 1.0;
    auto cold = hot;
    cold.temperature = 10.0;
    const survmix::SurvivalNetwork a(hot);
    const survmix::SurvivalNetwork b(cold);

    std::mt19937 rng(2);
    const Eigen::MatrixXd x = random_matrix(rng, 4, 3);
    REQUIRE(a.forward(x).logits.isApprox(10.0 * b.forward(x).logits));
}

TEST_CASE("set_shape_scale moves the global rows and bumps the version", "[network]") {
    survmix::SurvivalNetwork network(make_options({}, survmix::HeadActivation::Tanh));
    const auto version = network.parameters().version();
    std::mt19937 rng(3);
    const Eigen::MatrixXd x = random_matrix(rng, 2, 3);
    const auto before = network.forward(x);

    Eigen::VectorXd shape(2);
    shape << 0.5, 0.5;
    Eigen::VectorXd scale(2);
    scale << -2.0, -2.0;
    network.set_shape_scale(shape, scale);

    REQUIRE(network.parameters().version() > version);
    const auto prior = network.shape_scale();
    REQUIRE(prior.shape(0, 1) == 0.5);
    REQUIRE(prior.scale(0, 0) == -2.0);

    // Output rows shift by exactly the change in the global rows (initialised to -1).
    const auto after = network.forward(x);
    REQUIRE(after.shape.isApprox((before.shape.array() + 1.5).matrix()));
    REQUIRE(after.scale.isApprox((before.scale.array() - 1.0).matrix()));

    REQUIRE_THROWS_AS(network.set_shape_scale(Eigen::VectorXd::Zero(3), scale), std::invalid_argument);
}

TEST_CASE("SurvivalNetwork backward matches finite differences", "[network]") {
    std::mt19937 rng(4);
    for (auto activation : {survmix::HeadActivation::Selu, survmix::HeadActivation::Tanh}) {
        for (const std::vector<int>& layers : {std::vector<int>{}, std::vector<int>{5}, std::vector<int>{4, 3}}) {
            survmix::SurvivalNetwork network(make_options(layers, activation));
            const Eigen::MatrixXd x = random_matrix(rng, 6, 3);
            survmix::MixtureParameters weights;
            weights.shape = random_matrix(rng, 6, 2);
            weights.scale = random_matrix(rng, 6, 2);
            weights.logits = random_matrix(rng, 6, 2);

            const Eigen::VectorXd gradient = network.backward(x, weights);
            REQUIRE(gradient.size() == network.parameters().size());

            const Eigen::VectorXd base = network.parameters().values();
            const double h = 1e-6;
            for (Eigen::Index p = 0; p < base.size(); ++p) {
                Eigen::VectorXd shifted = base;
                shifted(p) += h;
                network.mutable_parameters().assign(shifted);
                const double plus = contract(network.forward(x), weights);
                shifted(p) -= 2.0 * h;
                network.mutable_parameters().assign(shifted);
                const double minus = contract(network.forward(x), weights);
                network.mutable_parameters().assign(base);
                REQUIRE_THAT(gradient(p), Catch::Matchers::WithinAbs((plus - minus) / (2.0 * h), 1e-5));
            }
        }
    }
}

TEST_CASE("shape_scale_backward only touches the global rows", "[network]") {
    const survmix::SurvivalNetwork network(make_options({3}, survmix::HeadActivation::Selu));
    Eigen::MatrixXd d_shape(1, 2);
    d_shape << 0.25, -1.0;
    Eigen::MatrixXd d_scale(1, 2);
    d_scale << 2.0, 0.5;

    const Eigen::VectorXd gradient = network.shape_scale_backward(d_shape, d_scale);
    REQUIRE(gradient.size() == network.parameters().size());
    REQUIRE_THAT(gradient.sum(), Catch::Matchers::WithinAbs(1.75, 1e-12));
    REQUIRE_THAT(gradient.cwiseAbs().sum(), Catch::Matchers::WithinAbs(3.75, 1e-12));
    // Global rows sit at the end of the bundle: shape then scale.
    Eigen::VectorXd expected(4);
    expected << 0.25, -1.0, 2.0, 0.5;
    REQUIRE((gradient.tail(4) - expected).cwiseAbs().maxCoeff() == 0.0);
}

TEST_CASE("SurvivalNetwork validates its inputs", "[network]") {
    auto options = make_options({}, survmix::HeadActivation::Selu);
    options.input_dim = 0;
    REQUIRE_THROWS_AS(survmix::SurvivalNetwork(options), std::invalid_argument);

    options = make_options({0}, survmix::HeadActivation::Selu);
    REQUIRE_THROWS_AS(survmix::SurvivalNetwork(options), std::invalid_argument);

    options = make_options({}, survmix::HeadActivation::Selu);
    options.temperature = 0.0;
    REQUIRE_THROWS_AS(survmix::SurvivalNetwork(options), std::invalid_argument);

    const survmix::SurvivalNetwork network(make_options({}, survmix::HeadActivation::Selu));
    REQUIRE_THROWS_AS(network.forward(Eigen::MatrixXd::Zero(2, 4)), std::invalid_argument);
}
