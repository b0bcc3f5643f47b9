#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "fixed_network.hpp"
#include "survmix/cdf_evaluator.hpp"
#include "survmix/errors.hpp"
#include "survmix/survival_machine.hpp"

#include <cmath>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

namespace {

using survmix::DistributionFamily;
using survmix::MixtureParameters;

MixtureParameters random_parameters(std::mt19937& rng, Eigen::Index n, Eigen::Index k) {
    std::normal_distribution<double> normal(0.0, 0.7);
    MixtureParameters p;
    p.shape.resize(n, k);
    p.scale.resize(n, k);
    p.logits.resize(n, k);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index g = 0; g < k; ++g) {
            p.shape(i, g) = normal(rng);
            p.scale(i, g) = normal(rng);
            p.logits(i, g) = normal(rng);
        }
    }
    return p;
}

const std::vector<double> kHorizons{0.1, 0.5, 1.0, 2.0, 5.0, 10.0};

}  // namespace

TEST_CASE("Single Weibull component reproduces the closed-form CDF", "[cdf]") {
    MixtureParameters p;
    p.shape = Eigen::MatrixXd::Constant(1, 1, std::log(1.5));
    p.scale = Eigen::MatrixXd::Constant(1, 1, std::log(0.5));
    p.logits = Eigen::MatrixXd::Zero(1, 1);

    const auto survival = survmix::evaluate_log_survival(DistributionFamily::Weibull, p, kHorizons);
    const auto cdf = survmix::evaluate_log_cdf(DistributionFamily::Weibull, p, kHorizons);
    REQUIRE(survival.size() == kHorizons.size());
    REQUIRE(cdf.size() == kHorizons.size());
    for (std::size_t j = 0; j < kHorizons.size(); ++j) {
        const double z = std::pow(0.5 * kHorizons[j], 1.5);
        REQUIRE(survival[j].size() == 1);
        REQUIRE_THAT(survival[j](0), Catch::Matchers::WithinRel(-z, 1e-12));
        REQUIRE_THAT(cdf[j](0), Catch::Matchers::WithinRel(std::log(1.0 - std::exp(-z)), 1e-9));
    }
}

TEST_CASE("Mixture CDF is a non-decreasing probability", "[cdf]") {
    std::mt19937 rng(17);
    for (auto family : {DistributionFamily::Weibull, DistributionFamily::LogNormal}) {
        const MixtureParameters p = random_parameters(rng, 5, 3);
        const auto cdf = survmix::evaluate_log_cdf(family, p, kHorizons);
        for (Eigen::Index i = 0; i < 5; ++i) {
            double previous = 0.0;
            for (std::size_t j = 0; j < kHorizons.size(); ++j) {
                const double probability = std::exp(cdf[j](i));
                REQUIRE(probability >= 0.0);
                REQUIRE(probability <= 1.0);
                REQUIRE(probability >= previous);
                previous = probability;
            }
        }
    }
}

TEST_CASE("Survival and risk add up to one", "[cdf]") {
    std::mt19937 rng(23);
    for (auto family : {DistributionFamily::Weibull, DistributionFamily::LogNormal}) {
        const MixtureParameters p = random_parameters(rng, 4, 2);
        const auto survival = survmix::evaluate_log_survival(family, p, kHorizons);
        const auto cdf = survmix::evaluate_log_cdf(family, p, kHorizons);
        for (std::size_t j = 0; j < kHorizons.size(); ++j) {
            for (Eigen::Index i = 0; i < 4; ++i) {
                const double survival_probability = std::exp(survival[j](i));
                const double risk = 1.0 - survival_probability;
                REQUIRE_THAT(survival_probability + risk, Catch::Matchers::WithinAbs(1.0, 1e-15));
                REQUIRE_THAT(std::exp(cdf[j](i)), Catch::Matchers::WithinAbs(risk, 1e-12));
            }
        }
    }
}

TEST_CASE("Horizon zero has no accumulated risk", "[cdf]") {
    std::mt19937 rng(29);
    for (auto family : {DistributionFamily::Weibull, DistributionFamily::LogNormal}) {
        const MixtureParameters p = random_parameters(rng, 3, 2);
        const auto survival = survmix::evaluate_log_survival(family, p, {0.0});
        REQUIRE_THAT(survival[0].maxCoeff(), Catch::Matchers::WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(survival[0].minCoeff(), Catch::Matchers::WithinAbs(0.0, 1e-12));
    }
}

TEST_CASE("CDF evaluation validates horizons and shapes", "[cdf]") {
    std::mt19937 rng(31);
    const MixtureParameters p = random_parameters(rng, 2, 2);
    REQUIRE(survmix::evaluate_log_cdf(DistributionFamily::Weibull, p, {}).empty());
    REQUIRE_THROWS_AS(survmix::evaluate_log_cdf(DistributionFamily::Weibull, p, {1.0, -0.5}), std::invalid_argument);

    MixtureParameters broken = p;
    broken.scale = Eigen::MatrixXd::Zero(3, 2);
    REQUIRE_THROWS_AS(survmix::evaluate_log_cdf(DistributionFamily::Weibull, broken, {1.0}), std::invalid_argument);

    const auto bogus = static_cast<DistributionFamily>(5);
    REQUIRE_THROWS_AS(survmix::evaluate_log_cdf(bogus, p, {1.0}), survmix::UnsupportedDistribution);
}

TEST_CASE("predict_cdf runs the model network once per call", "[cdf]") {
    std::mt19937 rng(37);
    const MixtureParameters p = random_parameters(rng, 3, 2);
    auto network = std::make_unique<survmix_test::FixedNetwork>(p);
    const auto* probe = network.get();
    const survmix::SurvivalMachine model(DistributionFamily::LogNormal, 1.0, std::move(network));

    const Eigen::MatrixXd x = Eigen::MatrixXd::Zero(3, 1);
    const auto cdf = survmix::predict_cdf(model, x, kHorizons);
    REQUIRE(probe->forward_calls == 1);
    REQUIRE(cdf.size() == kHorizons.size());
    REQUIRE(cdf[0].size() == 3);

    const auto expected = survmix::evaluate_log_cdf(DistributionFamily::LogNormal, p, kHorizons);
    for (std::size_t j = 0; j < kHorizons.size(); ++j) {
        REQUIRE(cdf[j].isApprox(expected[j]));
    }

    const auto survival = survmix::predict_log_survival(model, x, {2.0});
    REQUIRE(survival.size() == 1);
    REQUIRE((survival[0].array() <= 0.0).all());
}

TEST_CASE("predict_cdf rejects unsupported families without running the network", "[cdf]") {
    std::mt19937 rng(41);
    auto network = std::make_unique<survmix_test::FixedNetwork>(random_parameters(rng, 1, 1));
    const auto* probe = network.get();
    const survmix::SurvivalMachine model(static_cast<DistributionFamily>(3), 1.0, std::move(network));

    REQUIRE_THROWS_AS(survmix::predict_cdf(model, Eigen::MatrixXd::Zero(1, 1), {1.0}),
                      survmix::UnsupportedDistribution);
    REQUIRE(probe->forward_calls == 0);
}
