#pragma once

#include "survmix/distribution_family.hpp"
#include "survmix/feature_network.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace survmix {

struct ModelOptions {
    std::size_t k{3};                      // number of mixture components
    std::vector<int> layers{};             // hidden layer widths of the feature network
    std::string distribution{"Weibull"};   // "Weibull" or "LogNormal"
    double temperature{1000.0};            // gate logits are rescaled by 1 / temperature
    double discount{1.0};                  // weight of censored rows in the conditional loss
    std::uint64_t seed{0};                 // network initialisation seed
};

/**
 * A mixture of K parametric survival distributions whose parameters and mixing
 * weights come from a feature network. Owns the network exclusively; the
 * training step is the only writer of its parameters.
 */
class SurvivalMachine {
public:
    // Builds the default SurvivalNetwork for `input_dim` features.
    SurvivalMachine(Eigen::Index input_dim, const ModelOptions& options);

    SurvivalMachine(DistributionFamily family, double discount, std::unique_ptr<FeatureNetwork> network);

    [[nodiscard]] Eigen::Index k() const noexcept;

    [[nodiscard]] DistributionFamily family() const noexcept;

    [[nodiscard]] double discount() const noexcept;

    [[nodiscard]] const FeatureNetwork& network() const noexcept;

    [[nodiscard]] FeatureNetwork& mutable_network() noexcept;

private:
    DistributionFamily family_;
    double discount_;
    std::unique_ptr<FeatureNetwork> network_;
};

}  // namespace survmix
