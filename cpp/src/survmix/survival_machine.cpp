#include "survmix/survival_machine.hpp"
#include "survmix/survival_network.hpp"

#include <stdexcept>
#include <utility>

namespace survmix {
namespace {

double validated_discount(double discount) {
    if (!(discount >= 0.0 && discount <= 1.0)) {
        throw std::invalid_argument("discount must lie in [0, 1]");
    }
    return discount;
}

std::unique_ptr<FeatureNetwork> make_default_network(Eigen::Index input_dim,
                                                     DistributionFamily family,
                                                     const ModelOptions& options) {
    if (options.k == 0) {
        throw std::invalid_argument("number of mixture components must be positive");
    }
    SurvivalNetworkOptions network_options;
    network_options.input_dim = input_dim;
    network_options.k = static_cast<Eigen::Index>(options.k);
    network_options.layers = options.layers;
    network_options.temperature = options.temperature;
    network_options.seed = options.seed;
    switch (family) {
    case DistributionFamily::Weibull:
        network_options.activation = HeadActivation::Selu;
        network_options.initial_shape_scale = -1.0;
        break;
    case DistributionFamily::LogNormal:
        network_options.activation = HeadActivation::Tanh;
        network_options.initial_shape_scale = 1.0;
        break;
    }
    return std::make_unique<SurvivalNetwork>(network_options);
}

}  // namespace

SurvivalMachine::SurvivalMachine(Eigen::Index input_dim, const ModelOptions& options)
    : family_(parse_distribution(options.distribution)),
      discount_(validated_discount(options.discount)),
      network_(make_default_network(input_dim, family_, options)) {}

SurvivalMachine::SurvivalMachine(DistributionFamily family, double discount, std::unique_ptr<FeatureNetwork> network)
    : family_(family),
      discount_(validated_discount(discount)),
      network_(std::move(network)) {
    if (!network_) {
        throw std::invalid_argument("survival machine requires a feature network");
    }
}

Eigen::Index SurvivalMachine::k() const noexcept {
    return network_->component_count();
}

DistributionFamily SurvivalMachine::family() const noexcept {
    return family_;
}

double SurvivalMachine::discount() const noexcept {
    return discount_;
}

const FeatureNetwork& SurvivalMachine::network() const noexcept {
    return *network_;
}

FeatureNetwork& SurvivalMachine::mutable_network() noexcept {
    return *network_;
}

}  // namespace survmix
