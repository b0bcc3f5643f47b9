#pragma once

#include "survmix/survival_kernel.hpp"

#include <memory>
#include <string>

namespace survmix {

enum class DistributionFamily {
    Weibull,
    LogNormal
};

// Accepts exactly "Weibull" and "LogNormal"; anything else raises UnsupportedDistribution.
[[nodiscard]] DistributionFamily parse_distribution(const std::string& name);

[[nodiscard]] std::string distribution_name(DistributionFamily family);

// Throws UnsupportedDistribution unless `family` is one of the enumerators.
void require_supported(DistributionFamily family);

class SurvivalKernelFactory {
public:
    static std::unique_ptr<SurvivalKernel> create(DistributionFamily family);

    static std::unique_ptr<SurvivalKernel> create(const std::string& family_name);
};

}  // namespace survmix
