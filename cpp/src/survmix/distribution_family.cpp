#include "survmix/distribution_family.hpp"
#include "survmix/errors.hpp"
#include "survmix/lognormal_kernel.hpp"
#include "survmix/weibull_kernel.hpp"

#include <memory>
#include <string>

namespace survmix {

DistributionFamily parse_distribution(const std::string& name) {
    if (name == "Weibull") {
        return DistributionFamily::Weibull;
    }
    if (name == "LogNormal") {
        return DistributionFamily::LogNormal;
    }
    throw UnsupportedDistribution(name);
}

std::string distribution_name(DistributionFamily family) {
    switch (family) {
    case DistributionFamily::Weibull:
        return "Weibull";
    case DistributionFamily::LogNormal:
        return "LogNormal";
    }
    throw UnsupportedDistribution("<family " + std::to_string(static_cast<int>(family)) + ">");
}

void require_supported(DistributionFamily family) {
    switch (family) {
    case DistributionFamily::Weibull:
    case DistributionFamily::LogNormal:
        return;
    }
    throw UnsupportedDistribution("<family " + std::to_string(static_cast<int>(family)) + ">");
}

std::unique_ptr<SurvivalKernel> SurvivalKernelFactory::create(DistributionFamily family) {
    switch (family) {
    case DistributionFamily::Weibull:
        return std::make_unique<WeibullKernel>();
    case DistributionFamily::LogNormal:
        return std::make_unique<LogNormalKernel>();
    }
    throw UnsupportedDistribution("<family " + std::to_string(static_cast<int>(family)) + ">");
}

std::unique_ptr<SurvivalKernel> SurvivalKernelFactory::create(const std::string& family_name) {
    return create(parse_distribution(family_name));
}

}  // namespace survmix
