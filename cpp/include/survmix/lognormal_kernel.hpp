#pragma once

#include "survmix/survival_kernel.hpp"

namespace survmix {

/**
 * LogNormal component with raw parameters (mu, sigma), log T ~ N(mu, exp(sigma)^2):
 *   z = (log t - mu) / (exp(sigma) sqrt(2))
 *   log S(t) = log(0.5 - 0.5 erf(z))
 *   log f(t) = -sigma - 0.5 log(2 pi) - (log t - mu)^2 / (2 exp(2 sigma))
 *
 * The density is that of log T, matching the Weibull kernel's density of T up to
 * the Jacobian term -log t, which does not depend on the parameters.
 */
class LogNormalKernel final : public SurvivalKernel {
public:
    [[nodiscard]] KernelEvaluation evaluate(double shape, double scale, double time) const override;

    [[nodiscard]] double log_density(double shape, double scale, double time) const override;

    [[nodiscard]] double log_survival(double shape, double scale, double time) const override;
};

}  // namespace survmix
