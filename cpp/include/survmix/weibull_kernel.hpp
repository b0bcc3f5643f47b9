#pragma once

#include "survmix/survival_kernel.hpp"

namespace survmix {

/**
 * Weibull component with raw parameters (k, b):
 *   shape = exp(k), rate = exp(b)
 *   log S(t) = -(exp(b) t)^exp(k)
 *   log f(t) = k + b + (exp(k) - 1)(b + log t) + log S(t)
 */
class WeibullKernel final : public SurvivalKernel {
public:
    [[nodiscard]] KernelEvaluation evaluate(double shape, double scale, double time) const override;

    [[nodiscard]] double log_density(double shape, double scale, double time) const override;

    [[nodiscard]] double log_survival(double shape, double scale, double time) const override;
};

}  // namespace survmix
