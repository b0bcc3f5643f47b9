#pragma once

namespace survmix {

// Log-quantities of one mixture component at one time point, together with their
// derivatives with respect to the raw (unconstrained) shape and scale parameters.
struct KernelEvaluation {
    double log_density{0.0};
    double log_survival{0.0};
    double d_log_density_d_shape{0.0};
    double d_log_density_d_scale{0.0};
    double d_log_survival_d_shape{0.0};
    double d_log_survival_d_scale{0.0};
};

class SurvivalKernel {
public:
    virtual ~SurvivalKernel() = default;

    [[nodiscard]] virtual KernelEvaluation evaluate(double shape, double scale, double time) const = 0;

    [[nodiscard]] virtual double log_density(double shape, double scale, double time) const = 0;

    [[nodiscard]] virtual double log_survival(double shape, double scale, double time) const = 0;
};

}  // namespace survmix
