#include "survmix/weibull_kernel.hpp"

#include <cmath>

namespace survmix {

KernelEvaluation WeibullKernel::evaluate(double shape, double scale, double time) const {
    const double shape_exp = std::exp(shape);
    // b + log t = log(rate * t)
    const double log_rate_time = scale + std::log(time);
    const double cumulative_hazard = std::pow(std::exp(scale) * time, shape_exp);

    KernelEvaluation result;
    result.log_survival = -cumulative_hazard;
    result.log_density = shape + scale + (shape_exp - 1.0) * log_rate_time + result.log_survival;

    // d/dk (rate t)^exp(k) = (rate t)^exp(k) * exp(k) * log(rate t)
    // d/db (rate t)^exp(k) = (rate t)^exp(k) * exp(k)
    result.d_log_survival_d_shape = -cumulative_hazard * shape_exp * log_rate_time;
    result.d_log_survival_d_scale = -cumulative_hazard * shape_exp;
    result.d_log_density_d_shape = 1.0 + shape_exp * log_rate_time + result.d_log_survival_d_shape;
    result.d_log_density_d_scale = shape_exp + result.d_log_survival_d_scale;
    return result;
}

double WeibullKernel::log_density(double shape, double scale, double time) const {
    const double shape_exp = std::exp(shape);
    return shape + scale + (shape_exp - 1.0) * (scale + std::log(time)) + log_survival(shape, scale, time);
}

double WeibullKernel::log_survival(double shape, double scale, double time) const {
    return -std::pow(std::exp(scale) * time, std::exp(shape));
}

}  // namespace survmix
