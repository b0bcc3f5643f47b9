#include "survmix/lognormal_kernel.hpp"

#include <cmath>
#include <numbers>

namespace survmix {
namespace {

const double kHalfLogTwoPi = 0.5 * std::log(2.0 * std::numbers::pi_v<double>);
const double kSqrtTwo = std::numbers::sqrt2_v<double>;
const double kInvSqrtPi = std::numbers::inv_sqrtpi_v<double>;

// 0.5 - 0.5 erf(z), evaluated through erfc so the upper tail keeps its precision.
double standard_tail(double z) {
    return 0.5 * std::erfc(z);
}

}  // namespace

KernelEvaluation LogNormalKernel::evaluate(double shape, double scale, double time) const {
    const double mu = shape;
    const double sigma = scale;
    const double sigma_exp = std::exp(sigma);
    const double variance = std::exp(2.0 * sigma);
    const double centered = std::log(time) - mu;
    const double z = centered / (sigma_exp * kSqrtTwo);
    const double tail = standard_tail(z);

    KernelEvaluation result;
    result.log_density = -sigma - kHalfLogTwoPi - (centered * centered) / (2.0 * variance);
    result.log_survival = std::log(tail);

    result.d_log_density_d_shape = centered / variance;
    result.d_log_density_d_scale = -1.0 + (centered * centered) / variance;

    // d log S / dz = -exp(-z^2) / (sqrt(pi) S), dz/dmu = -1 / (exp(sigma) sqrt(2)), dz/dsigma = -z
    const double mills = kInvSqrtPi * std::exp(-z * z) / tail;
    result.d_log_survival_d_shape = mills / (sigma_exp * kSqrtTwo);
    result.d_log_survival_d_scale = mills * z;
    return result;
}

double LogNormalKernel::log_density(double shape, double scale, double time) const {
    const double centered = std::log(time) - shape;
    return -scale - kHalfLogTwoPi - (centered * centered) / (2.0 * std::exp(2.0 * scale));
}

double LogNormalKernel::log_survival(double shape, double scale, double time) const {
    const double z = (std::log(time) - shape) / (std::exp(scale) * kSqrtTwo);
    return std::log(standard_tail(z));
}

}  // namespace survmix
