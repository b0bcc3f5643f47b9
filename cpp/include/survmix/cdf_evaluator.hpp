#pragma once

#include "survmix/distribution_family.hpp"
#include "survmix/mixture_parameters.hpp"

#include <Eigen/Dense>

#include <vector>

namespace survmix {

class SurvivalMachine;

/**
 * Exact mixture log-survival log P(T > t_j | x_i) for every horizon t_j, one
 * length-n vector per horizon. Horizons are shared by every instance and must be
 * non-negative. Parameters are [n, K] (or a single shared row).
 */
[[nodiscard]] std::vector<Eigen::VectorXd> evaluate_log_survival(DistributionFamily family,
                                                                 const MixtureParameters& parameters,
                                                                 const std::vector<double>& horizons);

// log P(T <= t_j | x_i) = log(1 - exp(log survival)), same layout as evaluate_log_survival.
[[nodiscard]] std::vector<Eigen::VectorXd> evaluate_log_cdf(DistributionFamily family,
                                                            const MixtureParameters& parameters,
                                                            const std::vector<double>& horizons);

[[nodiscard]] std::vector<Eigen::VectorXd> predict_log_survival(const SurvivalMachine& model,
                                                                const Eigen::MatrixXd& features,
                                                                const std::vector<double>& horizons);

[[nodiscard]] std::vector<Eigen::VectorXd> predict_cdf(const SurvivalMachine& model,
                                                       const Eigen::MatrixXd& features,
                                                       const std::vector<double>& horizons);

}  // namespace survmix
