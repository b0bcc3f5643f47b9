#pragma once

#include "survmix/distribution_family.hpp"
#include "survmix/mixture_aggregator.hpp"
#include "survmix/mixture_parameters.hpp"

#include <Eigen/Dense>

namespace survmix {

class SurvivalMachine;

// Negative mean log-likelihood and its gradient with respect to the mixture parameters.
struct ObjectiveEvaluation {
    double value{0.0};
    MixtureParameters gradient;
};

/**
 * Prior objective on global shape/scale rows ([1, K], or [n, K]). Every component
 * contributes with equal weight: events add sum_g log f_g(t), censored rows add
 * sum_g log S_g(t). The result is -(total) / n; the gradient has empty logits.
 */
[[nodiscard]] ObjectiveEvaluation evaluate_unconditional_objective(DistributionFamily family,
                                                                   const Eigen::MatrixXd& shape,
                                                                   const Eigen::MatrixXd& scale,
                                                                   const Eigen::VectorXd& times,
                                                                   const Eigen::VectorXd& events);

/**
 * Censored mixture objective on per-instance parameters:
 *   -( sum_{events} A(log f) + discount * sum_{censored} A(log S) ) / n
 * where A is the ELBO or exact aggregation over the K components.
 */
[[nodiscard]] ObjectiveEvaluation evaluate_conditional_objective(DistributionFamily family,
                                                                 double discount,
                                                                 const MixtureParameters& parameters,
                                                                 const Eigen::VectorXd& times,
                                                                 const Eigen::VectorXd& events,
                                                                 AggregationMode mode);

[[nodiscard]] double unconditional_loss(const SurvivalMachine& model,
                                        const Eigen::VectorXd& times,
                                        const Eigen::VectorXd& events);

[[nodiscard]] double conditional_loss(const SurvivalMachine& model,
                                      const Eigen::MatrixXd& features,
                                      const Eigen::VectorXd& times,
                                      const Eigen::VectorXd& events,
                                      bool elbo = true);

}  // namespace survmix
