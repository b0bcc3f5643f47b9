#pragma once

#include "survmix/distribution_family.hpp"
#include "survmix/optimizer.hpp"
#include "survmix/survival_dataset.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <string>
#include <vector>

namespace survmix {

class SurvivalMachine;

struct TrainingOptions {
    std::size_t iterations{1};          // epochs over the training set
    double learning_rate{1e-3};
    std::size_t batch_size{100};
    bool elbo{true};                    // training objective; validation always uses the exact one
    std::string optimizer{"Adam"};      // "Adam", "RMSProp" or "SGD"
    std::size_t patience{3};            // consecutive non-improving epochs before stopping

    bool pretrain{true};                // fit the global shape/scale prior before training
    std::string prior_optimizer{"lbfgs"};
    OptimizationOptions prior_options{10000, 1e-6, 1e-2};

    bool verbose{false};
};

struct TrainingResult {
    std::size_t epochs_run{0};
    std::vector<double> validation_losses;
    std::size_t best_epoch{0};
    OptimizationResult prior_result;
};

/**
 * Unconditional objective over a flat parameter vector [shape_0..shape_{K-1}, scale_0..scale_{K-1}].
 */
class PriorObjective final : public ObjectiveFunction {
public:
    PriorObjective(DistributionFamily family, Eigen::Index k, Eigen::VectorXd times, Eigen::VectorXd events);

    [[nodiscard]] double value(const Eigen::VectorXd& parameters) const override;

    [[nodiscard]] Eigen::VectorXd gradient(const Eigen::VectorXd& parameters) const override;

    [[nodiscard]] double value_and_gradient(const Eigen::VectorXd& parameters,
                                            Eigen::VectorXd& gradient) const override;

private:
    DistributionFamily family_;
    Eigen::Index k_;
    Eigen::VectorXd times_;
    Eigen::VectorXd events_;
};

// Fits a single-component prior to (times, events), starting from (initial_shape, initial_scale).
[[nodiscard]] OptimizationResult fit_prior(DistributionFamily family,
                                           const Eigen::VectorXd& times,
                                           const Eigen::VectorXd& events,
                                           double initial_shape,
                                           double initial_scale,
                                           const TrainingOptions& options);

/**
 * Trains `model` in place: optional prior pretraining, then mini-batch epochs on
 * the conditional objective with early stopping on the exact validation loss.
 * The parameters of the epoch with the lowest validation loss are restored.
 */
TrainingResult train_survival_machine(SurvivalMachine& model,
                                      const SurvivalDataset& train,
                                      const SurvivalDataset& validation,
                                      const TrainingOptions& options);

}  // namespace survmix
