#include "survmix/trainer.hpp"
#include "survmix/feature_network.hpp"
#include "survmix/stochastic_optimizer.hpp"
#include "survmix/survival_machine.hpp"
#include "survmix/survival_objective.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace survmix {
namespace {

double validation_loss(const SurvivalMachine& model, const SurvivalDataset& validation) {
    const MixtureParameters parameters = model.network().forward(validation.features);
    return evaluate_conditional_objective(model.family(), model.discount(), parameters,
                                          validation.times, validation.events, AggregationMode::Exact).value;
}

}  // namespace

PriorObjective::PriorObjective(DistributionFamily family, Eigen::Index k, Eigen::VectorXd times, Eigen::VectorXd events)
    : family_(family), k_(k), times_(std::move(times)), events_(std::move(events)) {
    require_supported(family_);
    if (k_ <= 0) {
        throw std::invalid_argument("prior requires at least one component");
    }
}

double PriorObjective::value(const Eigen::VectorXd& parameters) const {
    Eigen::VectorXd unused;
    return value_and_gradient(parameters, unused);
}

Eigen::VectorXd PriorObjective::gradient(const Eigen::VectorXd& parameters) const {
    Eigen::VectorXd grad;
    static_cast<void>(value_and_gradient(parameters, grad));
    return grad;
}

double PriorObjective::value_and_gradient(const Eigen::VectorXd& parameters,
                                          Eigen::VectorXd& gradient) const {
    if (parameters.size() != 2 * k_) {
        throw std::invalid_argument("prior parameters must hold K shapes followed by K scales");
    }
    const ObjectiveEvaluation eval = evaluate_unconditional_objective(
        family_, parameters.head(k_).transpose(), parameters.tail(k_).transpose(), times_, events_);
    gradient.resize(2 * k_);
    gradient.head(k_) = eval.gradient.shape.row(0).transpose();
    gradient.tail(k_) = eval.gradient.scale.row(0).transpose();
    return eval.value;
}

OptimizationResult fit_prior(DistributionFamily family,
                             const Eigen::VectorXd& times,
                             const Eigen::VectorXd& events,
                             double initial_shape,
                             double initial_scale,
                             const TrainingOptions& options) {
    const PriorObjective objective(family, 1, times, events);
    const auto optimizer = make_optimizer(options.prior_optimizer);
    OptimizationOptions prior_options = options.prior_options;
    prior_options.verbose = prior_options.verbose || options.verbose;
    OptimizationResult result = optimizer->minimize(objective, Eigen::Vector2d(initial_shape, initial_scale), prior_options);
    if (options.verbose) {
        std::cout << "prior (" << distribution_name(family) << "): shape = " << result.parameters(0)
                  << ", scale = " << result.parameters(1) << ", loss = " << result.objective_value
                  << (result.converged ? "" : " (not converged)") << std::endl;
    }
    return result;
}

TrainingResult train_survival_machine(SurvivalMachine& model,
                                      const SurvivalDataset& train,
                                      const SurvivalDataset& validation,
                                      const TrainingOptions& options) {
    require_supported(model.family());
    train.validate();
    validation.validate();
    if (train.size() == 0) {
        throw std::invalid_argument("training set is empty");
    }
    if (validation.size() == 0) {
        throw std::invalid_argument("validation set is empty");
    }
    if (options.batch_size == 0) {
        throw std::invalid_argument("batch size must be positive");
    }
    if (options.patience == 0) {
        throw std::invalid_argument("patience must be positive");
    }

    FeatureNetwork& network = model.mutable_network();
    TrainingResult result;

    if (options.pretrain) {
        const MixtureParameters start = network.shape_scale();
        result.prior_result = fit_prior(model.family(), train.times, train.events,
                                        start.shape(0, 0), start.scale(0, 0), options);
        const Eigen::VectorXd shape = Eigen::VectorXd::Constant(model.k(), result.prior_result.parameters(0));
        const Eigen::VectorXd scale = Eigen::VectorXd::Constant(model.k(), result.prior_result.parameters(1));
        network.set_shape_scale(shape, scale);
    }

    const auto optimizer = make_stochastic_optimizer(options.optimizer, options.learning_rate);
    const AggregationMode mode = options.elbo ? AggregationMode::Elbo : AggregationMode::Exact;
    const auto batch_size = static_cast<Eigen::Index>(options.batch_size);
    const Eigen::Index n = train.size();

    std::vector<Eigen::VectorXd> snapshots;
    double previous_loss = std::numeric_limits<double>::infinity();
    std::size_t stalled = 0;

    for (std::size_t epoch = 0; epoch < options.iterations; ++epoch) {
        for (Eigen::Index start = 0; start < n; start += batch_size) {
            const SurvivalDataset batch = train.slice(start, std::min(batch_size, n - start));
            const MixtureParameters outputs = network.forward(batch.features);
            const ObjectiveEvaluation eval = evaluate_conditional_objective(
                model.family(), model.discount(), outputs, batch.times, batch.events, mode);
            const Eigen::VectorXd gradient = network.backward(batch.features, eval.gradient);
            optimizer->step(network.mutable_parameters(), gradient);
        }

        const double loss = validation_loss(model, validation);
        result.validation_losses.push_back(loss);
        snapshots.push_back(network.parameters().values());
        result.epochs_run = epoch + 1;
        if (options.verbose) {
            std::cout << "epoch " << (epoch + 1) << ": validation loss = " << loss << std::endl;
        }

        if (loss >= previous_loss) {
            if (++stalled >= options.patience) {
                break;
            }
        } else {
            stalled = 0;
        }
        previous_loss = loss;
    }

    if (!snapshots.empty()) {
        double best = std::numeric_limits<double>::infinity();
        result.best_epoch = snapshots.size() - 1;
        for (std::size_t i = 0; i < result.validation_losses.size(); ++i) {
            if (result.validation_losses[i] < best) {
                best = result.validation_losses[i];
                result.best_epoch = i;
            }
        }
        network.mutable_parameters().assign(snapshots[result.best_epoch]);
    }
    return result;
}

}  // namespace survmix
