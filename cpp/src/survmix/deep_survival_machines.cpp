#include "survmix/deep_survival_machines.hpp"
#include "survmix/cdf_evaluator.hpp"
#include "survmix/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace survmix {

DeepSurvivalMachines::DeepSurvivalMachines(ModelOptions options)
    : options_(std::move(options)) {
    // Fail at construction rather than at the first fit.
    static_cast<void>(parse_distribution(options_.distribution));
}

TrainingResult DeepSurvivalMachines::fit(const Eigen::MatrixXd& features,
                                         const Eigen::VectorXd& times,
                                         const Eigen::VectorXd& events,
                                         const FitOptions& options) {
    const SurvivalDataset data{features, times, events};
    data.validate();
    if (!(options.validation_fraction > 0.0 && options.validation_fraction < 1.0)) {
        throw std::invalid_argument("validation_fraction must lie in (0, 1)");
    }
    const Eigen::Index n = data.size();
    if (n < 2) {
        throw std::invalid_argument("fit requires at least two instances");
    }

    std::vector<Eigen::Index> order(static_cast<std::size_t>(n));
    std::iota(order.begin(), order.end(), Eigen::Index{0});
    std::mt19937_64 rng(options.random_state);
    std::shuffle(order.begin(), order.end(), rng);

    auto validation_size = static_cast<Eigen::Index>(std::floor(options.validation_fraction * static_cast<double>(n)));
    validation_size = std::clamp<Eigen::Index>(validation_size, 1, n - 1);
    const auto split = order.begin() + (n - validation_size);
    const SurvivalDataset train = data.select(std::vector<Eigen::Index>(order.begin(), split));
    const SurvivalDataset validation = data.select(std::vector<Eigen::Index>(split, order.end()));

    ModelOptions model_options = options_;
    model_options.seed = options.random_state;
    auto model = std::make_unique<SurvivalMachine>(features.cols(), model_options);

    TrainingOptions training;
    training.iterations = options.iterations;
    training.learning_rate = options.learning_rate;
    training.batch_size = options.batch_size;
    training.elbo = options.elbo;
    training.optimizer = options.optimizer;
    training.verbose = options.verbose;

    if (options.verbose) {
        std::cout << "fitting on " << train.size() << " instances, validating on " << validation.size() << std::endl;
    }
    TrainingResult result = train_survival_machine(*model, train, validation, training);
    model_ = std::move(model);
    return result;
}

Eigen::MatrixXd DeepSurvivalMachines::predict_survival(const Eigen::MatrixXd& features,
                                                       const std::vector<double>& horizons) const {
    if (!model_) {
        throw NotFittedError("predict_survival");
    }
    check_features(features);
    const std::vector<Eigen::VectorXd> curves = predict_log_survival(*model_, features, horizons);
    Eigen::MatrixXd survival(features.rows(), static_cast<Eigen::Index>(horizons.size()));
    for (std::size_t j = 0; j < curves.size(); ++j) {
        survival.col(static_cast<Eigen::Index>(j)) = curves[j].array().exp().matrix();
    }
    return survival;
}

Eigen::MatrixXd DeepSurvivalMachines::predict_risk(const Eigen::MatrixXd& features,
                                                   const std::vector<double>& horizons) const {
    if (!model_) {
        throw NotFittedError("predict_risk");
    }
    return (1.0 - predict_survival(features, horizons).array()).matrix();
}

bool DeepSurvivalMachines::is_fitted() const noexcept {
    return model_ != nullptr;
}

const SurvivalMachine& DeepSurvivalMachines::model() const {
    if (!model_) {
        throw NotFittedError("model");
    }
    return *model_;
}

const ModelOptions& DeepSurvivalMachines::options() const noexcept {
    return options_;
}

std::string DeepSurvivalMachines::describe() const {
    std::ostringstream out;
    out << (model_ ? "A fitted" : "An unfitted") << " instance of the Deep Survival Machines model\n";
    out << "Number of underlying distributions (k): " << options_.k << "\n";
    out << "Hidden Layers: [";
    for (std::size_t i = 0; i < options_.layers.size(); ++i) {
        out << (i ? ", " : "") << options_.layers[i];
    }
    out << "]\n";
    out << "Distribution Choice: " << options_.distribution << "\n";
    return out.str();
}

void DeepSurvivalMachines::check_features(const Eigen::MatrixXd& features) const {
    if (features.cols() != model_->network().input_dim()) {
        throw std::invalid_argument("feature matrix has " + std::to_string(features.cols()) +
                                    " columns, model was fitted on " +
                                    std::to_string(model_->network().input_dim()));
    }
}

}  // namespace survmix
