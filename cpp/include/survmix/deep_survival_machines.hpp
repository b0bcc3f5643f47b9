#pragma once

#include "survmix/survival_machine.hpp"
#include "survmix/trainer.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace survmix {

struct FitOptions {
    double validation_fraction{0.15};   // share of shuffled rows held out for early stopping
    std::size_t iterations{1};
    double learning_rate{1e-3};
    std::size_t batch_size{100};
    bool elbo{true};
    std::string optimizer{"Adam"};
    std::uint64_t random_state{100};    // seeds the shuffle and the network initialisation
    bool verbose{false};
};

/**
 * Fit/predict front end. Each fit() builds and trains a fresh SurvivalMachine;
 * predictions are read-only and may run concurrently once fitting is done.
 */
class DeepSurvivalMachines {
public:
    DeepSurvivalMachines() = default;

    explicit DeepSurvivalMachines(ModelOptions options);

    TrainingResult fit(const Eigen::MatrixXd& features,
                       const Eigen::VectorXd& times,
                       const Eigen::VectorXd& events,
                       const FitOptions& options = FitOptions{});

    // [n, H] matrix of P(T > t_j | x_i).
    [[nodiscard]] Eigen::MatrixXd predict_survival(const Eigen::MatrixXd& features,
                                                   const std::vector<double>& horizons) const;

    // [n, H] matrix of P(T <= t_j | x_i) = 1 - survival.
    [[nodiscard]] Eigen::MatrixXd predict_risk(const Eigen::MatrixXd& features,
                                               const std::vector<double>& horizons) const;

    [[nodiscard]] bool is_fitted() const noexcept;

    [[nodiscard]] const SurvivalMachine& model() const;

    [[nodiscard]] const ModelOptions& options() const noexcept;

    [[nodiscard]] std::string describe() const;

private:
    void check_features(const Eigen::MatrixXd& features) const;

    ModelOptions options_{};
    std::unique_ptr<SurvivalMachine> model_;
};

}  // namespace survmix
