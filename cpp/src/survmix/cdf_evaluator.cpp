#include "survmix/cdf_evaluator.hpp"
#include "survmix/feature_network.hpp"
#include "survmix/mixture_aggregator.hpp"
#include "survmix/survival_machine.hpp"

#include <stdexcept>

namespace survmix {

std::vector<Eigen::VectorXd> evaluate_log_survival(DistributionFamily family,
                                                   const MixtureParameters& parameters,
                                                   const std::vector<double>& horizons) {
    const auto kernel = SurvivalKernelFactory::create(family);
    for (double horizon : horizons) {
        if (!(horizon >= 0.0)) {
            throw std::invalid_argument("prediction horizons must be non-negative");
        }
    }
    const Eigen::Index n = parameters.rows();
    const Eigen::Index k = parameters.components();
    if (parameters.scale.rows() != n || parameters.scale.cols() != k ||
        parameters.logits.cols() != k || (parameters.logits.rows() != n && parameters.logits.rows() != 1)) {
        throw std::invalid_argument("shape, scale and logits must agree in shape");
    }

    const MixtureAggregator aggregator(AggregationMode::Exact);
    std::vector<Eigen::VectorXd> curves;
    curves.reserve(horizons.size());
    Eigen::MatrixXd component_survival(n, k);
    for (double horizon : horizons) {
        for (Eigen::Index i = 0; i < n; ++i) {
            for (Eigen::Index g = 0; g < k; ++g) {
                component_survival(i, g) = kernel->log_survival(parameters.shape(i, g), parameters.scale(i, g), horizon);
            }
        }
        curves.push_back(aggregator.aggregate_rows(component_survival, parameters.logits));
    }
    return curves;
}

std::vector<Eigen::VectorXd> evaluate_log_cdf(DistributionFamily family,
                                              const MixtureParameters& parameters,
                                              const std::vector<double>& horizons) {
    std::vector<Eigen::VectorXd> curves = evaluate_log_survival(family, parameters, horizons);
    for (Eigen::VectorXd& curve : curves) {
        curve = curve.unaryExpr([](double log_survival) { return log1m_exp(log_survival); });
    }
    return curves;
}

std::vector<Eigen::VectorXd> predict_log_survival(const SurvivalMachine& model,
                                                  const Eigen::MatrixXd& features,
                                                  const std::vector<double>& horizons) {
    require_supported(model.family());
    return evaluate_log_survival(model.family(), model.network().forward(features), horizons);
}

std::vector<Eigen::VectorXd> predict_cdf(const SurvivalMachine& model,
                                         const Eigen::MatrixXd& features,
                                         const std::vector<double>& horizons) {
    require_supported(model.family());
    return evaluate_log_cdf(model.family(), model.network().forward(features), horizons);
}

}  // namespace survmix
