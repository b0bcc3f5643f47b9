#include "survmix/mixture_aggregator.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace survmix {

double log_sum_exp(const Eigen::VectorXd& values) {
    if (values.size() == 0) {
        return -std::numeric_limits<double>::infinity();
    }
    if (values.hasNaN()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    const double max_value = values.maxCoeff();
    if (!std::isfinite(max_value)) {
        return max_value;
    }
    return max_value + std::log((values.array() - max_value).exp().sum());
}

Eigen::VectorXd log_softmax(const Eigen::VectorXd& logits) {
    return logits.array() - log_sum_exp(logits);
}

Eigen::VectorXd softmax(const Eigen::VectorXd& logits) {
    return log_softmax(logits).array().exp();
}

double log1m_exp(double x) {
    // Maechler (2012): switch at -log 2 between the two forms that keep full precision.
    if (x > -std::log(2.0)) {
        return std::log(-std::expm1(x));
    }
    return std::log1p(-std::exp(x));
}

MixtureAggregator::MixtureAggregator(AggregationMode mode)
    : mode_(mode) {}

AggregationMode MixtureAggregator::mode() const noexcept {
    return mode_;
}

AggregateEvaluation MixtureAggregator::aggregate(const Eigen::VectorXd& component_values,
                                                 const Eigen::VectorXd& logits) const {
    if (component_values.size() != logits.size()) {
        throw std::invalid_argument("component values and logits must have the same length");
    }

    AggregateEvaluation result;
    if (mode_ == AggregationMode::Elbo) {
        const Eigen::VectorXd weights = softmax(logits);
        result.value = weights.dot(component_values);
        result.d_values = weights;
        result.d_logits = weights.array() * (component_values.array() - result.value);
        return result;
    }

    const Eigen::VectorXd log_weights = log_softmax(logits);
    const Eigen::VectorXd joint = log_weights + component_values;
    result.value = log_sum_exp(joint);
    // Posterior responsibilities of each component given the observation.
    const Eigen::VectorXd responsibilities = (joint.array() - result.value).exp();
    result.d_values = responsibilities;
    result.d_logits = responsibilities - log_weights.array().exp().matrix();
    return result;
}

double MixtureAggregator::aggregate_value(const Eigen::VectorXd& component_values,
                                          const Eigen::VectorXd& logits) const {
    if (component_values.size() != logits.size()) {
        throw std::invalid_argument("component values and logits must have the same length");
    }
    if (mode_ == AggregationMode::Elbo) {
        return softmax(logits).dot(component_values);
    }
    return log_sum_exp(log_softmax(logits) + component_values);
}

Eigen::VectorXd MixtureAggregator::aggregate_rows(const Eigen::MatrixXd& component_values,
                                                  const Eigen::MatrixXd& logits) const {
    const bool shared_logits = logits.rows() == 1;
    if (!shared_logits && logits.rows() != component_values.rows()) {
        throw std::invalid_argument("logits must have one row or one row per instance");
    }
    Eigen::VectorXd aggregated(component_values.rows());
    for (Eigen::Index i = 0; i < component_values.rows(); ++i) {
        const Eigen::Index logit_row = shared_logits ? 0 : i;
        aggregated(i) = aggregate_value(component_values.row(i).transpose(),
                                        logits.row(logit_row).transpose());
    }
    return aggregated;
}

AggregateEvaluation uniform_sum(const Eigen::VectorXd& component_values) {
    AggregateEvaluation result;
    result.value = component_values.sum();
    result.d_values = Eigen::VectorXd::Ones(component_values.size());
    result.d_logits = Eigen::VectorXd::Zero(component_values.size());
    return result;
}

}  // namespace survmix
