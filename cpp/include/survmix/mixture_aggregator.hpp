#pragma once

#include <Eigen/Dense>

namespace survmix {

enum class AggregationMode {
    Elbo,   // sum_g softmax(logits)_g * v_g, a lower bound on the mixture log-likelihood
    Exact   // logsumexp_g(log_softmax(logits)_g + v_g), the mixture log-likelihood itself
};

struct AggregateEvaluation {
    double value{0.0};
    Eigen::VectorXd d_values;
    Eigen::VectorXd d_logits;
};

[[nodiscard]] double log_sum_exp(const Eigen::VectorXd& values);

[[nodiscard]] Eigen::VectorXd softmax(const Eigen::VectorXd& logits);

[[nodiscard]] Eigen::VectorXd log_softmax(const Eigen::VectorXd& logits);

// log(1 - exp(x)) for x <= 0.
[[nodiscard]] double log1m_exp(double x);

/**
 * Combines the K per-component log-quantities of an instance (log-density or
 * log-survival) into one mixture log-quantity using the instance's gating logits.
 */
class MixtureAggregator {
public:
    explicit MixtureAggregator(AggregationMode mode);

    [[nodiscard]] AggregationMode mode() const noexcept;

    [[nodiscard]] AggregateEvaluation aggregate(const Eigen::VectorXd& component_values,
                                                const Eigen::VectorXd& logits) const;

    [[nodiscard]] double aggregate_value(const Eigen::VectorXd& component_values,
                                         const Eigen::VectorXd& logits) const;

    // Row-wise aggregation of an [n, K] matrix. A single-row logits matrix is shared by every row.
    [[nodiscard]] Eigen::VectorXd aggregate_rows(const Eigen::MatrixXd& component_values,
                                                 const Eigen::MatrixXd& logits) const;

private:
    AggregationMode mode_;
};

// Equal-responsibility combination used by the prior objective: plain sum over components.
[[nodiscard]] AggregateEvaluation uniform_sum(const Eigen::VectorXd& component_values);

}  // namespace survmix
