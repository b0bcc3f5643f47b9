#include "survmix/survival_objective.hpp"
#include "survmix/feature_network.hpp"
#include "survmix/survival_machine.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace survmix {
namespace {

void validate_batch(const Eigen::VectorXd& times, const Eigen::VectorXd& events) {
    if (times.size() == 0) {
        throw std::invalid_argument("survival objective requires a non-empty batch");
    }
    if (times.size() != events.size()) {
        throw std::invalid_argument("times and events must have the same length");
    }
}

void validate_rows(const Eigen::MatrixXd& matrix, Eigen::Index batch_size, Eigen::Index components,
                   const char* name) {
    if (matrix.cols() != components || components == 0) {
        throw std::invalid_argument(std::string(name) + " must have one column per mixture component");
    }
    if (matrix.rows() != 1 && matrix.rows() != batch_size) {
        throw std::invalid_argument(std::string(name) + " must have one row or one row per instance");
    }
}

// Component kernels of one instance, laid out as length-K vectors.
struct ComponentTerms {
    Eigen::VectorXd log_density;
    Eigen::VectorXd log_survival;
    Eigen::VectorXd d_density_d_shape;
    Eigen::VectorXd d_density_d_scale;
    Eigen::VectorXd d_survival_d_shape;
    Eigen::VectorXd d_survival_d_scale;
};

ComponentTerms evaluate_components(const SurvivalKernel& kernel,
                                   const Eigen::MatrixXd& shape,
                                   const Eigen::MatrixXd& scale,
                                   Eigen::Index row,
                                   double time) {
    const Eigen::Index k = shape.cols();
    ComponentTerms terms{Eigen::VectorXd(k), Eigen::VectorXd(k), Eigen::VectorXd(k),
                         Eigen::VectorXd(k), Eigen::VectorXd(k), Eigen::VectorXd(k)};
    for (Eigen::Index g = 0; g < k; ++g) {
        const KernelEvaluation eval = kernel.evaluate(shape(row, g), scale(row, g), time);
        terms.log_density(g) = eval.log_density;
        terms.log_survival(g) = eval.log_survival;
        terms.d_density_d_shape(g) = eval.d_log_density_d_shape;
        terms.d_density_d_scale(g) = eval.d_log_density_d_scale;
        terms.d_survival_d_shape(g) = eval.d_log_survival_d_shape;
        terms.d_survival_d_scale(g) = eval.d_log_survival_d_scale;
    }
    return terms;
}

}  // namespace

ObjectiveEvaluation evaluate_unconditional_objective(DistributionFamily family,
                                                     const Eigen::MatrixXd& shape,
                                                     const Eigen::MatrixXd& scale,
                                                     const Eigen::VectorXd& times,
                                                     const Eigen::VectorXd& events) {
    const auto kernel = SurvivalKernelFactory::create(family);
    validate_batch(times, events);
    const Eigen::Index n = times.size();
    const Eigen::Index k = shape.cols();
    validate_rows(shape, n, k, "shape");
    validate_rows(scale, n, k, "scale");
    if (shape.rows() != scale.rows()) {
        throw std::invalid_argument("shape and scale must have the same number of rows");
    }

    const bool shared = shape.rows() == 1;
    const double inv_n = 1.0 / static_cast<double>(n);

    ObjectiveEvaluation result;
    result.gradient.shape = Eigen::MatrixXd::Zero(shape.rows(), k);
    result.gradient.scale = Eigen::MatrixXd::Zero(scale.rows(), k);

    double log_likelihood = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        const Eigen::Index row = shared ? 0 : i;
        const ComponentTerms terms = evaluate_components(*kernel, shape, scale, row, times(i));
        if (events(i) != 0.0) {
            const AggregateEvaluation agg = uniform_sum(terms.log_density);
            log_likelihood += agg.value;
            result.gradient.shape.row(row) -= inv_n * agg.d_values.cwiseProduct(terms.d_density_d_shape).transpose();
            result.gradient.scale.row(row) -= inv_n * agg.d_values.cwiseProduct(terms.d_density_d_scale).transpose();
        } else {
            const AggregateEvaluation agg = uniform_sum(terms.log_survival);
            log_likelihood += agg.value;
            result.gradient.shape.row(row) -= inv_n * agg.d_values.cwiseProduct(terms.d_survival_d_shape).transpose();
            result.gradient.scale.row(row) -= inv_n * agg.d_values.cwiseProduct(terms.d_survival_d_scale).transpose();
        }
    }

    result.value = -log_likelihood * inv_n;
    return result;
}

ObjectiveEvaluation evaluate_conditional_objective(DistributionFamily family,
                                                   double discount,
                                                   const MixtureParameters& parameters,
                                                   const Eigen::VectorXd& times,
                                                   const Eigen::VectorXd& events,
                                                   AggregationMode mode) {
    const auto kernel = SurvivalKernelFactory::create(family);
    validate_batch(times, events);
    const Eigen::Index n = times.size();
    const Eigen::Index k = parameters.components();
    validate_rows(parameters.shape, n, k, "shape");
    validate_rows(parameters.scale, n, k, "scale");
    validate_rows(parameters.logits, n, k, "logits");

    const MixtureAggregator aggregator(mode);
    const EventPartition partition = partition_by_event(events);
    const double inv_n = 1.0 / static_cast<double>(n);

    ObjectiveEvaluation result;
    result.gradient = zeros_like(parameters);

    auto row_of = [](const Eigen::MatrixXd& m, Eigen::Index i) { return m.rows() == 1 ? Eigen::Index{0} : i; };

    double event_total = 0.0;
    for (const Eigen::Index i : partition.uncensored) {
        const Eigen::Index p = row_of(parameters.shape, i);
        const Eigen::Index s = row_of(parameters.scale, i);
        const Eigen::Index l = row_of(parameters.logits, i);
        if (p != s) {
            throw std::invalid_argument("shape and scale must have the same number of rows");
        }
        const ComponentTerms terms = evaluate_components(*kernel, parameters.shape, parameters.scale, p, times(i));
        const AggregateEvaluation agg = aggregator.aggregate(terms.log_density, parameters.logits.row(l).transpose());
        event_total += agg.value;
        result.gradient.shape.row(p) -= inv_n * agg.d_values.cwiseProduct(terms.d_density_d_shape).transpose();
        result.gradient.scale.row(p) -= inv_n * agg.d_values.cwiseProduct(terms.d_density_d_scale).transpose();
        result.gradient.logits.row(l) -= inv_n * agg.d_logits.transpose();
    }

    double censored_total = 0.0;
    if (discount != 0.0) {
        const double weight = discount * inv_n;
        for (const Eigen::Index i : partition.censored) {
            const Eigen::Index p = row_of(parameters.shape, i);
            const Eigen::Index s = row_of(parameters.scale, i);
            const Eigen::Index l = row_of(parameters.logits, i);
            if (p != s) {
                throw std::invalid_argument("shape and scale must have the same number of rows");
            }
            const ComponentTerms terms = evaluate_components(*kernel, parameters.shape, parameters.scale, p, times(i));
            const AggregateEvaluation agg = aggregator.aggregate(terms.log_survival, parameters.logits.row(l).transpose());
            censored_total += agg.value;
            result.gradient.shape.row(p) -= weight * agg.d_values.cwiseProduct(terms.d_survival_d_shape).transpose();
            result.gradient.scale.row(p) -= weight * agg.d_values.cwiseProduct(terms.d_survival_d_scale).transpose();
            result.gradient.logits.row(l) -= weight * agg.d_logits.transpose();
        }
    }

    result.value = -(event_total + discount * censored_total) * inv_n;
    return result;
}

double unconditional_loss(const SurvivalMachine& model,
                          const Eigen::VectorXd& times,
                          const Eigen::VectorXd& events) {
    require_supported(model.family());
    const MixtureParameters prior = model.network().shape_scale();
    return evaluate_unconditional_objective(model.family(), prior.shape, prior.scale, times, events).value;
}

double conditional_loss(const SurvivalMachine& model,
                        const Eigen::MatrixXd& features,
                        const Eigen::VectorXd& times,
                        const Eigen::VectorXd& events,
                        bool elbo) {
    // Checked before the forward pass so an unsupported family does no work.
    require_supported(model.family());
    if (features.rows() != times.size()) {
        throw std::invalid_argument("features must have one row per instance");
    }
    const MixtureParameters parameters = model.network().forward(features);
    const AggregationMode mode = elbo ? AggregationMode::Elbo : AggregationMode::Exact;
    return evaluate_conditional_objective(model.family(), model.discount(), parameters, times, events, mode).value;
}

}  // namespace survmix
