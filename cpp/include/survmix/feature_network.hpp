#pragma once

#include "survmix/mixture_parameters.hpp"
#include "survmix/parameter_bundle.hpp"

#include <Eigen/Dense>

namespace survmix {

/**
 * Maps features to per-instance mixture parameters. Implementations own their
 * parameters as a single ParameterBundle and report gradients in the same flat
 * layout, so any optimizer can drive them.
 */
class FeatureNetwork {
public:
    virtual ~FeatureNetwork() = default;

    [[nodiscard]] virtual Eigen::Index component_count() const noexcept = 0;

    [[nodiscard]] virtual Eigen::Index input_dim() const noexcept = 0;

    // shape, scale and logits, each [n, K].
    [[nodiscard]] virtual MixtureParameters forward(const Eigen::MatrixXd& features) const = 0;

    // Global shape and scale, each [1, K]; logits are empty.
    [[nodiscard]] virtual MixtureParameters shape_scale() const = 0;

    virtual void set_shape_scale(const Eigen::VectorXd& shape, const Eigen::VectorXd& scale) = 0;

    // Gradient with respect to the bundle, given the gradient with respect to forward(features).
    [[nodiscard]] virtual Eigen::VectorXd backward(const Eigen::MatrixXd& features,
                                                   const MixtureParameters& output_gradient) const = 0;

    // Gradient with respect to the bundle, given the gradient with respect to shape_scale().
    [[nodiscard]] virtual Eigen::VectorXd shape_scale_backward(const Eigen::MatrixXd& d_shape,
                                                               const Eigen::MatrixXd& d_scale) const = 0;

    [[nodiscard]] virtual const ParameterBundle& parameters() const noexcept = 0;

    [[nodiscard]] virtual ParameterBundle& mutable_parameters() noexcept = 0;
};

}  // namespace survmix
