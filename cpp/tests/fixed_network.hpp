#pragma once

#include "survmix/feature_network.hpp"

#include <stdexcept>
#include <utility>

namespace survmix_test {

// Returns the same per-instance parameters for any feature matrix with matching rows.
class FixedNetwork final : public survmix::FeatureNetwork {
public:
    explicit FixedNetwork(survmix::MixtureParameters outputs)
        : outputs_(std::move(outputs)),
          parameters_(Eigen::VectorXd::Zero(1)) {}

    [[nodiscard]] Eigen::Index component_count() const noexcept override { return outputs_.components(); }

    [[nodiscard]] Eigen::Index input_dim() const noexcept override { return 1; }

    [[nodiscard]] survmix::MixtureParameters forward(const Eigen::MatrixXd& features) const override {
        ++forward_calls;
        if (features.rows() != outputs_.rows()) {
            throw std::invalid_argument("fixed network row mismatch");
        }
        return outputs_;
    }

    [[nodiscard]] survmix::MixtureParameters shape_scale() const override {
        ++forward_calls;
        survmix::MixtureParameters prior;
        prior.shape = outputs_.shape.topRows(1);
        prior.scale = outputs_.scale.topRows(1);
        return prior;
    }

    void set_shape_scale(const Eigen::VectorXd& /*shape*/, const Eigen::VectorXd& /*scale*/) override {}

    [[nodiscard]] Eigen::VectorXd backward(const Eigen::MatrixXd& /*features*/,
                                           const survmix::MixtureParameters& /*output_gradient*/) const override {
        return Eigen::VectorXd::Zero(1);
    }

    [[nodiscard]] Eigen::VectorXd shape_scale_backward(const Eigen::MatrixXd& /*d_shape*/,
                                                       const Eigen::MatrixXd& /*d_scale*/) const override {
        return Eigen::VectorXd::Zero(1);
    }

    [[nodiscard]] const survmix::ParameterBundle& parameters() const noexcept override { return parameters_; }

    [[nodiscard]] survmix::ParameterBundle& mutable_parameters() noexcept override { return parameters_; }

    mutable int forward_calls{0};

private:
    survmix::MixtureParameters outputs_;
    survmix::ParameterBundle parameters_;
};

}  // namespace survmix_test
