#pragma once

#include "survmix/feature_network.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <vector>

namespace survmix {

enum class HeadActivation {
    Selu,
    Tanh
};

struct SurvivalNetworkOptions {
    Eigen::Index input_dim{0};
    Eigen::Index k{3};
    std::vector<int> layers{};          // hidden widths; empty means features feed the heads directly
    double temperature{1000.0};         // gate logits are divided by this
    HeadActivation activation{HeadActivation::Selu};
    double initial_shape_scale{-1.0};   // starting value of the global shape/scale rows
    std::uint64_t seed{0};
};

/**
 * Deep Survival Machines network.
 *
 *   h      = ReLU6(... ReLU6(x W_1^T) ... W_L^T)      (hidden layers have no intercept)
 *   shape  = act(h W_shape^T + c_shape) + shape_bias
 *   scale  = act(h W_scale^T + c_scale) + scale_bias
 *   logits = (h W_gate^T) / temperature
 *
 * shape_bias and scale_bias are the global rows returned by shape_scale() and
 * fitted by the prior objective.
 */
class SurvivalNetwork final : public FeatureNetwork {
public:
    explicit SurvivalNetwork(const SurvivalNetworkOptions& options);

    [[nodiscard]] Eigen::Index component_count() const noexcept override;

    [[nodiscard]] Eigen::Index input_dim() const noexcept override;

    [[nodiscard]] MixtureParameters forward(const Eigen::MatrixXd& features) const override;

    [[nodiscard]] MixtureParameters shape_scale() const override;

    void set_shape_scale(const Eigen::VectorXd& shape, const Eigen::VectorXd& scale) override;

    [[nodiscard]] Eigen::VectorXd backward(const Eigen::MatrixXd& features,
                                           const MixtureParameters& output_gradient) const override;

    [[nodiscard]] Eigen::VectorXd shape_scale_backward(const Eigen::MatrixXd& d_shape,
                                                       const Eigen::MatrixXd& d_scale) const override;

    [[nodiscard]] const ParameterBundle& parameters() const noexcept override;

    [[nodiscard]] ParameterBundle& mutable_parameters() noexcept override;

    [[nodiscard]] const SurvivalNetworkOptions& options() const noexcept;

private:
    struct Block {
        Eigen::Index offset{0};
        Eigen::Index rows{0};
        Eigen::Index cols{0};
    };

    struct ForwardCache {
        std::vector<Eigen::MatrixXd> layer_inputs;
        std::vector<Eigen::MatrixXd> pre_activations;
        Eigen::MatrixXd representation;
        Eigen::MatrixXd shape_pre;
        Eigen::MatrixXd scale_pre;
        MixtureParameters output;
    };

    Block allocate(Eigen::Index rows, Eigen::Index cols);

    [[nodiscard]] Eigen::Map<const Eigen::MatrixXd> matrix_block(const Block& block) const;

    [[nodiscard]] Eigen::Map<const Eigen::VectorXd> vector_block(const Block& block) const;

    [[nodiscard]] ForwardCache run_forward(const Eigen::MatrixXd& features) const;

    SurvivalNetworkOptions options_;
    std::vector<Block> hidden_;
    Block shape_weight_;
    Block shape_intercept_;
    Block scale_weight_;
    Block scale_intercept_;
    Block gate_weight_;
    Block shape_bias_;
    Block scale_bias_;
    Eigen::Index size_{0};
    ParameterBundle parameters_;
};

}  // namespace survmix
