#include "survmix/survival_network.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

namespace survmix {
namespace {

constexpr double kSeluScale = 1.0507009873554804934193349852946;
constexpr double kSeluAlpha = 1.6732632423543772848170429916717;

double relu6(double x) {
    return std::min(std::max(x, 0.0), 6.0);
}

double relu6_derivative(double x) {
    return (x > 0.0 && x < 6.0) ? 1.0 : 0.0;
}

double head_activation(HeadActivation activation, double x) {
    if (activation == HeadActivation::Tanh) {
        return std::tanh(x);
    }
    return x > 0.0 ? kSeluScale * x : kSeluScale * kSeluAlpha * std::expm1(x);
}

double head_derivative(HeadActivation activation, double x) {
    if (activation == HeadActivation::Tanh) {
        const double t = std::tanh(x);
        return 1.0 - t * t;
    }
    return x > 0.0 ? kSeluScale : kSeluScale * kSeluAlpha * std::exp(x);
}

Eigen::Map<Eigen::MatrixXd> writable(Eigen::VectorXd& flat, Eigen::Index offset, Eigen::Index rows, Eigen::Index cols) {
    return Eigen::Map<Eigen::MatrixXd>(flat.data() + offset, rows, cols);
}

}  // namespace

SurvivalNetwork::SurvivalNetwork(const SurvivalNetworkOptions& options)
    : options_(options) {
    if (options_.input_dim <= 0) {
        throw std::invalid_argument("network input dimension must be positive");
    }
    if (options_.k <= 0) {
        throw std::invalid_argument("number of mixture components must be positive");
    }
    if (!(options_.temperature > 0.0)) {
        throw std::invalid_argument("gate temperature must be positive");
    }

    Eigen::Index width = options_.input_dim;
    for (int hidden : options_.layers) {
        if (hidden <= 0) {
            throw std::invalid_argument("hidden layer widths must be positive");
        }
        hidden_.push_back(allocate(hidden, width));
        width = hidden;
    }
    const Eigen::Index k = options_.k;
    shape_weight_ = allocate(k, width);
    shape_intercept_ = allocate(k, 1);
    scale_weight_ = allocate(k, width);
    scale_intercept_ = allocate(k, 1);
    gate_weight_ = allocate(k, width);
    shape_bias_ = allocate(k, 1);
    scale_bias_ = allocate(k, 1);

    Eigen::VectorXd values(size_);
    std::mt19937_64 rng(options_.seed);
    auto fill_uniform = [&](const Block& block, Eigen::Index fan_in) {
        const double bound = 1.0 / std::sqrt(static_cast<double>(fan_in));
        std::uniform_real_distribution<double> dist(-bound, bound);
        for (Eigen::Index i = 0; i < block.rows * block.cols; ++i) {
            values(block.offset + i) = dist(rng);
        }
    };
    for (const Block& block : hidden_) {
        fill_uniform(block, block.cols);
    }
    fill_uniform(shape_weight_, width);
    fill_uniform(shape_intercept_, width);
    fill_uniform(scale_weight_, width);
    fill_uniform(scale_intercept_, width);
    fill_uniform(gate_weight_, width);
    values.segment(shape_bias_.offset, k).setConstant(options_.initial_shape_scale);
    values.segment(scale_bias_.offset, k).setConstant(options_.initial_shape_scale);
    parameters_ = ParameterBundle(std::move(values));
}

SurvivalNetwork::Block SurvivalNetwork::allocate(Eigen::Index rows, Eigen::Index cols) {
    Block block{size_, rows, cols};
    size_ += rows * cols;
    return block;
}

Eigen::Map<const Eigen::MatrixXd> SurvivalNetwork::matrix_block(const Block& block) const {
    return Eigen::Map<const Eigen::MatrixXd>(parameters_.values().data() + block.offset, block.rows, block.cols);
}

Eigen::Map<const Eigen::VectorXd> SurvivalNetwork::vector_block(const Block& block) const {
    return Eigen::Map<const Eigen::VectorXd>(parameters_.values().data() + block.offset, block.rows * block.cols);
}

Eigen::Index SurvivalNetwork::component_count() const noexcept {
    return options_.k;
}

Eigen::Index SurvivalNetwork::input_dim() const noexcept {
    return options_.input_dim;
}

const SurvivalNetworkOptions& SurvivalNetwork::options() const noexcept {
    return options_;
}

const ParameterBundle& SurvivalNetwork::parameters() const noexcept {
    return parameters_;
}

ParameterBundle& SurvivalNetwork::mutable_parameters() noexcept {
    return parameters_;
}

SurvivalNetwork::ForwardCache SurvivalNetwork::run_forward(const Eigen::MatrixXd& features) const {
    if (features.cols() != options_.input_dim) {
        throw std::invalid_argument("feature matrix has " + std::to_string(features.cols()) +
                                    " columns, network expects " + std::to_string(options_.input_dim));
    }
    const HeadActivation activation = options_.activation;

    ForwardCache cache;
    Eigen::MatrixXd h = features;
    for (const Block& block : hidden_) {
        Eigen::MatrixXd z = h * matrix_block(block).transpose();
        cache.layer_inputs.push_back(std::move(h));
        h = z.unaryExpr([](double x) { return relu6(x); });
        cache.pre_activations.push_back(std::move(z));
    }

    cache.shape_pre = h * matrix_block(shape_weight_).transpose();
    cache.shape_pre.rowwise() += vector_block(shape_intercept_).transpose();
    cache.scale_pre = h * matrix_block(scale_weight_).transpose();
    cache.scale_pre.rowwise() += vector_block(scale_intercept_).transpose();

    cache.output.shape = cache.shape_pre.unaryExpr([activation](double x) { return head_activation(activation, x); });
    cache.output.shape.rowwise() += vector_block(shape_bias_).transpose();
    cache.output.scale = cache.scale_pre.unaryExpr([activation](double x) { return head_activation(activation, x); });
    cache.output.scale.rowwise() += vector_block(scale_bias_).transpose();
    cache.output.logits = (h * matrix_block(gate_weight_).transpose()) / options_.temperature;
    cache.representation = std::move(h);
    return cache;
}

MixtureParameters SurvivalNetwork::forward(const Eigen::MatrixXd& features) const {
    return run_forward(features).output;
}

MixtureParameters SurvivalNetwork::shape_scale() const {
    MixtureParameters prior;
    prior.shape = vector_block(shape_bias_).transpose();
    prior.scale = vector_block(scale_bias_).transpose();
    return prior;
}

void SurvivalNetwork::set_shape_scale(const Eigen::VectorXd& shape, const Eigen::VectorXd& scale) {
    if (shape.size() != options_.k || scale.size() != options_.k) {
        throw std::invalid_argument("shape and scale must have one entry per mixture component");
    }
    parameters_.assign_segment(shape_bias_.offset, shape);
    parameters_.assign_segment(scale_bias_.offset, scale);
}

Eigen::VectorXd SurvivalNetwork::backward(const Eigen::MatrixXd& features,
                                          const MixtureParameters& output_gradient) const {
    const ForwardCache cache = run_forward(features);
    const Eigen::Index n = features.rows();
    const Eigen::Index k = options_.k;
    if (output_gradient.shape.rows() != n || output_gradient.shape.cols() != k ||
        output_gradient.scale.rows() != n || output_gradient.scale.cols() != k ||
        output_gradient.logits.rows() != n || output_gradient.logits.cols() != k) {
        throw std::invalid_argument("output gradient must be [n, K] for shape, scale and logits");
    }
    const HeadActivation activation = options_.activation;
    const Eigen::MatrixXd& h = cache.representation;

    Eigen::VectorXd gradient = Eigen::VectorXd::Zero(size_);

    const Eigen::MatrixXd d_shape_pre = output_gradient.shape.cwiseProduct(
        cache.shape_pre.unaryExpr([activation](double x) { return head_derivative(activation, x); }));
    const Eigen::MatrixXd d_scale_pre = output_gradient.scale.cwiseProduct(
        cache.scale_pre.unaryExpr([activation](double x) { return head_derivative(activation, x); }));
    const Eigen::MatrixXd d_gate = output_gradient.logits / options_.temperature;

    writable(gradient, shape_weight_.offset, k, shape_weight_.cols) = d_shape_pre.transpose() * h;
    gradient.segment(shape_intercept_.offset, k) = d_shape_pre.colwise().sum().transpose();
    writable(gradient, scale_weight_.offset, k, scale_weight_.cols) = d_scale_pre.transpose() * h;
    gradient.segment(scale_intercept_.offset, k) = d_scale_pre.colwise().sum().transpose();
    writable(gradient, gate_weight_.offset, k, gate_weight_.cols) = d_gate.transpose() * h;
    gradient.segment(shape_bias_.offset, k) = output_gradient.shape.colwise().sum().transpose();
    gradient.segment(scale_bias_.offset, k) = output_gradient.scale.colwise().sum().transpose();

    Eigen::MatrixXd d_hidden = d_shape_pre * matrix_block(shape_weight_) +
                               d_scale_pre * matrix_block(scale_weight_) +
                               d_gate * matrix_block(gate_weight_);
    for (std::size_t l = hidden_.size(); l-- > 0;) {
        const Block& block = hidden_[l];
        const Eigen::MatrixXd d_pre = d_hidden.cwiseProduct(cache.pre_activations[l].unaryExpr([](double x) { return relu6_derivative(x); }));
        writable(gradient, block.offset, block.rows, block.cols) = d_pre.transpose() * cache.layer_inputs[l];
        d_hidden = d_pre * matrix_block(block);
    }
    return gradient;
}

Eigen::VectorXd SurvivalNetwork::shape_scale_backward(const Eigen::MatrixXd& d_shape,
                                                      const Eigen::MatrixXd& d_scale) const {
    if (d_shape.cols() != options_.k || d_scale.cols() != options_.k) {
        throw std::invalid_argument("shape/scale gradient must have one column per mixture component");
    }
    Eigen::VectorXd gradient = Eigen::VectorXd::Zero(size_);
    gradient.segment(shape_bias_.offset, options_.k) = d_shape.colwise().sum().transpose();
    gradient.segment(scale_bias_.offset, options_.k) = d_scale.colwise().sum().transpose();
    return gradient;
}

}  // namespace survmix
