#pragma once

#include <Eigen/Dense>

#include <vector>

namespace survmix {

// Per-instance (or single shared row) mixture parameters, each [rows, K].
struct MixtureParameters {
    Eigen::MatrixXd shape;
    Eigen::MatrixXd scale;
    Eigen::MatrixXd logits;

    [[nodiscard]] Eigen::Index rows() const noexcept { return shape.rows(); }

    [[nodiscard]] Eigen::Index components() const noexcept { return shape.cols(); }
};

[[nodiscard]] MixtureParameters zeros_like(const MixtureParameters& parameters);

struct EventPartition {
    std::vector<Eigen::Index> uncensored;
    std::vector<Eigen::Index> censored;
};

// Splits row indices by event status, preserving order. Any non-zero status is an event.
[[nodiscard]] EventPartition partition_by_event(const Eigen::VectorXd& events);

}  // namespace survmix
