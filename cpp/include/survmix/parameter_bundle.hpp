#pragma once

#include <Eigen/Dense>

#include <cstdint>

namespace survmix {

/**
 * Flat, exclusively owned parameter vector of a model. Every committed update
 * bumps `version`, so readers can tell whether the values moved underneath them.
 */
class ParameterBundle {
public:
    ParameterBundle() = default;

    explicit ParameterBundle(Eigen::VectorXd values);

    [[nodiscard]] const Eigen::VectorXd& values() const noexcept;

    [[nodiscard]] Eigen::Index size() const noexcept;

    [[nodiscard]] std::uint64_t version() const noexcept;

    // Replaces all values; the size must not change.
    void assign(const Eigen::VectorXd& values);

    // values += step
    void apply_step(const Eigen::VectorXd& step);

    // Writes a contiguous block in place.
    void assign_segment(Eigen::Index offset, const Eigen::VectorXd& values);

private:
    Eigen::VectorXd values_;
    std::uint64_t version_{0};
};

}  // namespace survmix
