#pragma once

#include <Eigen/Dense>

#include <vector>

namespace survmix {

// Features [n, d], times [n] (strictly positive), events [n] (1 = event, 0 = censored).
struct SurvivalDataset {
    Eigen::MatrixXd features;
    Eigen::VectorXd times;
    Eigen::VectorXd events;

    [[nodiscard]] Eigen::Index size() const noexcept { return times.size(); }

    // Throws std::invalid_argument when the three parts disagree on the number of rows.
    void validate() const;

    // Contiguous rows [start, start + count).
    [[nodiscard]] SurvivalDataset slice(Eigen::Index start, Eigen::Index count) const;

    // Rows in the given order.
    [[nodiscard]] SurvivalDataset select(const std::vector<Eigen::Index>& indices) const;
};

}  // namespace survmix
