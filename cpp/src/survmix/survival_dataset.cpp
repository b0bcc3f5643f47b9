#include "survmix/survival_dataset.hpp"

#include <stdexcept>

namespace survmix {

void SurvivalDataset::validate() const {
    if (features.rows() != times.size() || events.size() != times.size()) {
        throw std::invalid_argument("features, times and events must have the same number of rows");
    }
}

SurvivalDataset SurvivalDataset::slice(Eigen::Index start, Eigen::Index count) const {
    if (start < 0 || count < 0 || start + count > size()) {
        throw std::out_of_range("dataset slice out of range");
    }
    SurvivalDataset part;
    part.features = features.middleRows(start, count);
    part.times = times.segment(start, count);
    part.events = events.segment(start, count);
    return part;
}

SurvivalDataset SurvivalDataset::select(const std::vector<Eigen::Index>& indices) const {
    const auto rows = static_cast<Eigen::Index>(indices.size());
    SurvivalDataset part;
    part.features.resize(rows, features.cols());
    part.times.resize(rows);
    part.events.resize(rows);
    for (Eigen::Index r = 0; r < rows; ++r) {
        const Eigen::Index source = indices[static_cast<std::size_t>(r)];
        if (source < 0 || source >= size()) {
            throw std::out_of_range("dataset row index out of range");
        }
        part.features.row(r) = features.row(source);
        part.times(r) = times(source);
        part.events(r) = events(source);
    }
    return part;
}

}  // namespace survmix
