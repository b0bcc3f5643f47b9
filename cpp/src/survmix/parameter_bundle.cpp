#include "survmix/parameter_bundle.hpp"

#include <stdexcept>
#include <utility>

namespace survmix {

ParameterBundle::ParameterBundle(Eigen::VectorXd values)
    : values_(std::move(values)) {}

const Eigen::VectorXd& ParameterBundle::values() const noexcept {
    return values_;
}

Eigen::Index ParameterBundle::size() const noexcept {
    return values_.size();
}

std::uint64_t ParameterBundle::version() const noexcept {
    return version_;
}

void ParameterBundle::assign(const Eigen::VectorXd& values) {
    if (values.size() != values_.size()) {
        throw std::invalid_argument("parameter bundle size mismatch");
    }
    values_ = values;
    ++version_;
}

void ParameterBundle::apply_step(const Eigen::VectorXd& step) {
    if (step.size() != values_.size()) {
        throw std::invalid_argument("parameter step size mismatch");
    }
    values_ += step;
    ++version_;
}

void ParameterBundle::assign_segment(Eigen::Index offset, const Eigen::VectorXd& values) {
    if (offset < 0 || offset + values.size() > values_.size()) {
        throw std::out_of_range("parameter segment out of range");
    }
    values_.segment(offset, values.size()) = values;
    ++version_;
}

}  // namespace survmix
