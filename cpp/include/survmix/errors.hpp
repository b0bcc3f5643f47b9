#pragma once

#include <stdexcept>
#include <string>

namespace survmix {

// Raised by every distribution dispatch that sees a family outside {Weibull, LogNormal}.
class UnsupportedDistribution : public std::invalid_argument {
public:
    explicit UnsupportedDistribution(const std::string& name)
        : std::invalid_argument("Distribution: " + name + " not implemented yet."), name_(name) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

// Raised when predictions are requested from a model that has not been fitted.
class NotFittedError : public std::logic_error {
public:
    explicit NotFittedError(const std::string& operation)
        : std::logic_error("The model has not been fitted yet. Please fit the model using `fit` "
                           "on some training data before calling `" + operation + "`.") {}
};

}  // namespace survmix
