#include "survmix/mixture_parameters.hpp"

namespace survmix {

MixtureParameters zeros_like(const MixtureParameters& parameters) {
    MixtureParameters zeros;
    zeros.shape = Eigen::MatrixXd::Zero(parameters.shape.rows(), parameters.shape.cols());
    zeros.scale = Eigen::MatrixXd::Zero(parameters.scale.rows(), parameters.scale.cols());
    zeros.logits = Eigen::MatrixXd::Zero(parameters.logits.rows(), parameters.logits.cols());
    return zeros;
}

EventPartition partition_by_event(const Eigen::VectorXd& events) {
    EventPartition partition;
    for (Eigen::Index i = 0; i < events.size(); ++i) {
        if (events(i) != 0.0) {
            partition.uncensored.push_back(i);
        } else {
            partition.censored.push_back(i);
        }
    }
    return partition;
}

}  // namespace survmix
