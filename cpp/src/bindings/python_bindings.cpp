#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "survmix/cdf_evaluator.hpp"
#include "survmix/deep_survival_machines.hpp"
#include "survmix/errors.hpp"
#include "survmix/survival_machine.hpp"
#include "survmix/survival_objective.hpp"

namespace py = pybind11;
using namespace survmix;

PYBIND11_MODULE(_survmix, m) {
    m.doc() = "survmix python bindings";

    py::register_exception<UnsupportedDistribution>(m, "UnsupportedDistribution", PyExc_ValueError);
    py::register_exception<NotFittedError>(m, "NotFittedError", PyExc_RuntimeError);

    py::enum_<DistributionFamily>(m, "DistributionFamily")
        .value("Weibull", DistributionFamily::Weibull)
        .value("LogNormal", DistributionFamily::LogNormal)
        .export_values();

    py::class_<ModelOptions>(m, "ModelOptions")
        .def(py::init<>())
        .def_readwrite("k", &ModelOptions::k)
        .def_readwrite("layers", &ModelOptions::layers)
        .def_readwrite("distribution", &ModelOptions::distribution)
        .def_readwrite("temperature", &ModelOptions::temperature)
        .def_readwrite("discount", &ModelOptions::discount)
        .def_readwrite("seed", &ModelOptions::seed);

    py::class_<FitOptions>(m, "FitOptions")
        .def(py::init<>())
        .def_readwrite("validation_fraction", &FitOptions::validation_fraction)
        .def_readwrite("iterations", &FitOptions::iterations)
        .def_readwrite("learning_rate", &FitOptions::learning_rate)
        .def_readwrite("batch_size", &FitOptions::batch_size)
        .def_readwrite("elbo", &FitOptions::elbo)
        .def_readwrite("optimizer", &FitOptions::optimizer)
        .def_readwrite("random_state", &FitOptions::random_state)
        .def_readwrite("verbose", &FitOptions::verbose);

    py::class_<OptimizationResult>(m, "OptimizationResult")
        .def(py::init<>())
        .def_readwrite("parameters", &OptimizationResult::parameters)
        .def_readwrite("objective_value", &OptimizationResult::objective_value)
        .def_readwrite("gradient_norm", &OptimizationResult::gradient_norm)
        .def_readwrite("iterations", &OptimizationResult::iterations)
        .def_readwrite("converged", &OptimizationResult::converged);

    py::class_<TrainingResult>(m, "TrainingResult")
        .def(py::init<>())
        .def_readwrite("epochs_run", &TrainingResult::epochs_run)
        .def_readwrite("validation_losses", &TrainingResult::validation_losses)
        .def_readwrite("best_epoch", &TrainingResult::best_epoch)
        .def_readwrite("prior_result", &TrainingResult::prior_result);

    py::class_<SurvivalMachine>(m, "SurvivalMachine")
        .def(py::init<Eigen::Index, const ModelOptions&>(), py::arg("input_dim"), py::arg("options") = ModelOptions{})
        .def_property_readonly("k", &SurvivalMachine::k)
        .def_property_readonly("dist", [](const SurvivalMachine& model) { return distribution_name(model.family()); })
        .def_property_readonly("discount", &SurvivalMachine::discount);

    py::class_<DeepSurvivalMachines>(m, "DeepSurvivalMachines")
        .def(py::init<>())
        .def(py::init<ModelOptions>(), py::arg("options"))
        .def("fit", &DeepSurvivalMachines::fit,
             py::arg("x"), py::arg("t"), py::arg("e"), py::arg("options") = FitOptions{})
        .def("predict_survival", &DeepSurvivalMachines::predict_survival, py::arg("x"), py::arg("t"))
        .def("predict_risk", &DeepSurvivalMachines::predict_risk, py::arg("x"), py::arg("t"))
        .def_property_readonly("fitted", &DeepSurvivalMachines::is_fitted)
        .def("model", &DeepSurvivalMachines::model, py::return_value_policy::reference_internal)
        .def("__repr__", &DeepSurvivalMachines::describe);

    m.def("unconditional_loss", &unconditional_loss, py::arg("model"), py::arg("t"), py::arg("e"));
    m.def("conditional_loss", &conditional_loss,
          py::arg("model"), py::arg("x"), py::arg("t"), py::arg("e"), py::arg("elbo") = true);
    m.def("predict_cdf", &predict_cdf, py::arg("model"), py::arg("x"), py::arg("t_horizon"));
    m.def("predict_log_survival", &predict_log_survival, py::arg("model"), py::arg("x"), py::arg("t_horizon"));
}
