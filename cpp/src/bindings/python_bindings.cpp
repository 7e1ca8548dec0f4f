#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "libdsge/errors.hpp"
#include "libdsge/model_compiler.hpp"
#include "libdsge/routine_evaluator.hpp"

#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace py = pybind11;
using namespace libdsge;

namespace {

// (equation, column, entry) triplets of a derivative index, all 0-based.
std::vector<std::tuple<std::size_t, std::size_t, std::size_t>> index_triplets(const DerivativeTensor& tensor) {
    std::vector<std::tuple<std::size_t, std::size_t, std::size_t>> triplets;
    for (Eigen::Index row = 0; row < tensor.index.outerSize(); ++row) {
        for (DerivativeIndex::InnerIterator it(tensor.index, row); it; ++it) {
            triplets.emplace_back(static_cast<std::size_t>(it.row()), static_cast<std::size_t>(it.col()),
                                  static_cast<std::size_t>(it.value() - 1));
        }
    }
    return triplets;
}

}  // namespace

PYBIND11_MODULE(_libdsge, m) {
    m.doc() = "libdsge python bindings";

    py::register_exception<ParseError>(m, "ParseError", PyExc_ValueError);
    py::register_exception<ModelError>(m, "ModelError", PyExc_ValueError);
    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);

    py::enum_<SymbolKind>(m, "SymbolKind")
        .value("Endogenous", SymbolKind::Endogenous)
        .value("Exogenous", SymbolKind::Exogenous)
        .value("SteadyState", SymbolKind::SteadyState)
        .value("Parameter", SymbolKind::Parameter)
        .value("Definition", SymbolKind::Definition)
        .value("RegimeState", SymbolKind::RegimeState)
        .value("ParameterInRegime", SymbolKind::ParameterInRegime)
        .export_values();

    py::enum_<EquationType>(m, "EquationType")
        .value("Structural", EquationType::Structural)
        .value("Definition", EquationType::Definition)
        .value("TimeVaryingProbability", EquationType::TimeVaryingProbability)
        .value("Complementarity", EquationType::Complementarity)
        .value("SteadyState", EquationType::SteadyState)
        .value("SteadyStateAuxiliary", EquationType::SteadyStateAuxiliary)
        .value("PlannerObjective", EquationType::PlannerObjective)
        .value("OsrDerivative", EquationType::OsrDerivative)
        .value("StaticMult", EquationType::StaticMult)
        .export_values();

    py::class_<SymbolId>(m, "SymbolId")
        .def_property_readonly("kind", &SymbolId::kind)
        .def_property_readonly("number", &SymbolId::number)
        .def_property_readonly("regime", &SymbolId::regime)
        .def("__repr__", &SymbolId::render);

    py::class_<CompilerOptions>(m, "CompilerOptions")
        .def(py::init<>())
        .def_static("from_pairs", &CompilerOptions::from_pairs, py::arg("pairs"))
        .def_readwrite("parameter_differentiation", &CompilerOptions::parameter_differentiation)
        .def_readwrite("definitions_inserted", &CompilerOptions::definitions_inserted)
        .def_readwrite("definitions_in_param_differentiation", &CompilerOptions::definitions_in_param_differentiation)
        .def_readwrite("max_deriv_order", &CompilerOptions::max_deriv_order)
        .def_readwrite("add_welfare", &CompilerOptions::add_welfare)
        .def_readwrite("stationary_model", &CompilerOptions::stationary_model);

    py::class_<Routine>(m, "Routine")
        .def_readonly("name", &Routine::name)
        .def_readonly("argins", &Routine::argins)
        .def_readonly("argouts", &Routine::argouts)
        .def_readonly("code", &Routine::code);

    py::class_<SymbolicFunction>(m, "SymbolicFunction")
        .def_readonly("arguments", &SymbolicFunction::arguments)
        .def_readonly("code", &SymbolicFunction::code);

    py::class_<DerivativeEntry>(m, "DerivativeEntry")
        .def_readonly("equation", &DerivativeEntry::equation)
        .def_readonly("wrt", &DerivativeEntry::wrt)
        .def_readonly("code", &DerivativeEntry::code);

    py::class_<DerivativeTensor>(m, "DerivativeTensor")
        .def_readonly("order", &DerivativeTensor::order)
        .def_readonly("entries", &DerivativeTensor::entries)
        .def_property_readonly("shape", [](const DerivativeTensor& t) { return std::make_pair(t.index.rows(), t.index.cols()); })
        .def("index_triplets", &index_triplets);

    py::class_<DerivativeRoutine>(m, "DerivativeRoutine")
        .def_readonly("name", &DerivativeRoutine::name)
        .def_readonly("argins", &DerivativeRoutine::argins)
        .def_readonly("wrt", &DerivativeRoutine::wrt)
        .def_readonly("functions", &DerivativeRoutine::functions)
        .def_readonly("derivatives", &DerivativeRoutine::derivatives);

    py::class_<ModelFunctions>(m, "ModelFunctions")
        .def_readonly("dynamic", &ModelFunctions::dynamic)
        .def_readonly("static_model", &ModelFunctions::static_model)
        .def_readonly("balanced_growth_path", &ModelFunctions::balanced_growth_path);

    py::class_<ModelDerivatives>(m, "ModelDerivatives")
        .def_readonly("dynamic", &ModelDerivatives::dynamic)
        .def_readonly("static_model", &ModelDerivatives::static_model)
        .def_readonly("balanced_growth_path", &ModelDerivatives::balanced_growth_path)
        .def_readonly("parameters", &ModelDerivatives::parameters)
        .def_readonly("planner", &ModelDerivatives::planner)
        .def_readonly("probabilities", &ModelDerivatives::probabilities);

    py::class_<RoutineBundle>(m, "RoutineBundle")
        .def_readonly("definitions", &RoutineBundle::definitions)
        .def_readonly("steady_state_model", &RoutineBundle::steady_state_model)
        .def_readonly("steady_state_auxiliary", &RoutineBundle::steady_state_auxiliary)
        .def_readonly("exogenous_definitions", &RoutineBundle::exogenous_definitions)
        .def_readonly("complementarity", &RoutineBundle::complementarity)
        .def_readonly("functions", &RoutineBundle::functions)
        .def_readonly("derivatives", &RoutineBundle::derivatives)
        .def_readonly("transition_matrix", &RoutineBundle::transition_matrix)
        .def_readonly("planner_objective", &RoutineBundle::planner_objective)
        .def_readonly("planner_loss_commitment_discount", &RoutineBundle::planner_loss_commitment_discount);

    py::class_<ModelFlags>(m, "ModelFlags")
        .def_readonly("is_linear", &ModelFlags::is_linear)
        .def_readonly("is_hybrid", &ModelFlags::is_hybrid)
        .def_readonly("is_purely_forward_looking", &ModelFlags::is_purely_forward_looking)
        .def_readonly("is_purely_backward_looking", &ModelFlags::is_purely_backward_looking)
        .def_readonly("is_endogenous_switching", &ModelFlags::is_endogenous_switching)
        .def_readonly("is_optimal_policy", &ModelFlags::is_optimal_policy)
        .def_readonly("is_param_changed_in_ssmodel", &ModelFlags::is_param_changed_in_ssmodel)
        .def_readonly("is_unique_steady_state", &ModelFlags::is_unique_steady_state)
        .def_readonly("is_imposed_steady_state", &ModelFlags::is_imposed_steady_state)
        .def_readonly("is_initial_guess_steady_state", &ModelFlags::is_initial_guess_steady_state);

    py::class_<Equation>(m, "Equation")
        .def_readonly("original", &Equation::original)
        .def_readonly("shadow", &Equation::shadow)
        .def_readonly("type", &Equation::type)
        .def_readonly("name", &Equation::name)
        .def_readonly("file", &Equation::file)
        .def_readonly("line", &Equation::line);

    py::class_<CompiledModel>(m, "CompiledModel")
        .def_readonly("name", &CompiledModel::name)
        .def_readonly("equations", &CompiledModel::equations)
        .def_readonly("flags", &CompiledModel::flags)
        .def_readonly("routines", &CompiledModel::routines)
        .def_readonly("is_param_changed_in_ssmodel", &CompiledModel::is_param_changed_in_ssmodel)
        .def_property_readonly("endogenous", [](const CompiledModel& c) { return c.symbols.endogenous_names(); })
        .def_property_readonly("exogenous", [](const CompiledModel& c) { return c.symbols.exogenous_names(); })
        .def_property_readonly("parameters", [](const CompiledModel& c) { return c.symbols.parameter_names(); })
        .def_property_readonly("lead_lag_incidence", [](const CompiledModel& c) { return c.after_reordering.lead_lag; })
        .def_property_readonly("regimes", [](const CompiledModel& c) { return c.regimes.states; })
        .def_property_readonly("order_var", [](const CompiledModel& c) { return c.differentiation_list.order_var; })
        .def_property_readonly("wrt", [](const CompiledModel& c) { return c.differentiation_list.wrt; });

    py::class_<ModelCompiler>(m, "ModelCompiler")
        .def(py::init<CompilerOptions>(), py::arg("options") = CompilerOptions{})
        .def("compile",
             py::overload_cast<const std::string&, const std::string&>(&ModelCompiler::compile, py::const_),
             py::arg("text"),
             py::arg("filename"));

    py::class_<RoutineEvaluator>(m, "RoutineEvaluator")
        .def(py::init<>())
        .def("bind", &RoutineEvaluator::bind, py::arg("kind"), py::arg("values"))
        .def("bind_regime_states", &RoutineEvaluator::bind_regime_states, py::arg("current"), py::arg("next"))
        .def("bind_parameters_in_regimes", &RoutineEvaluator::bind_parameters_in_regimes, py::arg("values"))
        .def("evaluate", py::overload_cast<const std::string&>(&RoutineEvaluator::evaluate, py::const_), py::arg("code"))
        .def("execute", &RoutineEvaluator::execute, py::arg("routine"))
        .def("evaluate_functions", &RoutineEvaluator::evaluate_functions, py::arg("routine"))
        .def("evaluate_derivatives",
             [](const RoutineEvaluator& e, const DerivativeRoutine& routine, std::size_t order) {
                 return Eigen::MatrixXd(e.evaluate_derivatives(routine, order));
             },
             py::arg("routine"),
             py::arg("order"))
        .def("transition_matrix", &RoutineEvaluator::transition_matrix, py::arg("routine"), py::arg("regimes"));
}
