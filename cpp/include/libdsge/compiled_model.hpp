#pragma once

#include "libdsge/derivative_orchestrator.hpp"
#include "libdsge/differentiation_list.hpp"
#include "libdsge/incidence.hpp"
#include "libdsge/markov_chains.hpp"
#include "libdsge/model_types.hpp"
#include "libdsge/parameterization.hpp"
#include "libdsge/planner.hpp"
#include "libdsge/restrictions.hpp"
#include "libdsge/routine.hpp"
#include "libdsge/symbol_table.hpp"

#include <optional>
#include <string>
#include <vector>

namespace libdsge {

struct RoutineBundle {
    Routine definitions;             // def_i=..., parameters only
    Routine steady_state_model;
    Routine steady_state_auxiliary;
    Routine exogenous_definitions;
    Routine complementarity;         // g of each "g>=0" / "g>0" condition
    ModelFunctions functions;
    ModelDerivatives derivatives;
    Routine transition_matrix;
    std::optional<Routine> planner_objective;
    std::optional<Routine> planner_loss_commitment_discount;
};

struct ModelFlags {
    bool is_linear{false};
    bool is_hybrid{false};  // leads and lags both present
    bool is_purely_forward_looking{false};
    bool is_purely_backward_looking{false};
    bool is_endogenous_switching{false};
    bool is_optimal_policy{false};
    bool is_param_changed_in_ssmodel{false};
    bool is_unique_steady_state{false};
    bool is_imposed_steady_state{false};
    bool is_initial_guess_steady_state{false};
};

// Frozen result of one compilation run.
struct CompiledModel {
    std::string name;
    SymbolTable symbols;
    VariableClassification classification;
    std::vector<bool> is_lagrange_multiplier;
    RegimeTable regimes;
    std::vector<Equation> equations;
    std::vector<AuxiliaryLink> auxiliaries;
    Incidence before_reordering;
    Incidence after_reordering;
    DifferentiationList differentiation_list;
    std::vector<ParameterValue> parameterization;
    ParameterRestrictions restrictions;
    std::vector<bool> is_param_changed_in_ssmodel;
    std::optional<PlannerObjective> planner;
    ModelFlags flags;
    RoutineBundle routines;

    // Equations of one type, in model order.
    [[nodiscard]] std::vector<const Equation*> equations_of(EquationType type) const;
};

}  // namespace libdsge
