#pragma once

#include "libdsge/compiler_options.hpp"
#include "libdsge/differentiation_list.hpp"
#include "libdsge/equation_compiler.hpp"
#include "libdsge/planner.hpp"
#include "libdsge/routine.hpp"
#include "libdsge/shadow.hpp"

#include <optional>
#include <string>
#include <vector>

namespace libdsge {

// Printed model variants before differentiation.
struct ModelFunctions {
    Routine dynamic;
    Routine static_model;
    Routine balanced_growth_path;
};

struct ModelDerivatives {
    DerivativeRoutine dynamic;
    DerivativeRoutine static_model;
    std::optional<DerivativeRoutine> balanced_growth_path;  // absent for stationary models
    std::optional<DerivativeRoutine> parameters;            // with parameter_differentiation
    std::optional<DerivativeRoutine> planner;               // with a planner objective
    std::optional<DerivativeRoutine> probabilities;         // with an endogenous markov chain
};

// Structural equations in the dynamic, static and balanced growth path forms.
[[nodiscard]] ModelFunctions model_functions(const ModelEquations& model, const ShadowWriter& shadow, bool insert_definitions);

// Runs every derivative variant the options ask for. The dynamic model is
// differentiated to max_deriv_order, or to order 1 when the model is linear.
// Time-varying transition probabilities are differentiated against the
// dynamic wrt list whenever a markov chain is endogenous.
[[nodiscard]] ModelDerivatives differentiate_model(const ModelEquations& model,
                                                   const ShadowWriter& shadow,
                                                   const DifferentiationList& list,
                                                   const std::optional<PlannerObjective>& planner,
                                                   bool is_linear,
                                                   const CompilerOptions& options);

// Dynamic form of the planner loss, with log variables substituted.
[[nodiscard]] std::string planner_loss_code(const PlannerObjective& planner,
                                            const SymbolTable& symbols,
                                            const ShadowWriter& shadow,
                                            bool insert_definitions);

}  // namespace libdsge
