#pragma once

#include "libdsge/block_extractor.hpp"
#include "libdsge/equation_compiler.hpp"
#include "libdsge/routine.hpp"
#include "libdsge/shadow.hpp"
#include "libdsge/symbol_table.hpp"

#include <vector>

namespace libdsge {

struct SteadyStateModel {
    Routine routine;
    bool is_unique{false};
    bool is_imposed{false};
    bool is_initial_guess{false};
    std::vector<bool> is_param_changed;  // one flag per parameter
};

// Assignments "y_i=..." and "param_i=..." of a steady_state_model block. An
// assignment to the original name of a log variable stores its logarithm.
// block may be null.
[[nodiscard]] SteadyStateModel compile_steady_state_model(const Block* block,
                                                          const SymbolTable& symbols,
                                                          const ShadowWriter& shadow,
                                                          bool insert_definitions);

// "y_aux=y_source" (or "=x_source") for every auxiliary variable.
[[nodiscard]] Routine steady_state_auxiliary_routine(const std::vector<AuxiliaryLink>& links, const SymbolTable& symbols);

// "x_i=..." assignments of an exogenous_definitions block; block may be null.
[[nodiscard]] Routine exogenous_definitions_routine(const Block* block,
                                                    const SymbolTable& symbols,
                                                    const ShadowWriter& shadow,
                                                    bool insert_definitions);

}  // namespace libdsge
