#pragma once

#include "libdsge/block_extractor.hpp"
#include "libdsge/incidence.hpp"
#include "libdsge/model_types.hpp"
#include "libdsge/planner.hpp"
#include "libdsge/symbol_table.hpp"

#include <optional>
#include <string>
#include <vector>

namespace libdsge {

// Splits a block listing into ';'-terminated statements:
//   lhs = rhs;   expr;   # name = expr;   mcp lhs >= rhs;
[[nodiscard]] std::vector<CapturedEquation> capture_equations(const Block& block);

// Steady state of an auxiliary variable: the steady state of its source.
struct AuxiliaryLink {
    std::string auxiliary;
    std::string source;
    bool source_is_exogenous{false};
};

struct ModelEquations {
    SymbolTable symbols;  // endogenous in alphabetical order
    std::vector<Equation> equations;
    std::vector<AuxiliaryLink> auxiliaries;
    Incidence before_reordering;
    Incidence after_reordering;
};

// Types, validates and resolves the model block: registers definitions,
// creates auxiliary variables for shifts beyond one period, injects the
// welfare equations, builds the incidence and reorders the endogenous
// variables alphabetically. Shadow text is left empty.
[[nodiscard]] ModelEquations compile_model_equations(const std::vector<CapturedEquation>& captured,
                                                     const SymbolTable& symbols,
                                                     const std::optional<PlannerObjective>& planner,
                                                     bool add_welfare);

}  // namespace libdsge
