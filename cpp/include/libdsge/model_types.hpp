#pragma once

#include "libdsge/expression.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace libdsge {

enum class TimeShift {
    Lead,
    Current,
    Lag
};

enum class EquationType {
    Structural,
    Definition,
    TimeVaryingProbability,
    Complementarity,
    SteadyState,
    SteadyStateAuxiliary,
    PlannerObjective,
    OsrDerivative,
    StaticMult
};

struct EndogenousSymbol {
    std::string name;
    std::string tex_name;
    bool is_log_var{false};
    bool is_auxiliary{false};
    bool is_original{true};
    bool is_affect_trans_probs{false};
};

struct ExogenousSymbol {
    std::string name;
    std::string tex_name;
    bool is_observed{false};
    bool is_in_use{false};
};

struct ParameterSymbol {
    std::string name;
    std::string tex_name;
    std::size_t governing_chain{0};  // 0 is the constant chain
    bool is_switching{false};
    bool is_trans_prob{false};
    bool is_measurement_error{false};
    bool is_in_use{false};
};

enum class ObservableSource {
    Endogenous,
    Exogenous
};

struct ObservableSymbol {
    std::string name;
    std::string tex_name;
    ObservableSource source{ObservableSource::Endogenous};
    std::size_t source_index{0};
    std::string file;  // declaration site
    std::size_t line{0};
};

struct MarkovChain {
    std::string name;
    std::vector<std::string> parameters;
    std::size_t number_of_states{1};
    bool is_endogenous{false};
};

struct Occurrence {
    std::size_t endogenous;
    int shift;
};

// Equation as written in a model block, before shadowization.
struct CapturedEquation {
    EquationType type{EquationType::Structural};
    ExprPtr lhs;
    ExprPtr rhs;                    // null for "expr;" statements
    std::optional<BinaryOp> relation;  // complementarity sense
    std::string name;               // defined symbol for definitions and tvp
    std::string original;
    std::string file;
    std::size_t line{0};
};

// Compiled equation. residual is lhs-(rhs) over resolved names; for
// definitions and time-varying probabilities it is the defining right-hand
// side, for complementarity conditions the g of "g>=0" or "g>0".
struct Equation {
    std::string original;
    std::string shadow;
    EquationType type{EquationType::Structural};
    ExprPtr residual;
    std::string name;
    std::optional<BinaryOp> relation;
    std::vector<Occurrence> occurrences;
    std::string file;
    std::size_t line{0};
};

}  // namespace libdsge
