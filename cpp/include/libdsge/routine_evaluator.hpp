#pragma once

#include "libdsge/expression.hpp"
#include "libdsge/routine.hpp"
#include "libdsge/symbol_id.hpp"

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <cstddef>
#include <map>
#include <string>

namespace libdsge {

// Numeric evaluation of printed code with vectors bound to the vocabulary:
// y, x, ss, param, def, the regime states s0 and s1 and the parameter by
// regime matrix M. Comparisons evaluate to 1 or 0.
class RoutineEvaluator {
public:
    RoutineEvaluator() = default;

    void bind(SymbolKind kind, Eigen::VectorXd values);

    void bind_regime_states(int current, int next);

    void bind_parameters_in_regimes(Eigen::MatrixXd values);

    [[nodiscard]] double value(const SymbolId& symbol) const;

    [[nodiscard]] double evaluate(const Expr& expr) const;

    [[nodiscard]] double evaluate(const std::string& code) const;

    // Runs the "target=expr" lines of a routine in order. Targets in the
    // vocabulary update the bound vectors (growing them when needed); any
    // other target is kept as a named scratch value.
    void execute(const Routine& routine);

    [[nodiscard]] double scratch(const std::string& name) const;

    // One value per equation.
    [[nodiscard]] Eigen::VectorXd evaluate_functions(const DerivativeRoutine& routine) const;

    // equations x wrt.size()^order, filled at the stored non-decreasing tuples.
    [[nodiscard]] Eigen::SparseMatrix<double> evaluate_derivatives(const DerivativeRoutine& routine, std::size_t order) const;

    // Executes a transition_matrix routine on a copy of this evaluator.
    [[nodiscard]] Eigen::MatrixXd transition_matrix(const Routine& routine, std::size_t regimes) const;

private:
    std::map<SymbolKind, Eigen::VectorXd> vectors_;
    Eigen::MatrixXd parameters_in_regimes_;
    int current_regime_{1};
    int next_regime_{1};
    std::map<std::string, double> scratch_;
};

}  // namespace libdsge
