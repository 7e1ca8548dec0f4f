#pragma once

#include "libdsge/expression.hpp"
#include "libdsge/symbol_table.hpp"

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace libdsge {

enum class ShadowForm {
    Dynamic,           // y_<lead-lag number>, ss_i for steady_state()
    Static,            // every shift of variable i is y_i
    BalancedGrowthPath // levels y_1..y_n, growth rates y_{n+1}..y_{2n}
};

// Rewrites resolved equations over the evaluation vocabulary. Definitions
// print as def_i, or are replaced by their parameter-only expression when
// inserted.
class ShadowWriter {
public:
    // definitions holds the right-hand sides of the definition equations in
    // declaration order.
    ShadowWriter(const SymbolTable& symbols, Eigen::MatrixXi lead_lag, const std::vector<ExprPtr>& definitions);

    [[nodiscard]] ExprPtr rewrite(const ExprPtr& expr, ShadowForm form, bool insert_definitions) const;

    [[nodiscard]] std::string write(const ExprPtr& expr, ShadowForm form, bool insert_definitions) const;

    // Definition i expressed in parameters only.
    [[nodiscard]] const ExprPtr& definition(std::size_t index) const;

    [[nodiscard]] std::size_t definition_count() const noexcept { return definitions_.size(); }

private:
    ExprPtr endogenous(std::size_t index, int shift, ShadowForm form) const;

    const SymbolTable& symbols_;
    Eigen::MatrixXi lead_lag_;
    std::vector<ExprPtr> definitions_;
};

}  // namespace libdsge
