#include "libdsge/shadow.hpp"

#include "libdsge/errors.hpp"
#include "libdsge/symbol_id.hpp"

#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace libdsge {

namespace {

ExprPtr symbol(const SymbolId& id) {
    return make_reference(Reference{id.render(), 0, {}});
}

}  // namespace

ShadowWriter::ShadowWriter(const SymbolTable& symbols, Eigen::MatrixXi lead_lag, const std::vector<ExprPtr>& definitions)
    : symbols_(symbols), lead_lag_(std::move(lead_lag)) {
    definitions_.reserve(definitions.size());
    for (const auto& expr : definitions) {
        // earlier definitions are already in parameter-only form
        definitions_.push_back(rewrite(expr, ShadowForm::Static, true));
    }
}

const ExprPtr& ShadowWriter::definition(std::size_t index) const {
    if (index >= definitions_.size()) {
        throw std::out_of_range("definition index out of range");
    }
    return definitions_[index];
}

ExprPtr ShadowWriter::endogenous(std::size_t index, int shift, ShadowForm form) const {
    switch (form) {
        case ShadowForm::Static:
            return symbol(SymbolId::endogenous(index + 1));
        case ShadowForm::BalancedGrowthPath: {
            const auto n = symbols_.endogenous().size();
            auto level = symbol(SymbolId::endogenous(index + 1));
            if (shift == 0) {
                return level;
            }
            auto growth = symbol(SymbolId::endogenous(n + index + 1));
            const int steps = std::abs(shift);
            if (symbols_.endogenous()[index].is_log_var) {
                auto scaled = steps == 1 ? growth : make_binary(BinaryOp::Multiply, make_number(steps), growth);
                return make_binary(shift > 0 ? BinaryOp::Add : BinaryOp::Subtract, level, scaled);
            }
            auto powered = steps == 1 ? growth : make_binary(BinaryOp::Power, growth, make_number(steps));
            return make_binary(shift > 0 ? BinaryOp::Multiply : BinaryOp::Divide, level, powered);
        }
        case ShadowForm::Dynamic:
            break;
    }
    const Eigen::Index column = shift > 0 ? 0 : (shift == 0 ? 1 : 2);
    const int number = lead_lag_(static_cast<Eigen::Index>(index), column);
    if (number == 0) {
        throw ModelError("'" + symbols_.endogenous()[index].name + "' appears with a time shift absent from the structural equations");
    }
    return symbol(SymbolId::endogenous(static_cast<std::size_t>(number)));
}

ExprPtr ShadowWriter::rewrite(const ExprPtr& expr, ShadowForm form, bool insert_definitions) const {
    return rewrite_references(expr, [&](const Reference& reference, const Expr&, bool in_steady_state) -> ExprPtr {
        std::size_t index = symbols_.find_endogenous(reference.name);
        if (index != SymbolTable::npos) {
            if (in_steady_state) {
                return symbol(form == ShadowForm::Dynamic ? SymbolId::steady_state(index + 1) : SymbolId::endogenous(index + 1));
            }
            return endogenous(index, reference.shift, form);
        }
        if ((index = symbols_.find_exogenous(reference.name)) != SymbolTable::npos) {
            if (reference.shift != 0) {
                throw ModelError("exogenous variable '" + reference.name + "' cannot carry a time shift here");
            }
            return symbol(SymbolId::exogenous(index + 1));
        }
        if ((index = symbols_.find_parameter(reference.name)) != SymbolTable::npos) {
            return symbol(SymbolId::parameter(index + 1));
        }
        if ((index = symbols_.find_definition(reference.name)) != SymbolTable::npos) {
            if (insert_definitions) {
                return definition(index);
            }
            return symbol(SymbolId::definition(index + 1));
        }
        throw ModelError("unresolved symbol '" + reference.name + "'");
    });
}

std::string ShadowWriter::write(const ExprPtr& expr, ShadowForm form, bool insert_definitions) const {
    return to_string(*rewrite(expr, form, insert_definitions));
}

}  // namespace libdsge
