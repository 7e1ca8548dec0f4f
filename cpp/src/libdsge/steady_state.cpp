#include "libdsge/steady_state.hpp"

#include "libdsge/dictionary_builder.hpp"
#include "libdsge/errors.hpp"

#include <algorithm>

namespace libdsge {

namespace {

const Reference& assigned_reference(const CapturedEquation& equation, const std::string& block) {
    const auto* reference = equation.type == EquationType::Structural && equation.rhs ? std::get_if<Reference>(&equation.lhs->node)
                                                                                      : nullptr;
    if (reference == nullptr || reference->shift != 0 || !reference->qualifiers.empty()) {
        throw ParseError(block + " expects assignments of the form name = expression;", equation.file, equation.line);
    }
    return *reference;
}

void check_references(const ExprPtr& expr, const SymbolTable& symbols, const CapturedEquation& equation, std::size_t position) {
    for_each_reference(*expr, [&](const Reference& reference, const Expr&, bool) {
        if (!symbols.family(reference.name)) {
            throw ParseError("unknown symbol '" + reference.name + "' in equation (" + std::to_string(position + 1) + ")",
                             equation.file,
                             equation.line);
        }
        if (reference.shift != 0) {
            throw ModelError("steady state equations cannot contain leads or lags", position);
        }
    });
}

}  // namespace

SteadyStateModel compile_steady_state_model(const Block* block,
                                            const SymbolTable& symbols,
                                            const ShadowWriter& shadow,
                                            bool insert_definitions) {
    SteadyStateModel model;
    model.routine = Routine{"steady_state_model", input_list(), {"y", "param"}, {}};
    model.is_param_changed.assign(symbols.parameters().size(), false);
    if (block == nullptr) {
        return model;
    }
    const auto& trigger = block->trigger;
    model.is_unique = std::find(trigger.begin(), trigger.end(), "unique") != trigger.end();
    model.is_imposed = std::find(trigger.begin(), trigger.end(), "imposed") != trigger.end();
    model.is_initial_guess = std::find(trigger.begin(), trigger.end(), "initial_guess") != trigger.end();

    const auto captured = capture_equations(*block);
    for (std::size_t i = 0; i < captured.size(); ++i) {
        const auto& equation = captured[i];
        const auto& target = assigned_reference(equation, "steady_state_model");
        auto rhs = substitute_log_vars(equation.rhs, symbols);
        check_references(rhs, symbols, equation, i);

        std::string lhs;
        if (auto index = symbols.find_endogenous(target.name); index != SymbolTable::npos) {
            lhs = SymbolId::endogenous(index + 1).render();
        } else if (index = symbols.find_log_var(target.name); index != SymbolTable::npos) {
            lhs = SymbolId::endogenous(index + 1).render();
            rhs = make_call(MathFunction::Log, {rhs});
        } else if (index = symbols.find_parameter(target.name); index != SymbolTable::npos) {
            lhs = SymbolId::parameter(index + 1).render();
            model.is_param_changed[index] = true;
        } else {
            throw ParseError("'" + target.name + "' is neither an endogenous variable nor a parameter", equation.file, equation.line);
        }
        model.routine.code.push_back(lhs + "=" + shadow.write(rhs, ShadowForm::Static, insert_definitions));
    }
    return model;
}

Routine steady_state_auxiliary_routine(const std::vector<AuxiliaryLink>& links, const SymbolTable& symbols) {
    Routine routine{"steady_state_auxiliary_eqtns", input_list(), {"y"}, {}};
    for (const auto& link : links) {
        const auto target = symbols.find_endogenous(link.auxiliary);
        const auto source = link.source_is_exogenous ? symbols.find_exogenous(link.source) : symbols.find_endogenous(link.source);
        if (target == SymbolTable::npos || source == SymbolTable::npos) {
            throw std::invalid_argument("auxiliary variable " + link.auxiliary + " is not registered");
        }
        const auto source_id = link.source_is_exogenous ? SymbolId::exogenous(source + 1) : SymbolId::endogenous(source + 1);
        routine.code.push_back(SymbolId::endogenous(target + 1).render() + "=" + source_id.render());
    }
    return routine;
}

Routine exogenous_definitions_routine(const Block* block,
                                      const SymbolTable& symbols,
                                      const ShadowWriter& shadow,
                                      bool insert_definitions) {
    Routine routine{"exogenous_definitions", input_list(), {"x"}, {}};
    if (block == nullptr) {
        return routine;
    }
    const auto captured = capture_equations(*block);
    for (std::size_t i = 0; i < captured.size(); ++i) {
        const auto& equation = captured[i];
        const auto& target = assigned_reference(equation, "exogenous_definitions");
        const auto index = symbols.find_exogenous(target.name);
        if (index == SymbolTable::npos) {
            throw ParseError("'" + target.name + "' is not an exogenous variable", equation.file, equation.line);
        }
        check_references(equation.rhs, symbols, equation, i);
        for_each_reference(*equation.rhs, [&](const Reference& reference, const Expr&, bool) {
            if (symbols.family(reference.name) == SymbolFamily::Endogenous) {
                throw ModelError("exogenous definitions cannot use the endogenous variable '" + reference.name + "'", i);
            }
        });
        routine.code.push_back(SymbolId::exogenous(index + 1).render() + "=" +
                               shadow.write(equation.rhs, ShadowForm::Static, insert_definitions));
    }
    return routine;
}

}  // namespace libdsge
