#include "libdsge/model_compiler.hpp"

#include "libdsge/block_extractor.hpp"
#include "libdsge/dictionary_builder.hpp"
#include "libdsge/equation_compiler.hpp"
#include "libdsge/errors.hpp"
#include "libdsge/shadow.hpp"
#include "libdsge/steady_state.hpp"

#include <algorithm>
#include <map>
#include <ostream>
#include <utility>

namespace libdsge {

namespace {

const std::string kMultiplierPrefix = "MULT_";

bool has_trigger(const Block& block, const std::string& item) {
    return std::find(block.trigger.begin(), block.trigger.end(), item) != block.trigger.end();
}

std::vector<ExprPtr> definition_expressions(const ModelEquations& model) {
    std::vector<ExprPtr> definitions;
    for (const auto& equation : model.equations) {
        if (equation.type == EquationType::Definition) {
            definitions.push_back(equation.residual);
        }
    }
    return definitions;
}

void write_shadows(ModelEquations& model, const ShadowWriter& shadow, bool insert_definitions) {
    std::size_t definition = 0;
    for (auto& equation : model.equations) {
        if (equation.type == EquationType::Definition) {
            equation.shadow = to_string(*shadow.definition(definition++));
        } else {
            equation.shadow = shadow.write(equation.residual, ShadowForm::Dynamic, insert_definitions);
        }
    }
}

Routine definitions_routine(const ShadowWriter& shadow) {
    Routine routine{"definitions", {"param"}, {"def"}, {}};
    for (std::size_t i = 0; i < shadow.definition_count(); ++i) {
        routine.code.push_back(SymbolId::definition(i + 1).render() + "=" + to_string(*shadow.definition(i)));
    }
    return routine;
}

Routine complementarity_routine(const ModelEquations& model) {
    Routine routine{"complementarity", input_list(), {"mcp"}, {}};
    for (const auto& equation : model.equations) {
        if (equation.type == EquationType::Complementarity) {
            routine.code.push_back(equation.shadow);
        }
    }
    return routine;
}

// Printed probability of every transition: declared parameters, overridden by
// the equations of endogenous chains.
std::map<std::string, std::string> transition_probabilities(const ModelEquations& model) {
    std::map<std::string, std::string> probabilities;
    const auto& parameters = model.symbols.parameters();
    for (std::size_t p = 0; p < parameters.size(); ++p) {
        if (parameters[p].is_trans_prob) {
            probabilities[parameters[p].name] = SymbolId::parameter(p + 1).render();
        }
    }
    for (const auto& equation : model.equations) {
        if (equation.type == EquationType::TimeVaryingProbability) {
            probabilities[equation.name] = equation.shadow;
        }
    }
    return probabilities;
}

ModelFlags model_flags(const ModelEquations& model,
                       const DifferentiationList& list,
                       const SteadyStateModel& steady_state,
                       bool is_linear,
                       bool has_planner) {
    ModelFlags flags;
    flags.is_linear = is_linear;
    flags.is_hybrid = list.sizes.nf + list.sizes.nb > 0 && list.sizes.np + list.sizes.nb > 0;
    flags.is_purely_forward_looking = !flags.is_hybrid && list.sizes.nf > 0;
    flags.is_purely_backward_looking = !flags.is_hybrid && list.sizes.np > 0;
    const auto& chains = model.symbols.markov_chains();
    flags.is_endogenous_switching =
        std::any_of(chains.begin(), chains.end(), [](const MarkovChain& chain) { return chain.is_endogenous; });
    flags.is_optimal_policy = has_planner;
    flags.is_param_changed_in_ssmodel =
        std::any_of(steady_state.is_param_changed.begin(), steady_state.is_param_changed.end(), [](bool b) { return b; });
    flags.is_unique_steady_state = steady_state.is_unique;
    flags.is_imposed_steady_state = steady_state.is_imposed;
    flags.is_initial_guess_steady_state = steady_state.is_initial_guess;
    return flags;
}

}  // namespace

std::vector<const Equation*> CompiledModel::equations_of(EquationType type) const {
    std::vector<const Equation*> selected;
    for (const auto& equation : equations) {
        if (equation.type == type) {
            selected.push_back(&equation);
        }
    }
    return selected;
}

ModelCompiler::ModelCompiler(CompilerOptions options) : options_(std::move(options)) {
    options_.validate();
}

CompiledModel ModelCompiler::compile(const std::string& text, const std::string& filename) const {
    const auto name = check_model_filename(filename);
    return compile(split_source_lines(text, filename), name);
}

CompiledModel ModelCompiler::compile(const std::vector<SourceLine>& lines, const std::string& name) const {
    const bool inserted = options_.definitions_inserted;
    const auto blocks = extract_blocks(lines);
    const auto dictionary = build_dictionary(blocks);

    const Block* model_block = blocks.find(BlockKind::Model);
    if (model_block == nullptr) {
        throw ModelError("the model file has no model block");
    }
    const bool is_linear = has_trigger(*model_block, "linear");

    std::optional<PlannerObjective> planner;
    if (const Block* block = blocks.find(BlockKind::PlannerObjective)) {
        planner = read_planner_objective(*block);
    }

    auto model = compile_model_equations(capture_equations(*model_block), dictionary, planner, options_.add_welfare);
    const SymbolTable& symbols = model.symbols;
    if (options_.log != nullptr) {
        *options_.log << "[libdsge] " << (name.empty() ? std::string("model") : name) << ": "
                      << symbols.endogenous().size() << " endogenous, " << symbols.exogenous().size() << " exogenous, "
                      << symbols.parameters().size() << " parameters, " << model.equations.size() << " equations\n";
    }

    const ShadowWriter shadow(symbols, model.after_reordering.lead_lag, definition_expressions(model));
    write_shadows(model, shadow, inserted);

    CompiledModel compiled;
    compiled.name = name;
    compiled.regimes = make_regime_table(symbols.markov_chains());
    compiled.classification = classify_variables(model.after_reordering.lead_lag);
    compiled.differentiation_list = solution_topology(model.after_reordering.lead_lag, symbols.exogenous().size());
    for (const auto& symbol : symbols.endogenous()) {
        compiled.is_lagrange_multiplier.push_back(symbol.name.rfind(kMultiplierPrefix, 0) == 0);
    }

    auto steady_state = compile_steady_state_model(blocks.find(BlockKind::SteadyStateModel), symbols, shadow, inserted);

    auto& routines = compiled.routines;
    routines.definitions = definitions_routine(shadow);
    routines.steady_state_auxiliary = steady_state_auxiliary_routine(model.auxiliaries, symbols);
    routines.exogenous_definitions =
        exogenous_definitions_routine(blocks.find(BlockKind::ExogenousDefinitions), symbols, shadow, inserted);
    routines.complementarity = complementarity_routine(model);
    routines.functions = model_functions(model, shadow, inserted);
    routines.transition_matrix =
        transition_matrix_routine(symbols.markov_chains(), compiled.regimes, transition_probabilities(model));
    routines.derivatives = differentiate_model(model, shadow, compiled.differentiation_list, planner, is_linear, options_);
    if (planner) {
        const auto loss = planner_loss_code(*planner, symbols, shadow, inserted);
        routines.planner_objective = Routine{"planner_objective", input_list(), {"loss"}, {loss}};
        routines.planner_loss_commitment_discount =
            Routine{"planner_loss_commitment_discount",
                    input_list(),
                    {"loss", "commitment", "discount"},
                    {loss,
                     shadow.write(planner->commitment, ShadowForm::Static, inserted),
                     shadow.write(planner->discount, ShadowForm::Static, inserted)}};
    }

    if (const Block* block = blocks.find(BlockKind::Parameterization)) {
        compiled.parameterization = read_parameterization(*block, symbols);
    }
    if (const Block* block = blocks.find(BlockKind::ParameterRestrictions)) {
        compiled.restrictions = compile_parameter_restrictions(*block, make_restriction_context(symbols, compiled.regimes));
    }

    compiled.flags = model_flags(model, compiled.differentiation_list, steady_state, is_linear, planner.has_value());
    compiled.is_param_changed_in_ssmodel = steady_state.is_param_changed;
    routines.steady_state_model = std::move(steady_state.routine);

    compiled.symbols = std::move(model.symbols);
    compiled.equations = std::move(model.equations);
    compiled.auxiliaries = std::move(model.auxiliaries);
    compiled.before_reordering = std::move(model.before_reordering);
    compiled.after_reordering = std::move(model.after_reordering);
    compiled.planner = std::move(planner);
    return compiled;
}

}  // namespace libdsge
