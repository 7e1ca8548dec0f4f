#include "libdsge/dictionary_builder.hpp"

#include "libdsge/errors.hpp"
#include "libdsge/function_registry.hpp"
#include "libdsge/lexer.hpp"
#include "libdsge/markov_chains.hpp"

#include <algorithm>

namespace libdsge {

namespace {

void check_reserved(const Declaration& declaration) {
    if (find_block_keyword(declaration.name) || FunctionRegistry::find(declaration.name) ||
        declaration.name == "steady_state" || declaration.name == "mcp" || declaration.name == "coef") {
        throw ParseError("'" + declaration.name + "' is a reserved word", declaration.file, declaration.line);
    }
}

void flag_transition_probability(ParameterSymbol& parameter, const std::vector<MarkovChain>& chains, const Declaration& where) {
    const auto tp = parse_transition_probability_name(parameter.name);
    if (!tp) {
        return;
    }
    auto chain = std::find_if(chains.begin(), chains.end(), [&](const MarkovChain& c) { return c.name == tp->chain; });
    if (chain == chains.end()) {
        throw ParseError("transition probability '" + parameter.name + "' refers to an undeclared markov chain", where.file, where.line);
    }
    if (tp->from == tp->to || tp->from > chain->number_of_states || tp->to > chain->number_of_states) {
        throw ParseError("transition probability '" + parameter.name + "' does not describe a transition of chain '" + chain->name + "'",
                         where.file,
                         where.line);
    }
    parameter.is_trans_prob = true;
}

}  // namespace

std::vector<Declaration> read_declarations(const Block& block) {
    std::vector<Declaration> declarations;
    for (const auto& token : tokenize(block.listing)) {
        switch (token.kind) {
            case TokenKind::Identifier:
                declarations.push_back(Declaration{token.text, {}, token.file, token.line});
                break;
            case TokenKind::String:
                if (declarations.empty() || !declarations.back().tex_name.empty()) {
                    throw ParseError("tex name \"" + token.text + "\" does not follow a symbol name", token.file, token.line);
                }
                declarations.back().tex_name = token.text;
                break;
            default:
                if (!token.is(TokenKind::Punctuation, ",") && !token.is(TokenKind::Punctuation, ";")) {
                    throw ParseError("unexpected '" + token.text + "' in " + block.name + " declarations", token.file, token.line);
                }
        }
    }
    return declarations;
}

SymbolTable build_dictionary(const BlockSet& blocks) {
    SymbolTableBuilder builder;

    auto chains = blocks.markov_chains;
    std::sort(chains.begin(), chains.end(), [](const DeclaredChain& a, const DeclaredChain& b) { return a.name < b.name; });
    for (const auto& chain : chains) {
        builder.add_markov_chain(MarkovChain{chain.name, {}, chain.number_of_states, false});
    }

    for (const auto* block : blocks.all(BlockKind::Endogenous)) {
        for (const auto& d : read_declarations(*block)) {
            check_reserved(d);
            builder.add_endogenous(EndogenousSymbol{d.name, d.tex_name}, d.file, d.line);
        }
    }
    for (const auto* block : blocks.all(BlockKind::Exogenous)) {
        for (const auto& d : read_declarations(*block)) {
            check_reserved(d);
            builder.add_exogenous(ExogenousSymbol{d.name, d.tex_name}, d.file, d.line);
        }
    }

    const auto chain_table = builder.build();
    std::vector<Declaration> parameter_declarations;
    for (const auto* block : blocks.all(BlockKind::Parameters)) {
        std::size_t chain = 0;
        if (!block->trigger.empty()) {
            chain = chain_table.find_chain(block->trigger.front());
        }
        for (const auto& d : read_declarations(*block)) {
            check_reserved(d);
            ParameterSymbol parameter{d.name, d.tex_name, chain};
            flag_transition_probability(parameter, chain_table.markov_chains(), d);
            if (parameter.is_trans_prob && chain != 0) {
                throw ParseError("transition probability '" + d.name + "' cannot be a switching parameter", d.file, d.line);
            }
            builder.add_parameter(std::move(parameter), d.file, d.line);
            parameter_declarations.push_back(d);
        }
    }

    for (const auto* block : blocks.all(BlockKind::LogVars)) {
        for (const auto& d : read_declarations(*block)) {
            builder.declare_log_var(d.name, d.file, d.line);
        }
    }

    const auto variables = builder.build();
    for (const auto* block : blocks.all(BlockKind::Observables)) {
        for (const auto& d : read_declarations(*block)) {
            if (variables.find_endogenous(d.name) == SymbolTable::npos && variables.find_log_var(d.name) == SymbolTable::npos &&
                variables.find_exogenous(d.name) == SymbolTable::npos) {
                throw ParseError("observable '" + d.name + "' is neither an endogenous nor an exogenous variable", d.file, d.line);
            }
            builder.add_observable(ObservableSymbol{d.name, d.tex_name}, d.file, d.line);
        }
    }

    const auto observed = builder.build();
    for (std::size_t i = 0; i < parameter_declarations.size(); ++i) {
        const auto& name = parameter_declarations[i].name;
        if (name.rfind("stderr_", 0) == 0 && observed.find_observable(name.substr(7)) != SymbolTable::npos) {
            builder.parameter(i).is_measurement_error = true;
        }
    }
    return builder.build();
}

ExprPtr substitute_log_vars(const ExprPtr& expr, const SymbolTable& table) {
    return rewrite_references(expr, [&](const Reference& reference, const Expr& node, bool in_steady_state) -> ExprPtr {
        const auto index = table.find_log_var(reference.name);
        if (index == SymbolTable::npos) {
            return nullptr;
        }
        Reference renamed{table.endogenous()[index].name, reference.shift, reference.qualifiers};
        if (in_steady_state) {
            return make_call(MathFunction::Exp, {make_steady_state(std::move(renamed))});
        }
        return make_call(MathFunction::Exp, {make_reference(std::move(renamed), node.file, node.line)});
    });
}

}  // namespace libdsge
