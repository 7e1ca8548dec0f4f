#include "libdsge/equation_compiler.hpp"

#include "libdsge/dictionary_builder.hpp"
#include "libdsge/errors.hpp"
#include "libdsge/lexer.hpp"
#include "libdsge/markov_chains.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace libdsge {

namespace {

const std::string kWelfare = "WELF";
const std::string kUtility = "UTIL";

std::string auxiliary_name(const std::string& prefix, const std::string& variable, std::size_t k) {
    return prefix + variable + "_" + std::to_string(k);
}

ExprPtr reference_to(const std::string& name, int shift = 0) {
    return make_reference(Reference{name, shift, {}});
}

bool is_zero_literal(const ExprPtr& expr) {
    const auto* number = std::get_if<NumberLiteral>(&expr->node);
    return number != nullptr && number->value == 0.0;
}

ExprPtr difference(const ExprPtr& lhs, const ExprPtr& rhs) {
    if (!rhs || is_zero_literal(rhs)) {
        return lhs;
    }
    return make_binary(BinaryOp::Subtract, lhs, rhs);
}

CapturedEquation capture_statement(const std::vector<Token>& tokens, std::size_t begin, std::size_t end) {
    CapturedEquation captured;
    captured.file = tokens[begin].file;
    captured.line = tokens[begin].line;

    ExpressionParser parser(tokens, begin, end);
    std::string op = "=";
    if (parser.accept(TokenKind::Punctuation, "#")) {
        const Token& name = parser.advance();
        if (name.kind != TokenKind::Identifier) {
            throw ParseError("definition expects a name", name.file, name.line);
        }
        parser.expect(TokenKind::Operator, "=");
        captured.type = EquationType::Definition;
        captured.name = name.text;
        captured.lhs = make_reference(Reference{name.text, 0, {}}, name.file, name.line);
        captured.rhs = parser.parse_arithmetic();
    } else if (tokens[begin].is(TokenKind::Identifier, "mcp")) {
        parser.advance();
        captured.type = EquationType::Complementarity;
        captured.lhs = parser.parse_arithmetic();
        const Token& relation = parser.advance();
        op = relation.text;
        if (op == ">=") {
            captured.relation = BinaryOp::GreaterEqual;
        } else if (op == ">") {
            captured.relation = BinaryOp::Greater;
        } else if (op == "<=") {
            captured.relation = BinaryOp::LessEqual;
        } else if (op == "<") {
            captured.relation = BinaryOp::Less;
        } else {
            throw ParseError("complementarity condition expects one of >=, >, <=, <", relation.file, relation.line);
        }
        captured.rhs = parser.parse_arithmetic();
    } else {
        captured.lhs = parser.parse_arithmetic();
        if (parser.accept(TokenKind::Operator, "=")) {
            captured.rhs = parser.parse_arithmetic();
        }
    }
    if (!parser.at_end()) {
        parser.fail("unexpected token '" + parser.peek().text + "'");
    }

    captured.original = captured.type == EquationType::Definition ? "#" : (captured.type == EquationType::Complementarity ? "mcp " : "");
    captured.original += to_string(*captured.lhs);
    if (captured.rhs) {
        captured.original += op + to_string(*captured.rhs);
    }
    return captured;
}

// Name of the transition probability defined by the equation, if any.
std::optional<TransitionProbabilityName> defined_probability(const CapturedEquation& captured, const SymbolTable& symbols) {
    if (captured.type != EquationType::Structural || !captured.rhs) {
        return std::nullopt;
    }
    const auto* reference = std::get_if<Reference>(&captured.lhs->node);
    if (reference == nullptr || reference->shift != 0 || !reference->qualifiers.empty()) {
        return std::nullopt;
    }
    auto tp = parse_transition_probability_name(reference->name);
    if (!tp || symbols.find_chain(tp->chain) == SymbolTable::npos) {
        return std::nullopt;
    }
    return tp;
}

class ModelBlockCompiler {
public:
    ModelBlockCompiler(const SymbolTable& symbols, const std::optional<PlannerObjective>& planner, bool add_welfare)
        : builder_(symbols), planner_(planner), add_welfare_(add_welfare) {}

    ModelEquations run(const std::vector<CapturedEquation>& captured);

private:
    void classify(const std::vector<CapturedEquation>& captured);
    void inject_welfare();
    void validate(std::size_t position);
    ExprPtr create_auxiliaries(const ExprPtr& residual);
    void append_auxiliary_equations();
    void record_occurrences(Equation& equation) const;

    SymbolTableBuilder builder_;
    SymbolTable current_;
    const std::optional<PlannerObjective>& planner_;
    bool add_welfare_;
    std::vector<Equation> equations_;
    std::map<std::string, std::size_t> lead_auxiliaries_;
    std::map<std::string, std::size_t> lag_auxiliaries_;
    std::map<std::string, std::size_t> exogenous_lag_auxiliaries_;
    std::vector<AuxiliaryLink> links_;
};

void ModelBlockCompiler::classify(const std::vector<CapturedEquation>& captured) {
    const auto declared = builder_.build();
    std::set<std::string> probabilities;
    for (const auto& item : captured) {
        Equation equation;
        equation.original = item.original;
        equation.type = item.type;
        equation.name = item.name;
        equation.relation = item.relation;
        equation.file = item.file;
        equation.line = item.line;

        switch (item.type) {
            case EquationType::Definition:
                builder_.add_definition(item.name, item.file, item.line);
                equation.residual = item.rhs;
                break;
            case EquationType::Complementarity:
                if (*item.relation == BinaryOp::GreaterEqual || *item.relation == BinaryOp::Greater) {
                    equation.residual = difference(item.lhs, item.rhs);
                } else {
                    equation.residual = difference(item.rhs, item.lhs);
                }
                break;
            default:
                if (auto tp = defined_probability(item, declared)) {
                    const auto chain = declared.find_chain(tp->chain);
                    const auto& name = std::get<Reference>(item.lhs->node).name;
                    if (tp->from == tp->to || tp->from > declared.markov_chains()[chain].number_of_states ||
                        tp->to > declared.markov_chains()[chain].number_of_states) {
                        throw ModelError("'" + name + "' does not describe a transition of chain '" + tp->chain + "'", equations_.size());
                    }
                    if (!probabilities.insert(name).second) {
                        throw ModelError("transition probability '" + name + "' is defined twice", equations_.size());
                    }
                    builder_.markov_chain(chain).is_endogenous = true;
                    equation.type = EquationType::TimeVaryingProbability;
                    equation.name = name;
                    equation.residual = item.rhs;
                } else {
                    equation.residual = difference(item.lhs, item.rhs);
                }
        }
        equations_.push_back(std::move(equation));
    }
}

void ModelBlockCompiler::inject_welfare() {
    if (!add_welfare_) {
        return;
    }
    if (!planner_) {
        throw ModelError("add_welfare requires a planner_objective block");
    }
    builder_.add_endogenous(EndogenousSymbol{kUtility, kUtility, false, true, false}, planner_->file, planner_->line);
    builder_.add_endogenous(EndogenousSymbol{kWelfare, kWelfare, false, true, false}, planner_->file, planner_->line);

    Equation utility;
    utility.residual = difference(reference_to(kUtility), planner_->loss);
    utility.original = kUtility + "=" + to_string(*planner_->loss);
    utility.file = planner_->file;
    utility.line = planner_->line;

    auto discounted = make_binary(BinaryOp::Add,
                                  make_binary(BinaryOp::Multiply,
                                              make_binary(BinaryOp::Subtract, make_number(1.0), planner_->discount),
                                              reference_to(kUtility)),
                                  make_binary(BinaryOp::Multiply, planner_->discount, reference_to(kWelfare, 1)));
    Equation welfare;
    welfare.residual = difference(reference_to(kWelfare), discounted);
    welfare.original = kWelfare + "=" + to_string(*discounted);
    welfare.file = planner_->file;
    welfare.line = planner_->line;

    equations_.push_back(std::move(utility));
    equations_.push_back(std::move(welfare));
}

void ModelBlockCompiler::validate(std::size_t position) {
    auto& equation = equations_[position];
    const auto own_definition = equation.type == EquationType::Definition ? current_.find_definition(equation.name) : SymbolTable::npos;

    for_each_reference(*equation.residual, [&](const Reference& reference, const Expr& node, bool in_steady_state) {
        const auto family = current_.family(reference.name);
        if (!family) {
            throw ParseError("unknown symbol '" + reference.name + "' in equation (" + std::to_string(position + 1) + ")",
                             node.file.empty() ? equation.file : node.file,
                             node.line == 0 ? equation.line : node.line);
        }
        if (!reference.qualifiers.empty()) {
            throw ParseError("unexpected qualifiers on '" + reference.name + "'", equation.file, equation.line);
        }
        if (in_steady_state && *family != SymbolFamily::Endogenous) {
            throw ParseError("steady_state expects an endogenous variable, got '" + reference.name + "'", equation.file, equation.line);
        }
        const bool is_variable = *family == SymbolFamily::Endogenous || *family == SymbolFamily::Exogenous;
        if (!is_variable && reference.shift != 0) {
            throw ParseError("'" + reference.name + "' cannot carry a time shift", equation.file, equation.line);
        }
        switch (equation.type) {
            case EquationType::Definition:
                if (is_variable) {
                    throw ModelError("detected to be a definition cannot contain variables", position);
                }
                if (*family == SymbolFamily::Definition && current_.find_definition(reference.name) >= own_definition) {
                    throw ModelError("definition '" + equation.name + "' uses '" + reference.name + "' before it is defined", position);
                }
                break;
            case EquationType::TimeVaryingProbability:
                if (is_variable && reference.shift != 0) {
                    throw ModelError("detected to describe endogenous switching cannot contain leads or lags", position);
                }
                break;
            default:
                break;
        }
        if (*family == SymbolFamily::Exogenous && reference.shift > 0) {
            throw ModelError("exogenous variable '" + reference.name + "' cannot appear with a lead", position);
        }
    });
}

ExprPtr ModelBlockCompiler::create_auxiliaries(const ExprPtr& residual) {
    return rewrite_references(residual, [&](const Reference& reference, const Expr& node, bool in_steady_state) -> ExprPtr {
        if (in_steady_state) {
            return nullptr;
        }
        const auto family = current_.family(reference.name);
        if (*family == SymbolFamily::Endogenous) {
            if (reference.shift > 1) {
                const auto k = static_cast<std::size_t>(reference.shift - 1);
                auto& count = lead_auxiliaries_[reference.name];
                count = std::max(count, k);
                return make_reference(Reference{auxiliary_name("AUX_F_", reference.name, k), 1, {}}, node.file, node.line);
            }
            if (reference.shift < -1) {
                const auto k = static_cast<std::size_t>(-reference.shift - 1);
                auto& count = lag_auxiliaries_[reference.name];
                count = std::max(count, k);
                return make_reference(Reference{auxiliary_name("AUX_L_", reference.name, k), -1, {}}, node.file, node.line);
            }
        } else if (*family == SymbolFamily::Exogenous && reference.shift < 0) {
            const auto k = static_cast<std::size_t>(-reference.shift);
            auto& count = exogenous_lag_auxiliaries_[reference.name];
            count = std::max(count, k);
            return make_reference(Reference{auxiliary_name("AUX_L_", reference.name, k), -1, {}}, node.file, node.line);
        }
        return nullptr;
    });
}

void ModelBlockCompiler::append_auxiliary_equations() {
    auto add_chain = [&](const std::string& variable, std::size_t count, const char* prefix, int shift, bool exogenous) {
        for (std::size_t k = 1; k <= count; ++k) {
            const std::string name = auxiliary_name(prefix, variable, k);
            builder_.add_endogenous(EndogenousSymbol{name, name, false, true, false});
            links_.push_back(AuxiliaryLink{name, variable, exogenous});

            ExprPtr source;
            if (k > 1) {
                source = reference_to(auxiliary_name(prefix, variable, k - 1), shift);
            } else {
                source = reference_to(variable, exogenous ? 0 : shift);
            }
            Equation equation;
            equation.residual = difference(reference_to(name), source);
            equation.original = name + "=" + to_string(*source);
            equations_.push_back(std::move(equation));
        }
    };
    // declaration order keeps the auxiliaries deterministic
    for (const auto& symbol : current_.endogenous()) {
        auto lead = lead_auxiliaries_.find(symbol.name);
        if (lead != lead_auxiliaries_.end()) {
            add_chain(symbol.name, lead->second, "AUX_F_", 1, false);
        }
        auto lag = lag_auxiliaries_.find(symbol.name);
        if (lag != lag_auxiliaries_.end()) {
            add_chain(symbol.name, lag->second, "AUX_L_", -1, false);
        }
    }
    for (const auto& symbol : current_.exogenous()) {
        auto lag = exogenous_lag_auxiliaries_.find(symbol.name);
        if (lag != exogenous_lag_auxiliaries_.end()) {
            add_chain(symbol.name, lag->second, "AUX_L_", -1, true);
        }
    }
}

void ModelBlockCompiler::record_occurrences(Equation& equation) const {
    std::set<std::pair<std::size_t, int>> seen;
    for_each_reference(*equation.residual, [&](const Reference& reference, const Expr&, bool in_steady_state) {
        const auto index = current_.find_endogenous(reference.name);
        if (!in_steady_state && index != SymbolTable::npos) {
            seen.emplace(index, reference.shift);
        }
    });
    equation.occurrences.clear();
    for (const auto& [index, shift] : seen) {
        equation.occurrences.push_back(Occurrence{index, shift});
    }
}

ModelEquations ModelBlockCompiler::run(const std::vector<CapturedEquation>& captured) {
    classify(captured);
    inject_welfare();

    current_ = builder_.build();
    for (std::size_t i = 0; i < equations_.size(); ++i) {
        equations_[i].residual = substitute_log_vars(equations_[i].residual, current_);
        validate(i);
    }

    for (auto& equation : equations_) {
        if (equation.type == EquationType::Structural || equation.type == EquationType::Complementarity) {
            equation.residual = create_auxiliaries(equation.residual);
        }
    }
    append_auxiliary_equations();
    current_ = builder_.build();

    std::size_t structural = 0;
    for (auto& equation : equations_) {
        record_occurrences(equation);
        if (equation.type == EquationType::Structural) {
            ++structural;
        }
        for_each_reference(*equation.residual, [&](const Reference& reference, const Expr&, bool) {
            auto index = current_.find_parameter(reference.name);
            if (index != SymbolTable::npos) {
                builder_.parameter(index).is_in_use = true;
            }
            index = current_.find_exogenous(reference.name);
            if (index != SymbolTable::npos && equation.type == EquationType::Structural) {
                builder_.exogenous(index).is_in_use = true;
            }
            index = current_.find_endogenous(reference.name);
            if (index != SymbolTable::npos && equation.type == EquationType::TimeVaryingProbability) {
                builder_.endogenous(index).is_affect_trans_probs = true;
            }
        });
    }
    if (structural != current_.endogenous().size()) {
        throw ModelError("the model has " + std::to_string(structural) + " structural equations for " +
                         std::to_string(current_.endogenous().size()) + " endogenous variables");
    }

    ModelEquations result;
    result.before_reordering = make_incidence(equations_, current_.endogenous_names());

    const auto order = alphabetical_order(current_.endogenous_names());
    builder_.reorder_endogenous(order);
    result.symbols = builder_.build();

    std::vector<std::size_t> new_position(order.size());
    for (std::size_t k = 0; k < order.size(); ++k) {
        new_position[order[k]] = k;
    }
    for (auto& equation : equations_) {
        for (auto& item : equation.occurrences) {
            item.endogenous = new_position[item.endogenous];
        }
        std::sort(equation.occurrences.begin(), equation.occurrences.end(), [](const Occurrence& a, const Occurrence& b) {
            return a.endogenous != b.endogenous ? a.endogenous < b.endogenous : a.shift < b.shift;
        });
    }
    result.after_reordering.occurrence = permute_endogenous(result.before_reordering.occurrence, order);
    result.after_reordering.lead_lag = lead_lag_incidence(result.after_reordering.occurrence);

    result.equations = std::move(equations_);
    result.auxiliaries = std::move(links_);
    return result;
}

}  // namespace

std::vector<CapturedEquation> capture_equations(const Block& block) {
    const auto tokens = tokenize(block.listing);
    std::vector<CapturedEquation> result;
    std::size_t begin = 0;
    while (begin < tokens.size()) {
        std::size_t end = begin;
        while (end < tokens.size() && !tokens[end].is(TokenKind::Punctuation, ";")) {
            ++end;
        }
        if (end == tokens.size()) {
            throw ParseError("missing ';' at the end of the statement", tokens[end - 1].file, tokens[end - 1].line);
        }
        if (end > begin) {
            result.push_back(capture_statement(tokens, begin, end));
        }
        begin = end + 1;
    }
    return result;
}

ModelEquations compile_model_equations(const std::vector<CapturedEquation>& captured,
                                       const SymbolTable& symbols,
                                       const std::optional<PlannerObjective>& planner,
                                       bool add_welfare) {
    ModelBlockCompiler compiler(symbols, planner, add_welfare);
    return compiler.run(captured);
}

}  // namespace libdsge
