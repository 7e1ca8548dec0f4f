#include "libdsge/restrictions.hpp"

#include "libdsge/errors.hpp"
#include "libdsge/lexer.hpp"
#include "libdsge/symbol_id.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace libdsge {

namespace {

struct ParsedRestriction {
    ExprPtr lhs;
    ExprPtr rhs;
    BinaryOp relation;
};

bool is_unsigned_integer(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool is_signed_integer(const std::string& text) {
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        return is_unsigned_integer(text.substr(1));
    }
    return is_unsigned_integer(text);
}

std::string strip_spaces(const std::string& text) {
    std::string result;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result.push_back(c);
        }
    }
    return result;
}

std::size_t resolve_position(const std::string& item,
                             const std::vector<std::string>& endogenous_names,
                             const std::string& file,
                             std::size_t line) {
    if (is_unsigned_integer(item)) {
        const auto position = std::stoul(item);
        if (position == 0) {
            throw ParseError("coefficient positions are 1-based", file, line);
        }
        return position;
    }
    auto it = std::find(endogenous_names.begin(), endogenous_names.end(), item);
    if (it == endogenous_names.end()) {
        throw ParseError("'" + item + "' is not an endogenous variable", file, line);
    }
    return static_cast<std::size_t>(it - endogenous_names.begin()) + 1;
}

// a<lag> or b<lag>
bool is_prefixed_coefficient(const Reference& reference) {
    const auto& name = reference.name;
    return name.size() > 1 && (name.front() == 'a' || name.front() == 'b') && is_unsigned_integer(name.substr(1)) &&
           (reference.qualifiers.size() == 2 || reference.qualifiers.size() == 4) && is_unsigned_integer(reference.qualifiers.front());
}

ParsedRestriction parse_restriction(const std::vector<Token>& tokens, std::size_t begin, std::size_t end) {
    ExpressionParser parser(tokens, begin, end);
    ParsedRestriction parsed;
    parsed.lhs = parser.parse_arithmetic();
    const Token& op = parser.advance();
    if (op.is(TokenKind::Operator, "=") || op.is(TokenKind::Operator, "==")) {
        parsed.relation = BinaryOp::Equal;
    } else if (op.is(TokenKind::Operator, ">=")) {
        parsed.relation = BinaryOp::GreaterEqual;
    } else if (op.is(TokenKind::Operator, ">")) {
        parsed.relation = BinaryOp::Greater;
    } else if (op.is(TokenKind::Operator, "<=")) {
        parsed.relation = BinaryOp::LessEqual;
    } else if (op.is(TokenKind::Operator, "<")) {
        parsed.relation = BinaryOp::Less;
    } else {
        throw ParseError("restriction expects one of =, >=, >, <=, < but found '" + op.text + "'", op.file, op.line);
    }
    parsed.rhs = parser.parse_arithmetic();
    if (!parser.at_end()) {
        parser.fail("unexpected token '" + parser.peek().text + "'");
    }
    return parsed;
}

class RestrictionResolver {
public:
    explicit RestrictionResolver(const RestrictionContext& context) : context_(context) {}

    // Parameter position and 1-based regime of a parameter reference.
    std::pair<std::size_t, std::size_t> locate(const Reference& reference, const std::string& file, std::size_t line) const {
        const auto& names = context_.parameter_names;
        auto it = std::find(names.begin(), names.end(), reference.name);
        if (it == names.end() || reference.shift != 0) {
            throw ParseError("unknown parameter '" + to_string(reference) + "' in restriction", file, line);
        }
        const auto parameter = static_cast<std::size_t>(it - names.begin());
        if (reference.qualifiers.empty()) {
            return {parameter, 1};
        }
        const auto& q = reference.qualifiers;
        if (q.size() != 2 || !is_unsigned_integer(q[1])) {
            throw ParseError("expected " + reference.name + "(chain,state)", file, line);
        }
        std::size_t chain = 0;
        if (q[0] != "const") {
            const auto& chains = context_.regimes.chain_names;
            auto found = std::find(chains.begin(), chains.end(), q[0]);
            if (found == chains.end()) {
                throw ParseError("unknown markov chain '" + q[0] + "'", file, line);
            }
            chain = static_cast<std::size_t>(found - chains.begin()) + 1;
        }
        if (context_.governing_chain.at(parameter) != chain) {
            throw ParseError("parameter '" + reference.name + "' is not governed by markov chain '" + q[0] + "'", file, line);
        }
        try {
            return {parameter, first_regime(context_.regimes, chain, std::stoul(q[1]))};
        } catch (const std::out_of_range& error) {
            throw ParseError(error.what(), file, line);
        }
    }

    ExprPtr to_regime_form(const ExprPtr& expr, const std::string& file, std::size_t line) const {
        return rewrite_references(expr, [&](const Reference& reference, const Expr&, bool in_steady_state) -> ExprPtr {
            if (in_steady_state) {
                throw ParseError("steady_state() cannot appear in a restriction", file, line);
            }
            const auto [parameter, regime] = locate(reference, file, line);
            return make_reference(Reference{SymbolId::parameter_in_regime(parameter + 1, regime).render(), 0, {}});
        });
    }

    void process(const std::string& statement, const std::string& file, std::size_t line, NonlinearRestrictions& out) const {
        const std::string original = strip_spaces(statement);
        const auto tokens = tokenize(SourceLine{original, file, line});
        if (tokens.empty()) {
            return;
        }
        auto parsed = parse_restriction(tokens, 0, tokens.size());
        parsed.lhs = normalize_coefficients(parsed.lhs, context_.endogenous_names, file, line);
        parsed.rhs = normalize_coefficients(parsed.rhs, context_.endogenous_names, file, line);

        if (parsed.relation == BinaryOp::Equal) {
            if (const auto* target = std::get_if<Reference>(&parsed.lhs->node)) {
                bool appears = false;
                for_each_reference(*parsed.rhs, [&](const Reference& reference, const Expr&, bool) {
                    appears = appears || reference.name == target->name;
                });
                if (!appears) {
                    const auto [parameter, regime] = locate(*target, file, line);
                    out.derived.push_back(DerivedParameter{original, parameter, regime, to_string(*to_regime_form(parsed.rhs, file, line))});
                    return;
                }
            }
        }

        NonlinearRestriction restriction;
        restriction.original = original;
        ExprPtr g;
        switch (parsed.relation) {
            case BinaryOp::Less:
            case BinaryOp::LessEqual:
                g = make_binary(BinaryOp::Subtract, parsed.rhs, parsed.lhs);
                break;
            default:
                g = make_binary(BinaryOp::Subtract, parsed.lhs, parsed.rhs);
        }
        restriction.is_strict = parsed.relation == BinaryOp::Less || parsed.relation == BinaryOp::Greater;
        restriction.is_equality = parsed.relation == BinaryOp::Equal;
        restriction.code = to_string(*to_regime_form(g, file, line)) +
                           (restriction.is_equality ? "=0" : (restriction.is_strict ? ">0" : ">=0"));
        out.restrictions.push_back(std::move(restriction));
    }

private:
    const RestrictionContext& context_;
};

}  // namespace

RestrictionContext make_restriction_context(const SymbolTable& symbols, const RegimeTable& regimes) {
    RestrictionContext context;
    context.endogenous_names = symbols.endogenous_names();
    context.parameter_names = symbols.parameter_names();
    for (const auto& parameter : symbols.parameters()) {
        context.governing_chain.push_back(parameter.governing_chain);
    }
    context.regimes = regimes;
    return context;
}

bool is_inequality(const std::string& restriction) {
    return restriction.find_first_of("<>") != std::string::npos;
}

ExprPtr normalize_coefficients(const ExprPtr& expr,
                               const std::vector<std::string>& endogenous_names,
                               const std::string& file,
                               std::size_t line) {
    return rewrite_references(expr, [&](const Reference& reference, const Expr& node, bool) -> ExprPtr {
        const auto& q = reference.qualifiers;
        std::string prefix;
        std::string lag;
        std::size_t chain_at = 0;
        if (reference.name == "coef") {
            if ((q.size() != 3 && q.size() != 5) || !is_signed_integer(q[2])) {
                throw ParseError("expected coef(eqtn,vbl,lag[,chain,state]), got '" + to_string(reference) + "'", file, line);
            }
            const int value = std::stoi(q[2]);
            prefix = value >= 0 ? "a" : "b";
            lag = std::to_string(std::abs(value));
            chain_at = 3;
        } else if (is_prefixed_coefficient(reference)) {
            prefix = reference.name.substr(0, 1);
            lag = std::to_string(std::stoul(reference.name.substr(1)));
            chain_at = 2;
        } else {
            return nullptr;
        }
        const auto equation = resolve_position(q[0], endogenous_names, file, line);
        const auto variable = resolve_position(q[1], endogenous_names, file, line);
        Reference canonical{prefix + lag + "_" + std::to_string(equation) + "_" + std::to_string(variable), 0, {}};
        if (q.size() > chain_at) {
            canonical.qualifiers = {q[chain_at], q[chain_at + 1]};
        }
        return make_reference(std::move(canonical), node.file, node.line);
    });
}

std::string normalize_restriction(const std::string& restriction, const std::vector<std::string>& endogenous_names) {
    const auto tokens = tokenize(strip_spaces(restriction));
    const auto parsed = parse_restriction(tokens, 0, tokens.size());
    const auto lhs = normalize_coefficients(parsed.lhs, endogenous_names);
    const auto rhs = normalize_coefficients(parsed.rhs, endogenous_names);
    const std::string op = parsed.relation == BinaryOp::Equal ? "=" : binary_op_symbol(parsed.relation);
    return to_string(*lhs) + op + to_string(*rhs);
}

NonlinearRestrictions nonlinear_restrictions_engine(const RestrictionContext& context, const std::vector<std::string>& restrictions) {
    const RestrictionResolver resolver(context);
    NonlinearRestrictions result;
    for (const auto& restriction : restrictions) {
        resolver.process(restriction, {}, 0, result);
    }
    return result;
}

RestrictionSetup setup_nonlinear_restrictions(const std::vector<std::string>& restrictions, const RestrictionContext& context) {
    RestrictionSetup setup;
    std::vector<std::string> inequalities;
    for (const auto& restriction : restrictions) {
        if (is_inequality(restriction)) {
            inequalities.push_back(restriction);
        } else {
            setup.linear.push_back(restriction);
        }
    }
    if (inequalities.empty()) {
        return setup;
    }
    setup.nonlinear = nonlinear_restrictions_engine(context, inequalities);
    if (!setup.nonlinear.derived.empty()) {
        throw ConfigurationError("derived parameters should not appear here: " + setup.nonlinear.derived.front().original);
    }
    return setup;
}

ParameterRestrictions compile_parameter_restrictions(const Block& block, const RestrictionContext& context) {
    const RestrictionResolver resolver(context);
    ParameterRestrictions result;
    const auto tokens = tokenize(block.listing);
    std::size_t begin = 0;
    while (begin < tokens.size()) {
        std::size_t end = begin;
        std::string statement;
        while (end < tokens.size() && !tokens[end].is(TokenKind::Punctuation, ";")) {
            statement += tokens[end].text;
            ++end;
        }
        if (end == tokens.size()) {
            throw ParseError("missing ';' at the end of the restriction", tokens[end - 1].file, tokens[end - 1].line);
        }
        if (end > begin) {
            const auto& head = tokens[begin];
            NonlinearRestrictions processed;
            resolver.process(statement, head.file, head.line, processed);
            for (auto& derived : processed.derived) {
                result.derived.push_back(std::move(derived));
            }
            for (auto& restriction : processed.restrictions) {
                if (restriction.is_equality) {
                    result.linear.push_back(normalize_restriction(statement, context.endogenous_names));
                } else {
                    result.nonlinear.push_back(std::move(restriction));
                }
            }
        }
        begin = end + 1;
    }
    return result;
}

}  // namespace libdsge
