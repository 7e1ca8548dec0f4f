#include "libdsge/parameterization.hpp"

#include "libdsge/errors.hpp"
#include "libdsge/expression.hpp"
#include "libdsge/lexer.hpp"
#include "libdsge/routine_evaluator.hpp"

#include <utility>

namespace libdsge {

namespace {

using TokenRange = std::pair<std::size_t, std::size_t>;

// Comma-separated items of one statement, ignoring commas inside parentheses.
std::vector<TokenRange> split_items(const std::vector<Token>& tokens, std::size_t begin, std::size_t end) {
    std::vector<TokenRange> items;
    int depth = 0;
    std::size_t start = begin;
    for (std::size_t i = begin; i < end; ++i) {
        if (tokens[i].is(TokenKind::Punctuation, "(")) {
            ++depth;
        } else if (tokens[i].is(TokenKind::Punctuation, ")")) {
            --depth;
        } else if (depth == 0 && tokens[i].is(TokenKind::Punctuation, ",")) {
            items.emplace_back(start, i);
            start = i + 1;
        }
    }
    items.emplace_back(start, end);
    return items;
}

double constant_value(const std::vector<Token>& tokens, const TokenRange& range) {
    const auto expr = parse_expression(tokens, range.first, range.second);
    const RoutineEvaluator evaluator;
    try {
        return evaluator.evaluate(*expr);
    } catch (const std::logic_error&) {
        throw ParseError("parameter values must be numeric constants, got '" + to_string(*expr) + "'",
                         tokens[range.first].file,
                         tokens[range.first].line);
    }
}

ParameterValue read_statement(const std::vector<Token>& tokens, std::size_t begin, std::size_t end, const SymbolTable& symbols) {
    const Token& head = tokens[begin];
    const auto items = split_items(tokens, begin, end);
    if (items.size() < 2 || items.size() > 5 || items.size() == 3) {
        throw ParseError("expected: name, value[, lower, upper[, prior]]", head.file, head.line);
    }
    for (const auto& item : items) {
        if (item.first == item.second) {
            throw ParseError("empty item in parameterization statement", head.file, head.line);
        }
    }

    ParameterValue result;
    result.file = head.file;
    result.line = head.line;

    const auto target = parse_expression(tokens, items[0].first, items[0].second);
    const auto* reference = std::get_if<Reference>(&target->node);
    if (reference == nullptr || reference->shift != 0) {
        throw ParseError("expected a parameter name, got '" + to_string(*target) + "'", head.file, head.line);
    }
    result.parameter = symbols.find_parameter(reference->name);
    if (result.parameter == SymbolTable::npos) {
        throw ParseError("unknown parameter '" + reference->name + "'", head.file, head.line);
    }
    const auto& parameter = symbols.parameters()[result.parameter];
    if (reference->qualifiers.empty()) {
        if (parameter.is_switching) {
            throw ParseError("switching parameter '" + parameter.name + "' needs a (chain,state) qualifier", head.file, head.line);
        }
    } else {
        const auto& q = reference->qualifiers;
        if (q.size() != 2) {
            throw ParseError("expected " + parameter.name + "(chain,state)", head.file, head.line);
        }
        result.chain = symbols.find_chain(q[0]);
        if (result.chain == SymbolTable::npos || result.chain != parameter.governing_chain) {
            throw ParseError("parameter '" + parameter.name + "' is not governed by markov chain '" + q[0] + "'", head.file, head.line);
        }
        const auto& chain = symbols.markov_chains()[result.chain];
        const int state = q[1].find_first_not_of("0123456789") == std::string::npos ? std::stoi(q[1]) : 0;
        if (state < 1 || static_cast<std::size_t>(state) > chain.number_of_states) {
            throw ParseError("state '" + q[1] + "' does not exist in markov chain '" + chain.name + "'", head.file, head.line);
        }
        result.state = static_cast<std::size_t>(state);
    }

    result.value = constant_value(tokens, items[1]);
    if (items.size() >= 4) {
        result.lower = constant_value(tokens, items[2]);
        result.upper = constant_value(tokens, items[3]);
        if (*result.lower > *result.upper) {
            throw ParseError("lower bound above upper bound for '" + parameter.name + "'", head.file, head.line);
        }
    }
    if (items.size() == 5) {
        for (std::size_t i = items[4].first; i < items[4].second; ++i) {
            result.prior += tokens[i].text;
        }
    }
    return result;
}

}  // namespace

std::vector<ParameterValue> read_parameterization(const Block& block, const SymbolTable& symbols) {
    const auto tokens = tokenize(block.listing);
    std::vector<ParameterValue> values;
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
            values.push_back(read_statement(tokens, begin, end, symbols));
        }
        begin = end + 1;
    }
    return values;
}

}  // namespace libdsge
