#include "libdsge/planner.hpp"

#include "libdsge/errors.hpp"
#include "libdsge/lexer.hpp"

namespace libdsge {

PlannerObjective read_planner_objective(const Block& block) {
    PlannerObjective objective{nullptr, make_number(kDefaultDiscount), make_number(kDefaultCommitment), block.file, block.line};

    for (const auto& item : block.trigger) {
        const auto eq = item.find('=');
        const std::string key = item.substr(0, eq);
        auto value = parse_expression(item.substr(eq + 1));
        if (key.find("discount") != std::string::npos) {
            objective.discount = std::move(value);
        } else {
            objective.commitment = std::move(value);
        }
    }

    const auto tokens = tokenize(block.listing);
    std::size_t end = 0;
    while (end < tokens.size() && !tokens[end].is(TokenKind::Punctuation, ";")) {
        ++end;
    }
    if (end == 0) {
        throw ParseError("planner_objective expects a loss function", block.file, block.line);
    }
    if (end + 1 < tokens.size()) {
        throw ParseError("planner_objective expects a single loss function", tokens[end + 1].file, tokens[end + 1].line);
    }
    objective.loss = parse_expression(tokens, 0, end);
    if (!tokens.empty()) {
        objective.file = tokens.front().file;
        objective.line = tokens.front().line;
    }
    return objective;
}

}  // namespace libdsge
