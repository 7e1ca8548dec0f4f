#include "libdsge/block_extractor.hpp"

#include "libdsge/errors.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace libdsge {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string leading_word(const std::string& text) {
    std::size_t end = 0;
    while (end < text.size() && (std::isalnum(static_cast<unsigned char>(text[end])) || text[end] == '_')) {
        ++end;
    }
    return text.substr(0, end);
}

std::vector<std::string> split_items(const std::string& text) {
    std::vector<std::string> items;
    std::string current;
    for (char c : text) {
        if (c == ',') {
            items.push_back(trim(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    items.push_back(trim(current));
    return items;
}

bool is_positive_integer(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); }) &&
           std::stoul(text) > 0;
}

bool is_identifier(const std::string& text) {
    return !text.empty() && (std::isalpha(static_cast<unsigned char>(text.front())) || text.front() == '_') &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

void validate_trigger(const Block& block, BlockSet& set) {
    if (block.trigger.empty()) {
        return;
    }
    auto fail = [&](const std::string& message) {
        throw ParseError("block '" + block.name + "': " + message, block.file, block.line);
    };
    switch (block.kind) {
        case BlockKind::Parameters: {
            if (block.trigger.size() != 2 || !is_identifier(block.trigger[0]) || !is_positive_integer(block.trigger[1])) {
                fail("expected (chain_name,number_of_states)");
            }
            if (block.trigger[0] == "const") {
                fail("the name 'const' is reserved for the constant markov chain");
            }
            const std::size_t states = std::stoul(block.trigger[1]);
            auto it = std::find_if(set.markov_chains.begin(), set.markov_chains.end(),
                                   [&](const DeclaredChain& chain) { return chain.name == block.trigger[0]; });
            if (it == set.markov_chains.end()) {
                set.markov_chains.push_back(DeclaredChain{block.trigger[0], states, block.file, block.line});
            } else if (it->number_of_states != states) {
                fail("markov chain '" + block.trigger[0] + "' redeclared with a different number of states");
            }
            return;
        }
        case BlockKind::Model:
            for (const auto& item : block.trigger) {
                if (item != "linear") {
                    fail("unknown option '" + item + "'");
                }
            }
            return;
        case BlockKind::SteadyStateModel:
            for (const auto& item : block.trigger) {
                if (item != "unique" && item != "imposed" && item != "initial_guess") {
                    fail("unknown option '" + item + "'");
                }
            }
            return;
        case BlockKind::PlannerObjective:
            for (const auto& item : block.trigger) {
                const auto eq = item.find('=');
                const std::string key = eq == std::string::npos ? item : trim(item.substr(0, eq));
                if (eq == std::string::npos || (key != "discount" && key != "commitment")) {
                    fail("expected discount=... or commitment=...");
                }
            }
            return;
        default:
            fail("does not accept options");
    }
}

}  // namespace

const Block* BlockSet::find(BlockKind kind) const noexcept {
    for (const auto& block : blocks) {
        if (block.kind == kind) {
            return &block;
        }
    }
    return nullptr;
}

std::vector<const Block*> BlockSet::all(BlockKind kind) const {
    std::vector<const Block*> result;
    for (const auto& block : blocks) {
        if (block.kind == kind) {
            result.push_back(&block);
        }
    }
    return result;
}

std::optional<BlockKind> find_block_keyword(const std::string& word) {
    if (word == "endogenous") {
        return BlockKind::Endogenous;
    }
    if (word == "exogenous") {
        return BlockKind::Exogenous;
    }
    if (word == "parameters") {
        return BlockKind::Parameters;
    }
    if (word == "observables") {
        return BlockKind::Observables;
    }
    if (word == "log_vars") {
        return BlockKind::LogVars;
    }
    if (word == "model") {
        return BlockKind::Model;
    }
    if (word == "steady_state_model") {
        return BlockKind::SteadyStateModel;
    }
    if (word == "parameterization") {
        return BlockKind::Parameterization;
    }
    if (word == "parameter_restrictions") {
        return BlockKind::ParameterRestrictions;
    }
    if (word == "exogenous_definitions") {
        return BlockKind::ExogenousDefinitions;
    }
    if (word == "planner_objective") {
        return BlockKind::PlannerObjective;
    }
    return std::nullopt;
}

std::string block_name(BlockKind kind) {
    switch (kind) {
        case BlockKind::Endogenous:
            return "endogenous";
        case BlockKind::Exogenous:
            return "exogenous";
        case BlockKind::Parameters:
            return "parameters";
        case BlockKind::Observables:
            return "observables";
        case BlockKind::LogVars:
            return "log_vars";
        case BlockKind::Model:
            return "model";
        case BlockKind::SteadyStateModel:
            return "steady_state_model";
        case BlockKind::Parameterization:
            return "parameterization";
        case BlockKind::ParameterRestrictions:
            return "parameter_restrictions";
        case BlockKind::ExogenousDefinitions:
            return "exogenous_definitions";
        case BlockKind::PlannerObjective:
            return "planner_objective";
    }
    throw std::invalid_argument("unknown block kind");
}

bool is_declaration_block(BlockKind kind) noexcept {
    switch (kind) {
        case BlockKind::Endogenous:
        case BlockKind::Exogenous:
        case BlockKind::Parameters:
        case BlockKind::Observables:
        case BlockKind::LogVars:
            return true;
        default:
            return false;
    }
}

BlockSet extract_blocks(const std::vector<SourceLine>& lines) {
    BlockSet set;
    std::set<BlockKind> seen;

    for (const auto& line : lines) {
        const std::string text = trim(line.text);
        if (text.empty()) {
            continue;
        }
        const std::string word = leading_word(text);
        const auto kind = word.empty() ? std::nullopt : find_block_keyword(word);
        std::string rest = text.substr(word.size());
        const std::string after = trim(rest);
        const bool starts_block =
            kind.has_value() && (rest.empty() || std::isspace(static_cast<unsigned char>(rest.front())) ||
                                 after.front() == '(' || after.front() == '{');
        // "model = ..." inside a block is an equation, not a keyword
        const bool is_assignment = !after.empty() && after.front() == '=';

        if (!starts_block || is_assignment) {
            if (set.blocks.empty()) {
                throw ParseError("unknown block '" + (word.empty() ? text : word) + "'", line.file, line.line);
            }
            set.blocks.back().listing.push_back(line);
            continue;
        }

        if (!is_declaration_block(*kind) && !seen.insert(*kind).second) {
            throw ParseError("duplicate block '" + block_name(*kind) + "'", line.file, line.line);
        }

        Block block{*kind, word, {}, {}, line.file, line.line};
        rest = after;
        if (!rest.empty() && (rest.front() == '(' || rest.front() == '{')) {
            const char close = rest.front() == '(' ? ')' : '}';
            const auto end = rest.find(close);
            if (end == std::string::npos) {
                throw ParseError("unterminated options for block '" + word + "'", line.file, line.line);
            }
            block.trigger = split_items(rest.substr(1, end - 1));
            rest = trim(rest.substr(end + 1));
        }
        if (!rest.empty()) {
            block.listing.push_back(SourceLine{rest, line.file, line.line});
        }
        validate_trigger(block, set);
        set.blocks.push_back(std::move(block));
    }
    return set;
}

}  // namespace libdsge
