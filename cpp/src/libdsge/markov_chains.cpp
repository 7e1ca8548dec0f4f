#include "libdsge/markov_chains.hpp"

#include "libdsge/expression.hpp"

#include <cctype>
#include <stdexcept>

namespace libdsge {

namespace {

bool is_digits(const std::string& text) {
    if (text.empty() || (text.size() > 1 && text.front() == '0')) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool is_zero(const ExprPtr& expr) {
    const auto* number = std::get_if<NumberLiteral>(&expr->node);
    return number != nullptr && number->value == 0.0;
}

bool is_one(const ExprPtr& expr) {
    const auto* number = std::get_if<NumberLiteral>(&expr->node);
    return number != nullptr && number->value == 1.0;
}

ExprPtr multiply(const ExprPtr& lhs, const ExprPtr& rhs) {
    if (is_zero(lhs) || is_zero(rhs)) {
        return make_number(0.0);
    }
    if (is_one(lhs)) {
        return rhs;
    }
    if (is_one(rhs)) {
        return lhs;
    }
    return make_binary(BinaryOp::Multiply, lhs, rhs);
}

// h x h entries of one chain; entry (i, j) is 0-based.
std::vector<std::vector<ExprPtr>> chain_matrix(const MarkovChain& chain, const std::map<std::string, std::string>& probabilities) {
    const std::size_t h = chain.number_of_states;
    std::vector<std::vector<ExprPtr>> matrix(h, std::vector<ExprPtr>(h));
    for (std::size_t i = 0; i < h; ++i) {
        ExprPtr row_sum;
        for (std::size_t j = 0; j < h; ++j) {
            if (i == j) {
                continue;
            }
            const std::string name = chain.name + "_tp_" + std::to_string(i + 1) + "_" + std::to_string(j + 1);
            auto it = probabilities.find(name);
            if (it == probabilities.end()) {
                matrix[i][j] = make_number(0.0);
                continue;
            }
            matrix[i][j] = parse_expression(it->second);
            row_sum = row_sum ? make_binary(BinaryOp::Add, row_sum, matrix[i][j]) : matrix[i][j];
        }
        matrix[i][i] = row_sum ? make_binary(BinaryOp::Subtract, make_number(1.0), row_sum) : make_number(1.0);
    }
    return matrix;
}

}  // namespace

RegimeTable make_regime_table(const std::vector<MarkovChain>& chains) {
    RegimeTable table;
    std::vector<std::size_t> states;
    for (std::size_t c = 1; c < chains.size(); ++c) {
        if (chains[c].number_of_states == 0) {
            throw std::invalid_argument("markov chain " + chains[c].name + " has no states");
        }
        table.chain_names.push_back(chains[c].name);
        states.push_back(chains[c].number_of_states);
    }

    std::size_t regimes = 1;
    for (auto h : states) {
        regimes *= h;
    }
    table.states.resize(static_cast<Eigen::Index>(regimes), static_cast<Eigen::Index>(states.size()));
    for (std::size_t r = 0; r < regimes; ++r) {
        std::size_t rest = r;
        for (std::size_t c = states.size(); c-- > 0;) {
            table.states(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = static_cast<int>(rest % states[c]) + 1;
            rest /= states[c];
        }
    }
    return table;
}

std::size_t first_regime(const RegimeTable& regimes, std::size_t chain, std::size_t state) {
    if (chain == 0) {
        if (state != 1) {
            throw std::out_of_range("the constant markov chain has a single state");
        }
        return 1;
    }
    const auto column = static_cast<Eigen::Index>(chain - 1);
    if (column >= regimes.states.cols()) {
        throw std::out_of_range("markov chain index out of range");
    }
    for (Eigen::Index r = 0; r < regimes.states.rows(); ++r) {
        if (regimes.states(r, column) == static_cast<int>(state)) {
            return static_cast<std::size_t>(r) + 1;
        }
    }
    throw std::out_of_range("state " + std::to_string(state) + " does not exist in markov chain " +
                            regimes.chain_names[static_cast<std::size_t>(column)]);
}

std::optional<TransitionProbabilityName> parse_transition_probability_name(const std::string& name) {
    const auto marker = name.rfind("_tp_");
    if (marker == std::string::npos || marker == 0) {
        return std::nullopt;
    }
    const std::string states = name.substr(marker + 4);
    const auto separator = states.find('_');
    if (separator == std::string::npos) {
        return std::nullopt;
    }
    const std::string from = states.substr(0, separator);
    const std::string to = states.substr(separator + 1);
    if (!is_digits(from) || !is_digits(to)) {
        return std::nullopt;
    }
    return TransitionProbabilityName{name.substr(0, marker), std::stoul(from), std::stoul(to)};
}

Routine transition_matrix_routine(const std::vector<MarkovChain>& chains,
                                  const RegimeTable& regimes,
                                  const std::map<std::string, std::string>& probabilities) {
    std::vector<std::vector<std::vector<ExprPtr>>> matrices;
    for (std::size_t c = 1; c < chains.size(); ++c) {
        matrices.push_back(chain_matrix(chains[c], probabilities));
    }

    Routine routine{"transition_matrix", input_list(), {"Q"}, {}};
    const auto count = static_cast<Eigen::Index>(regimes.size());
    for (Eigen::Index r = 0; r < count; ++r) {
        for (Eigen::Index s = 0; s < count; ++s) {
            ExprPtr entry = make_number(1.0);
            for (std::size_t c = 0; c < matrices.size(); ++c) {
                const auto column = static_cast<Eigen::Index>(c);
                const auto from = static_cast<std::size_t>(regimes.states(r, column) - 1);
                const auto to = static_cast<std::size_t>(regimes.states(s, column) - 1);
                entry = multiply(entry, matrices[c][from][to]);
            }
            routine.code.push_back("Q_" + std::to_string(r + 1) + "_" + std::to_string(s + 1) + "=" + to_string(*entry));
        }
    }
    return routine;
}

}  // namespace libdsge
