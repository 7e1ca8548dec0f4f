#include "libdsge/routine_evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace libdsge {

namespace {

// Position of the assignment '=' in "target=expr", npos when absent.
std::size_t assignment_position(const std::string& line) {
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (line[i] != '=') {
            continue;
        }
        const bool prefixed = i > 0 && (line[i - 1] == '<' || line[i - 1] == '>' || line[i - 1] == '!' || line[i - 1] == '=');
        const bool doubled = i + 1 < line.size() && line[i + 1] == '=';
        if (!prefixed && !doubled) {
            return i;
        }
    }
    return std::string::npos;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    return text.substr(first, text.find_last_not_of(" \t") - first + 1);
}

double apply_function(MathFunction function, const std::vector<double>& args) {
    const double x = args.front();
    switch (function) {
        case MathFunction::Exp:
            return std::exp(x);
        case MathFunction::Log:
            return std::log(x);
        case MathFunction::Log10:
            return std::log10(x);
        case MathFunction::Sqrt:
            return std::sqrt(x);
        case MathFunction::Abs:
            return std::abs(x);
        case MathFunction::Sign:
            return static_cast<double>((x > 0.0) - (x < 0.0));
        case MathFunction::Sin:
            return std::sin(x);
        case MathFunction::Cos:
            return std::cos(x);
        case MathFunction::Tan:
            return std::tan(x);
        case MathFunction::Asin:
            return std::asin(x);
        case MathFunction::Acos:
            return std::acos(x);
        case MathFunction::Atan:
            return std::atan(x);
        case MathFunction::Sinh:
            return std::sinh(x);
        case MathFunction::Cosh:
            return std::cosh(x);
        case MathFunction::Tanh:
            return std::tanh(x);
        case MathFunction::NormCdf:
            return 0.5 * std::erfc(-x / std::numbers::sqrt2);
        case MathFunction::NormPdf:
            return std::exp(-0.5 * x * x) * std::numbers::inv_sqrtpi / std::numbers::sqrt2;
        case MathFunction::Erf:
            return std::erf(x);
        case MathFunction::Min:
            return std::min(x, args.at(1));
        case MathFunction::Max:
            return std::max(x, args.at(1));
    }
    throw std::invalid_argument("unknown function");
}

double apply_operator(BinaryOp op, double lhs, double rhs) {
    switch (op) {
        case BinaryOp::Add:
            return lhs + rhs;
        case BinaryOp::Subtract:
            return lhs - rhs;
        case BinaryOp::Multiply:
            return lhs * rhs;
        case BinaryOp::Divide:
            return lhs / rhs;
        case BinaryOp::Power:
            return std::pow(lhs, rhs);
        case BinaryOp::Less:
            return lhs < rhs ? 1.0 : 0.0;
        case BinaryOp::LessEqual:
            return lhs <= rhs ? 1.0 : 0.0;
        case BinaryOp::Greater:
            return lhs > rhs ? 1.0 : 0.0;
        case BinaryOp::GreaterEqual:
            return lhs >= rhs ? 1.0 : 0.0;
        case BinaryOp::Equal:
            return lhs == rhs ? 1.0 : 0.0;
        case BinaryOp::NotEqual:
            return lhs != rhs ? 1.0 : 0.0;
    }
    throw std::invalid_argument("unknown operator");
}

}  // namespace

void RoutineEvaluator::bind(SymbolKind kind, Eigen::VectorXd values) {
    if (kind == SymbolKind::RegimeState || kind == SymbolKind::ParameterInRegime) {
        throw std::invalid_argument("regime states and parameters by regime have their own bindings");
    }
    vectors_[kind] = std::move(values);
}

void RoutineEvaluator::bind_regime_states(int current, int next) {
    current_regime_ = current;
    next_regime_ = next;
}

void RoutineEvaluator::bind_parameters_in_regimes(Eigen::MatrixXd values) {
    parameters_in_regimes_ = std::move(values);
}

double RoutineEvaluator::value(const SymbolId& symbol) const {
    switch (symbol.kind()) {
        case SymbolKind::RegimeState:
            return symbol.number() == 0 ? current_regime_ : next_regime_;
        case SymbolKind::ParameterInRegime: {
            const auto row = static_cast<Eigen::Index>(symbol.number() - 1);
            const auto col = static_cast<Eigen::Index>(symbol.regime() - 1);
            if (row >= parameters_in_regimes_.rows() || col >= parameters_in_regimes_.cols()) {
                throw std::out_of_range("no value bound to " + symbol.render());
            }
            return parameters_in_regimes_(row, col);
        }
        default:
            break;
    }
    auto it = vectors_.find(symbol.kind());
    const auto position = static_cast<Eigen::Index>(symbol.number() - 1);
    if (it == vectors_.end() || position >= it->second.size()) {
        throw std::out_of_range("no value bound to " + symbol.render());
    }
    return it->second(position);
}

double RoutineEvaluator::evaluate(const Expr& expr) const {
    return std::visit(
        [&](const auto& node) -> double {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, NumberLiteral>) {
                return node.value;
            } else if constexpr (std::is_same_v<T, Reference>) {
                auto symbol = SymbolId::parse(node.name);
                if (!symbol || node.shift != 0 || !node.qualifiers.empty()) {
                    throw std::invalid_argument("'" + to_string(node) + "' is outside the evaluation vocabulary");
                }
                return value(*symbol);
            } else if constexpr (std::is_same_v<T, SteadyStateCall>) {
                throw std::invalid_argument("steady_state() cannot be evaluated");
            } else if constexpr (std::is_same_v<T, FunctionCall>) {
                std::vector<double> args;
                for (const auto& argument : node.arguments) {
                    args.push_back(evaluate(*argument));
                }
                return apply_function(node.function, args);
            } else if constexpr (std::is_same_v<T, Negation>) {
                return -evaluate(*node.operand);
            } else {
                return apply_operator(node.op, evaluate(*node.lhs), evaluate(*node.rhs));
            }
        },
        expr.node);
}

double RoutineEvaluator::evaluate(const std::string& code) const {
    return evaluate(*parse_expression(code));
}

void RoutineEvaluator::execute(const Routine& routine) {
    for (const auto& line : routine.code) {
        const auto split = assignment_position(line);
        if (split == std::string::npos) {
            throw std::invalid_argument("routine " + routine.name + " line is not an assignment: " + line);
        }
        const std::string target = trim(line.substr(0, split));
        const double result = evaluate(line.substr(split + 1));
        const auto symbol = SymbolId::parse(target);
        if (!symbol || symbol->kind() == SymbolKind::RegimeState || symbol->kind() == SymbolKind::ParameterInRegime) {
            scratch_[target] = result;
            continue;
        }
        auto& values = vectors_[symbol->kind()];
        const auto position = static_cast<Eigen::Index>(symbol->number() - 1);
        if (position >= values.size()) {
            const auto old_size = values.size();
            values.conservativeResize(position + 1);
            values.segment(old_size, position + 1 - old_size).setZero();
        }
        values(position) = result;
    }
}

double RoutineEvaluator::scratch(const std::string& name) const {
    auto it = scratch_.find(name);
    if (it == scratch_.end()) {
        throw std::out_of_range("no value computed for " + name);
    }
    return it->second;
}

Eigen::VectorXd RoutineEvaluator::evaluate_functions(const DerivativeRoutine& routine) const {
    Eigen::VectorXd values(static_cast<Eigen::Index>(routine.functions.size()));
    for (std::size_t i = 0; i < routine.functions.size(); ++i) {
        values(static_cast<Eigen::Index>(i)) = evaluate(routine.functions[i].code);
    }
    return values;
}

Eigen::SparseMatrix<double> RoutineEvaluator::evaluate_derivatives(const DerivativeRoutine& routine, std::size_t order) const {
    if (order == 0 || order > routine.derivatives.size()) {
        throw std::out_of_range("derivative order " + std::to_string(order) + " was not computed");
    }
    const auto& tensor = routine.derivatives[order - 1];
    Eigen::SparseMatrix<double> values(tensor.index.rows(), tensor.index.cols());
    std::vector<Eigen::Triplet<double>> triplets;
    for (Eigen::Index row = 0; row < tensor.index.outerSize(); ++row) {
        for (DerivativeIndex::InnerIterator it(tensor.index, row); it; ++it) {
            const auto& entry = tensor.entries.at(static_cast<std::size_t>(it.value() - 1));
            triplets.emplace_back(it.row(), it.col(), evaluate(entry.code));
        }
    }
    values.setFromTriplets(triplets.begin(), triplets.end());
    return values;
}

Eigen::MatrixXd RoutineEvaluator::transition_matrix(const Routine& routine, std::size_t regimes) const {
    RoutineEvaluator copy(*this);
    copy.execute(routine);
    const auto h = static_cast<Eigen::Index>(regimes);
    Eigen::MatrixXd matrix(h, h);
    for (Eigen::Index r = 0; r < h; ++r) {
        for (Eigen::Index s = 0; s < h; ++s) {
            matrix(r, s) = copy.scratch("Q_" + std::to_string(r + 1) + "_" + std::to_string(s + 1));
        }
    }
    return matrix;
}

}  // namespace libdsge
