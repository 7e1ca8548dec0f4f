#include "libdsge/expression_graph.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <type_traits>

namespace libdsge {

namespace {

constexpr int kConstantTag = 0;
constexpr int kSymbolTag = 1;
constexpr int kUnaryTag = 2;
constexpr int kBinaryTag = 3;

constexpr int kComparisonPrecedence = 1;
constexpr int kAdditivePrecedence = 2;
constexpr int kMultiplicativePrecedence = 3;
constexpr int kUnaryPrecedence = 4;
constexpr int kPowerPrecedence = 5;
constexpr int kAtomPrecedence = 6;

Opcode opcode_of(MathFunction function) {
    switch (function) {
        case MathFunction::Exp:
            return Opcode::Exp;
        case MathFunction::Log:
            return Opcode::Log;
        case MathFunction::Log10:
            return Opcode::Log10;
        case MathFunction::Sqrt:
            return Opcode::Sqrt;
        case MathFunction::Abs:
            return Opcode::Abs;
        case MathFunction::Sign:
            return Opcode::Sign;
        case MathFunction::Sin:
            return Opcode::Sin;
        case MathFunction::Cos:
            return Opcode::Cos;
        case MathFunction::Tan:
            return Opcode::Tan;
        case MathFunction::Asin:
            return Opcode::Asin;
        case MathFunction::Acos:
            return Opcode::Acos;
        case MathFunction::Atan:
            return Opcode::Atan;
        case MathFunction::Sinh:
            return Opcode::Sinh;
        case MathFunction::Cosh:
            return Opcode::Cosh;
        case MathFunction::Tanh:
            return Opcode::Tanh;
        case MathFunction::NormCdf:
            return Opcode::NormCdf;
        case MathFunction::NormPdf:
            return Opcode::NormPdf;
        case MathFunction::Erf:
            return Opcode::Erf;
        case MathFunction::Min:
            return Opcode::Min;
        case MathFunction::Max:
            return Opcode::Max;
    }
    throw std::invalid_argument("unknown function");
}

Opcode opcode_of(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:
            return Opcode::Add;
        case BinaryOp::Subtract:
            return Opcode::Subtract;
        case BinaryOp::Multiply:
            return Opcode::Multiply;
        case BinaryOp::Divide:
            return Opcode::Divide;
        case BinaryOp::Power:
            return Opcode::Power;
        case BinaryOp::Less:
            return Opcode::Less;
        case BinaryOp::LessEqual:
            return Opcode::LessEqual;
        case BinaryOp::Greater:
            return Opcode::Greater;
        case BinaryOp::GreaterEqual:
            return Opcode::GreaterEqual;
        case BinaryOp::Equal:
            return Opcode::Equal;
        case BinaryOp::NotEqual:
            return Opcode::NotEqual;
    }
    throw std::invalid_argument("unknown operator");
}

// Printed name of function opcodes.
std::string function_name(Opcode op) {
    switch (op) {
        case Opcode::Exp:
            return FunctionRegistry::name(MathFunction::Exp);
        case Opcode::Log:
            return FunctionRegistry::name(MathFunction::Log);
        case Opcode::Log10:
            return FunctionRegistry::name(MathFunction::Log10);
        case Opcode::Sqrt:
            return FunctionRegistry::name(MathFunction::Sqrt);
        case Opcode::Abs:
            return FunctionRegistry::name(MathFunction::Abs);
        case Opcode::Sign:
            return FunctionRegistry::name(MathFunction::Sign);
        case Opcode::Sin:
            return FunctionRegistry::name(MathFunction::Sin);
        case Opcode::Cos:
            return FunctionRegistry::name(MathFunction::Cos);
        case Opcode::Tan:
            return FunctionRegistry::name(MathFunction::Tan);
        case Opcode::Asin:
            return FunctionRegistry::name(MathFunction::Asin);
        case Opcode::Acos:
            return FunctionRegistry::name(MathFunction::Acos);
        case Opcode::Atan:
            return FunctionRegistry::name(MathFunction::Atan);
        case Opcode::Sinh:
            return FunctionRegistry::name(MathFunction::Sinh);
        case Opcode::Cosh:
            return FunctionRegistry::name(MathFunction::Cosh);
        case Opcode::Tanh:
            return FunctionRegistry::name(MathFunction::Tanh);
        case Opcode::NormCdf:
            return FunctionRegistry::name(MathFunction::NormCdf);
        case Opcode::NormPdf:
            return FunctionRegistry::name(MathFunction::NormPdf);
        case Opcode::Erf:
            return FunctionRegistry::name(MathFunction::Erf);
        case Opcode::Min:
            return FunctionRegistry::name(MathFunction::Min);
        case Opcode::Max:
            return FunctionRegistry::name(MathFunction::Max);
        default:
            throw std::invalid_argument("opcode is not a function");
    }
}

std::string operator_symbol(Opcode op) {
    switch (op) {
        case Opcode::Add:
            return "+";
        case Opcode::Subtract:
            return "-";
        case Opcode::Multiply:
            return "*";
        case Opcode::Divide:
            return "/";
        case Opcode::Power:
            return "^";
        case Opcode::Less:
            return "<";
        case Opcode::LessEqual:
            return "<=";
        case Opcode::Greater:
            return ">";
        case Opcode::GreaterEqual:
            return ">=";
        case Opcode::Equal:
            return "==";
        case Opcode::NotEqual:
            return "!=";
        default:
            throw std::invalid_argument("opcode is not an operator");
    }
}

std::vector<SymbolId> merge(const std::vector<SymbolId>& a, const std::vector<SymbolId>& b) {
    std::vector<SymbolId> merged;
    merged.reserve(a.size() + b.size());
    std::set_union(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(merged));
    return merged;
}

std::optional<double> fold(Opcode op, double lhs, double rhs) {
    double value = 0.0;
    switch (op) {
        case Opcode::Add:
            value = lhs + rhs;
            break;
        case Opcode::Subtract:
            value = lhs - rhs;
            break;
        case Opcode::Multiply:
            value = lhs * rhs;
            break;
        case Opcode::Divide:
            if (rhs == 0.0) {
                return std::nullopt;
            }
            value = lhs / rhs;
            break;
        case Opcode::Power:
            value = std::pow(lhs, rhs);
            break;
        default:
            return std::nullopt;
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

bool is_comparison(Opcode op) noexcept {
    switch (op) {
        case Opcode::Less:
        case Opcode::LessEqual:
        case Opcode::Greater:
        case Opcode::GreaterEqual:
        case Opcode::Equal:
        case Opcode::NotEqual:
            return true;
        default:
            return false;
    }
}

ExpressionGraph::ExpressionGraph() {
    zero_ = constant(0.0);
    one_ = constant(1.0);
}

NodeId ExpressionGraph::intern(const NodeKey& key, GraphNode node, std::vector<SymbolId> dependencies) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        return it->second;
    }
    const auto id = static_cast<NodeId>(nodes_.size());
    nodes_.push_back(std::move(node));
    dependencies_.push_back(std::move(dependencies));
    index_.emplace(key, id);
    return id;
}

NodeId ExpressionGraph::constant(double value) {
    if (value == 0.0) {
        value = 0.0;  // -0 and 0 share a node
    }
    const NodeKey key{kConstantTag, Opcode::Negate, 0, 0, value, SymbolKind::Endogenous, 0, 0};
    return intern(key, ConstantNode{value}, {});
}

NodeId ExpressionGraph::symbol(const SymbolId& id) {
    const NodeKey key{kSymbolTag, Opcode::Negate, 0, 0, 0.0, id.kind(), id.number(), id.regime()};
    return intern(key, SymbolNode{id}, {id});
}

NodeId ExpressionGraph::unary(Opcode op, NodeId operand) {
    const auto value = constant_value(operand);
    if (op == Opcode::Negate) {
        if (value) {
            return constant(-*value);
        }
        if (const auto* inner = std::get_if<UnaryNode>(&node(operand)); inner != nullptr && inner->op == Opcode::Negate) {
            return inner->operand;
        }
    } else if (op == Opcode::Exp && value && *value == 0.0) {
        return one_;
    } else if (op == Opcode::Log && value && *value == 1.0) {
        return zero_;
    } else if (op >= Opcode::Add) {
        throw std::invalid_argument("binary opcode used as unary");
    }
    const NodeKey key{kUnaryTag, op, operand, 0, 0.0, SymbolKind::Endogenous, 0, 0};
    return intern(key, UnaryNode{op, operand}, dependencies(operand));
}

std::optional<NodeId> ExpressionGraph::simplify(Opcode op, NodeId lhs, NodeId rhs) {
    const auto a = constant_value(lhs);
    const auto b = constant_value(rhs);
    if (a && b) {
        if (auto folded = fold(op, *a, *b)) {
            return constant(*folded);
        }
    }
    switch (op) {
        case Opcode::Add:
            if (a && *a == 0.0) {
                return rhs;
            }
            if (b && *b == 0.0) {
                return lhs;
            }
            break;
        case Opcode::Subtract:
            if (b && *b == 0.0) {
                return lhs;
            }
            if (a && *a == 0.0) {
                return unary(Opcode::Negate, rhs);
            }
            if (lhs == rhs) {
                return zero_;
            }
            break;
        case Opcode::Multiply:
            if ((a && *a == 0.0) || (b && *b == 0.0)) {
                return zero_;
            }
            if (a && *a == 1.0) {
                return rhs;
            }
            if (b && *b == 1.0) {
                return lhs;
            }
            if (a && *a == -1.0) {
                return unary(Opcode::Negate, rhs);
            }
            if (b && *b == -1.0) {
                return unary(Opcode::Negate, lhs);
            }
            break;
        case Opcode::Divide:
            if (a && *a == 0.0) {
                return zero_;
            }
            if (b && *b == 1.0) {
                return lhs;
            }
            break;
        case Opcode::Power:
            if (b && *b == 0.0) {
                return one_;
            }
            if (b && *b == 1.0) {
                return lhs;
            }
            break;
        default:
            break;
    }
    return std::nullopt;
}

NodeId ExpressionGraph::binary(Opcode op, NodeId lhs, NodeId rhs) {
    if (op < Opcode::Add) {
        throw std::invalid_argument("unary opcode used as binary");
    }
    if (auto simplified = simplify(op, lhs, rhs)) {
        return *simplified;
    }
    const NodeKey key{kBinaryTag, op, lhs, rhs, 0.0, SymbolKind::Endogenous, 0, 0};
    return intern(key, BinaryNode{op, lhs, rhs}, merge(dependencies(lhs), dependencies(rhs)));
}

NodeId ExpressionGraph::build(const Expr& expr) {
    return std::visit(
        [&](const auto& item) -> NodeId {
            using T = std::decay_t<decltype(item)>;
            if constexpr (std::is_same_v<T, NumberLiteral>) {
                return constant(item.value);
            } else if constexpr (std::is_same_v<T, Reference>) {
                const auto id = SymbolId::parse(item.name);
                if (!id || item.shift != 0 || !item.qualifiers.empty()) {
                    throw std::invalid_argument("'" + to_string(item) + "' is outside the differentiation vocabulary");
                }
                return symbol(*id);
            } else if constexpr (std::is_same_v<T, SteadyStateCall>) {
                throw std::invalid_argument("steady_state() must be resolved before differentiation");
            } else if constexpr (std::is_same_v<T, FunctionCall>) {
                const Opcode op = opcode_of(item.function);
                if (item.arguments.size() == 2) {
                    const NodeId lhs = build(*item.arguments[0]);
                    return binary(op, lhs, build(*item.arguments[1]));
                }
                return unary(op, build(*item.arguments.front()));
            } else if constexpr (std::is_same_v<T, Negation>) {
                return unary(Opcode::Negate, build(*item.operand));
            } else {
                const NodeId lhs = build(*item.lhs);
                return binary(opcode_of(item.op), lhs, build(*item.rhs));
            }
        },
        expr.node);
}

const GraphNode& ExpressionGraph::node(NodeId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("node id out of range");
    }
    return nodes_[id];
}

std::optional<double> ExpressionGraph::constant_value(NodeId id) const {
    if (const auto* item = std::get_if<ConstantNode>(&node(id))) {
        return item->value;
    }
    return std::nullopt;
}

bool ExpressionGraph::is_constant(NodeId id, double value) const {
    const auto held = constant_value(id);
    return held && *held == value;
}

const std::vector<SymbolId>& ExpressionGraph::dependencies(NodeId id) const {
    if (id >= dependencies_.size()) {
        throw std::out_of_range("node id out of range");
    }
    return dependencies_[id];
}

bool ExpressionGraph::depends_on(NodeId id, const SymbolId& symbol) const {
    const auto& deps = dependencies(id);
    return std::binary_search(deps.begin(), deps.end(), symbol);
}

int ExpressionGraph::precedence(NodeId id) const {
    const auto& item = node(id);
    if (const auto* c = std::get_if<ConstantNode>(&item)) {
        return c->value < 0.0 ? kUnaryPrecedence : kAtomPrecedence;
    }
    if (const auto* u = std::get_if<UnaryNode>(&item)) {
        return u->op == Opcode::Negate ? kUnaryPrecedence : kAtomPrecedence;
    }
    if (const auto* b = std::get_if<BinaryNode>(&item)) {
        switch (b->op) {
            case Opcode::Add:
            case Opcode::Subtract:
                return kAdditivePrecedence;
            case Opcode::Multiply:
            case Opcode::Divide:
                return kMultiplicativePrecedence;
            case Opcode::Power:
                return kPowerPrecedence;
            case Opcode::Min:
            case Opcode::Max:
                return kAtomPrecedence;
            default:
                return kComparisonPrecedence;
        }
    }
    return kAtomPrecedence;
}

std::string ExpressionGraph::print(NodeId id) const {
    auto child = [&](NodeId sub, bool parenthesize) {
        std::string text = print(sub);
        return parenthesize ? "(" + text + ")" : text;
    };
    return std::visit(
        [&](const auto& item) -> std::string {
            using T = std::decay_t<decltype(item)>;
            if constexpr (std::is_same_v<T, ConstantNode>) {
                return format_number(item.value);
            } else if constexpr (std::is_same_v<T, SymbolNode>) {
                return item.symbol.render();
            } else if constexpr (std::is_same_v<T, UnaryNode>) {
                if (item.op == Opcode::Negate) {
                    return "-" + child(item.operand, precedence(item.operand) <= kUnaryPrecedence);
                }
                return function_name(item.op) + "(" + print(item.operand) + ")";
            } else {
                if (item.op == Opcode::Min || item.op == Opcode::Max) {
                    return function_name(item.op) + "(" + print(item.lhs) + "," + print(item.rhs) + ")";
                }
                const int own = precedence(id);
                const int left = precedence(item.lhs);
                const int right = precedence(item.rhs);
                bool left_paren = left < own;
                bool right_paren = right < own || right == kUnaryPrecedence;
                if (item.op == Opcode::Power) {
                    left_paren = left < kAtomPrecedence;
                    right_paren = right < kAtomPrecedence;
                } else if (right == own && (item.op == Opcode::Subtract || item.op == Opcode::Divide || is_comparison(item.op))) {
                    right_paren = true;
                }
                if (is_comparison(item.op)) {
                    left_paren = left <= own;
                }
                return child(item.lhs, left_paren) + operator_symbol(item.op) + child(item.rhs, right_paren);
            }
        },
        node(id));
}

}  // namespace libdsge
