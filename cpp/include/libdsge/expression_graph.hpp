#pragma once

#include "libdsge/expression.hpp"
#include "libdsge/symbol_id.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace libdsge {

using NodeId = std::uint32_t;

enum class Opcode {
    Negate,
    Exp,
    Log,
    Log10,
    Sqrt,
    Abs,
    Sign,
    Sin,
    Cos,
    Tan,
    Asin,
    Acos,
    Atan,
    Sinh,
    Cosh,
    Tanh,
    NormCdf,
    NormPdf,
    Erf,
    Add,
    Subtract,
    Multiply,
    Divide,
    Power,
    Min,
    Max,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    Equal,
    NotEqual
};

struct ConstantNode {
    double value{0.0};
};

struct SymbolNode {
    SymbolId symbol;
};

struct UnaryNode {
    Opcode op;
    NodeId operand;
};

struct BinaryNode {
    Opcode op;
    NodeId lhs;
    NodeId rhs;
};

using GraphNode = std::variant<ConstantNode, SymbolNode, UnaryNode, BinaryNode>;

[[nodiscard]] bool is_comparison(Opcode op) noexcept;

// Arena of hash-consed nodes for one equation. Identical nodes share an id;
// arithmetic on constants is folded and neutral elements are dropped when a
// node is created.
class ExpressionGraph {
public:
    ExpressionGraph();

    NodeId constant(double value);

    NodeId symbol(const SymbolId& id);

    NodeId unary(Opcode op, NodeId operand);

    NodeId binary(Opcode op, NodeId lhs, NodeId rhs);

    // Graph of a printed expression over the evaluation vocabulary.
    NodeId build(const Expr& expr);

    [[nodiscard]] NodeId zero() const noexcept { return zero_; }

    [[nodiscard]] NodeId one() const noexcept { return one_; }

    [[nodiscard]] const GraphNode& node(NodeId id) const;

    [[nodiscard]] std::optional<double> constant_value(NodeId id) const;

    [[nodiscard]] bool is_constant(NodeId id, double value) const;

    // Sorted symbols the node depends on.
    [[nodiscard]] const std::vector<SymbolId>& dependencies(NodeId id) const;

    [[nodiscard]] bool depends_on(NodeId id, const SymbolId& symbol) const;

    [[nodiscard]] std::string print(NodeId id) const;

    [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }

private:
    struct NodeKey {
        int tag;
        Opcode op;
        NodeId lhs;
        NodeId rhs;
        double value;
        SymbolKind kind;
        std::size_t number;
        std::size_t regime;

        auto operator<=>(const NodeKey&) const = default;
    };

    NodeId intern(const NodeKey& key, GraphNode node, std::vector<SymbolId> dependencies);
    std::optional<NodeId> simplify(Opcode op, NodeId lhs, NodeId rhs);
    int precedence(NodeId id) const;

    std::vector<GraphNode> nodes_;
    std::vector<std::vector<SymbolId>> dependencies_;
    std::map<NodeKey, NodeId> index_;
    NodeId zero_;
    NodeId one_;
};

}  // namespace libdsge
