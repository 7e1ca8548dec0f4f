#include "libdsge/symbolic_differentiator.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

namespace libdsge {

Differentiator::Differentiator(ExpressionGraph& graph) : graph_(graph) {}

NodeId Differentiator::derivative(NodeId id, const SymbolId& wrt) {
    if (!graph_.depends_on(id, wrt)) {
        return graph_.zero();
    }
    const auto key = std::make_pair(id, wrt);
    if (auto it = memo_.find(key); it != memo_.end()) {
        return it->second;
    }
    // copy: interning new nodes may reallocate the arena
    const GraphNode item = graph_.node(id);
    NodeId result = graph_.zero();
    if (const auto* symbol = std::get_if<SymbolNode>(&item)) {
        result = symbol->symbol == wrt ? graph_.one() : graph_.zero();
    } else if (const auto* unary = std::get_if<UnaryNode>(&item)) {
        result = unary_derivative(id, *unary, wrt);
    } else if (const auto* binary = std::get_if<BinaryNode>(&item)) {
        result = binary_derivative(*binary, id, wrt);
    }
    memo_.emplace(key, result);
    return result;
}

NodeId Differentiator::unary_derivative(NodeId id, const UnaryNode& item, const SymbolId& wrt) {
    auto& g = graph_;
    const NodeId u = item.operand;
    const NodeId du = derivative(u, wrt);
    auto mul = [&](NodeId a, NodeId b) { return g.binary(Opcode::Multiply, a, b); };
    auto div = [&](NodeId a, NodeId b) { return g.binary(Opcode::Divide, a, b); };
    auto square = [&](NodeId a) { return g.binary(Opcode::Power, a, g.constant(2.0)); };
    auto one_minus_square = [&](NodeId a) { return g.binary(Opcode::Subtract, g.one(), square(a)); };

    switch (item.op) {
        case Opcode::Negate:
            return g.unary(Opcode::Negate, du);
        case Opcode::Exp:
            return mul(du, id);
        case Opcode::Log:
            return div(du, u);
        case Opcode::Log10:
            return div(du, mul(u, g.constant(std::numbers::ln10)));
        case Opcode::Sqrt:
            return div(du, mul(g.constant(2.0), id));
        case Opcode::Abs:
            return mul(g.unary(Opcode::Sign, u), du);
        case Opcode::Sign:
            return g.zero();
        case Opcode::Sin:
            return mul(g.unary(Opcode::Cos, u), du);
        case Opcode::Cos:
            return g.unary(Opcode::Negate, mul(g.unary(Opcode::Sin, u), du));
        case Opcode::Tan:
            return div(du, square(g.unary(Opcode::Cos, u)));
        case Opcode::Asin:
            return div(du, g.unary(Opcode::Sqrt, one_minus_square(u)));
        case Opcode::Acos:
            return g.unary(Opcode::Negate, div(du, g.unary(Opcode::Sqrt, one_minus_square(u))));
        case Opcode::Atan:
            return div(du, g.binary(Opcode::Add, g.one(), square(u)));
        case Opcode::Sinh:
            return mul(g.unary(Opcode::Cosh, u), du);
        case Opcode::Cosh:
            return mul(g.unary(Opcode::Sinh, u), du);
        case Opcode::Tanh:
            return mul(one_minus_square(id), du);
        case Opcode::NormCdf:
            return mul(g.unary(Opcode::NormPdf, u), du);
        case Opcode::NormPdf:
            return g.unary(Opcode::Negate, mul(mul(u, id), du));
        case Opcode::Erf: {
            const NodeId gauss = g.unary(Opcode::Exp, g.unary(Opcode::Negate, square(u)));
            return mul(mul(g.constant(2.0 * std::numbers::inv_sqrtpi), gauss), du);
        }
        default:
            throw std::invalid_argument("no derivative rule for unary opcode");
    }
}

NodeId Differentiator::binary_derivative(const BinaryNode& item, NodeId id, const SymbolId& wrt) {
    auto& g = graph_;
    const NodeId u = item.lhs;
    const NodeId v = item.rhs;
    if (is_comparison(item.op)) {
        return g.zero();
    }
    const NodeId du = derivative(u, wrt);
    const NodeId dv = derivative(v, wrt);
    auto add = [&](NodeId a, NodeId b) { return g.binary(Opcode::Add, a, b); };
    auto sub = [&](NodeId a, NodeId b) { return g.binary(Opcode::Subtract, a, b); };
    auto mul = [&](NodeId a, NodeId b) { return g.binary(Opcode::Multiply, a, b); };
    auto div = [&](NodeId a, NodeId b) { return g.binary(Opcode::Divide, a, b); };

    switch (item.op) {
        case Opcode::Add:
            return add(du, dv);
        case Opcode::Subtract:
            return sub(du, dv);
        case Opcode::Multiply:
            return add(mul(du, v), mul(u, dv));
        case Opcode::Divide: {
            if (!g.depends_on(v, wrt)) {
                return div(du, v);
            }
            const NodeId v_squared = g.binary(Opcode::Power, v, g.constant(2.0));
            return sub(div(du, v), div(mul(u, dv), v_squared));
        }
        case Opcode::Power: {
            const bool base_varies = g.depends_on(u, wrt);
            const bool exponent_varies = g.depends_on(v, wrt);
            if (!exponent_varies) {
                const NodeId reduced = g.binary(Opcode::Power, u, sub(v, g.one()));
                return mul(mul(v, reduced), du);
            }
            const NodeId log_u = g.unary(Opcode::Log, u);
            if (!base_varies) {
                return mul(mul(id, log_u), dv);
            }
            return mul(id, add(mul(dv, log_u), div(mul(v, du), u)));
        }
        case Opcode::Min:
            return add(mul(g.binary(Opcode::LessEqual, u, v), du), mul(g.binary(Opcode::Greater, u, v), dv));
        case Opcode::Max:
            return add(mul(g.binary(Opcode::GreaterEqual, u, v), du), mul(g.binary(Opcode::Less, u, v), dv));
        default:
            throw std::invalid_argument("no derivative rule for binary opcode");
    }
}

namespace {

std::ptrdiff_t flattened_column(const std::vector<std::size_t>& tuple, std::size_t n) {
    std::ptrdiff_t column = 0;
    std::ptrdiff_t stride = 1;
    for (std::size_t position : tuple) {
        column += static_cast<std::ptrdiff_t>(position) * stride;
        stride *= static_cast<std::ptrdiff_t>(n);
    }
    return column;
}

std::ptrdiff_t column_count(std::size_t n, std::size_t order) {
    std::ptrdiff_t columns = 1;
    const auto width = static_cast<std::ptrdiff_t>(std::max<std::size_t>(n, 1));
    for (std::size_t k = 0; k < order; ++k) {
        if (columns > std::numeric_limits<std::ptrdiff_t>::max() / width) {
            throw std::overflow_error("derivative index of order " + std::to_string(order) + " over " +
                                      std::to_string(n) + " variables does not fit");
        }
        columns *= width;
    }
    return n == 0 ? 0 : columns;
}

struct PendingDerivative {
    std::vector<std::size_t> wrt;
    NodeId node;
};

}  // namespace

DerivativeRoutine differentiate(const std::string& name,
                                const std::vector<std::string>& equations,
                                const std::vector<SymbolId>& wrt,
                                std::size_t order) {
    if (order == 0) {
        throw std::invalid_argument("derivative order must be at least 1");
    }
    DerivativeRoutine routine;
    routine.name = name;
    routine.argins = input_list();
    routine.wrt = wrt;
    routine.derivatives.resize(order);

    const std::size_t n = wrt.size();
    std::vector<std::vector<Eigen::Triplet<int, std::ptrdiff_t>>> triplets(order);
    std::vector<std::ptrdiff_t> columns(order);
    for (std::size_t k = 0; k < order; ++k) {
        routine.derivatives[k].order = k + 1;
        columns[k] = column_count(n, k + 1);
    }

    for (std::size_t e = 0; e < equations.size(); ++e) {
        ExpressionGraph graph;
        Differentiator differentiator(graph);
        const NodeId root = graph.build(*parse_expression(equations[e]));

        auto arguments = graph.dependencies(root);
        for (std::size_t which = 0; which < 2; ++which) {
            const auto state = SymbolId::regime_state(which);
            if (!std::binary_search(arguments.begin(), arguments.end(), state)) {
                arguments.insert(std::upper_bound(arguments.begin(), arguments.end(), state), state);
            }
        }
        routine.functions.push_back(SymbolicFunction{render_all(arguments), graph.print(root)});

        std::vector<PendingDerivative> previous{{{}, root}};
        for (std::size_t k = 0; k < order; ++k) {
            std::vector<PendingDerivative> current;
            for (const auto& pending : previous) {
                const std::size_t first = pending.wrt.empty() ? 0 : pending.wrt.back();
                for (std::size_t j = first; j < n; ++j) {
                    const NodeId d = differentiator.derivative(pending.node, wrt[j]);
                    if (graph.is_constant(d, 0.0)) {
                        continue;
                    }
                    auto tuple = pending.wrt;
                    tuple.push_back(j);
                    auto& tensor = routine.derivatives[k];
                    tensor.entries.push_back(DerivativeEntry{e, tuple, graph.print(d)});
                    triplets[k].emplace_back(static_cast<std::ptrdiff_t>(e), flattened_column(tuple, n),
                                             static_cast<int>(tensor.entries.size()));
                    current.push_back(PendingDerivative{std::move(tuple), d});
                }
            }
            previous = std::move(current);
        }
    }

    for (std::size_t k = 0; k < order; ++k) {
        auto& index = routine.derivatives[k].index;
        index.resize(static_cast<std::ptrdiff_t>(equations.size()), columns[k]);
        index.setFromTriplets(triplets[k].begin(), triplets[k].end());
    }
    return routine;
}

}  // namespace libdsge
