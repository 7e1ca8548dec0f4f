#pragma once

#include "libdsge/expression_graph.hpp"
#include "libdsge/routine.hpp"
#include "libdsge/symbol_id.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace libdsge {

// Symbolic derivative pass over one equation's graph. Results are interned in
// the same graph, so higher orders reuse the nodes of lower ones.
class Differentiator {
public:
    explicit Differentiator(ExpressionGraph& graph);

    NodeId derivative(NodeId id, const SymbolId& wrt);

private:
    NodeId unary_derivative(NodeId id, const UnaryNode& item, const SymbolId& wrt);
    NodeId binary_derivative(const BinaryNode& item, NodeId id, const SymbolId& wrt);

    ExpressionGraph& graph_;
    std::map<std::pair<NodeId, SymbolId>, NodeId> memo_;
};

// Derivatives of orders 1..order of every equation w.r.t. wrt. Equations are
// printed code over the evaluation vocabulary; each is parsed into its own
// graph, which is discarded once its derivatives are printed.
[[nodiscard]] DerivativeRoutine differentiate(const std::string& name,
                                              const std::vector<std::string>& equations,
                                              const std::vector<SymbolId>& wrt,
                                              std::size_t order);

}  // namespace libdsge
