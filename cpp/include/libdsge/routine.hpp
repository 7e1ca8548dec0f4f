#pragma once

#include "libdsge/symbol_id.hpp"

#include <Eigen/Sparse>

#include <cstddef>
#include <string>
#include <vector>

namespace libdsge {

// Printed code handed to the numerical solvers. Each code line is either an
// expression (one output entry per line) or an assignment "target=expr".
struct Routine {
    std::string name;
    std::vector<std::string> argins;
    std::vector<std::string> argouts;
    std::vector<std::string> code;
};

// One equation reduced to the symbols it references.
struct SymbolicFunction {
    std::vector<std::string> arguments;
    std::string code;
};

struct DerivativeEntry {
    std::size_t equation{0};
    std::vector<std::size_t> wrt;  // non-decreasing positions in the wrt list
    std::string code;
};

using DerivativeIndex = Eigen::SparseMatrix<int, Eigen::RowMajor, std::ptrdiff_t>;

// Structurally nonzero derivatives of one order. index(e, c) is the 1-based
// position in entries of the derivative of equation e w.r.t. the tuple whose
// column-major flattening over wrt.size()^order is c.
struct DerivativeTensor {
    std::size_t order{0};
    std::vector<DerivativeEntry> entries;
    DerivativeIndex index;
};

struct DerivativeRoutine {
    std::string name;
    std::vector<std::string> argins;
    std::vector<SymbolId> wrt;
    std::vector<SymbolicFunction> functions;
    std::vector<DerivativeTensor> derivatives;  // derivatives[k - 1] holds order k
};

}  // namespace libdsge
