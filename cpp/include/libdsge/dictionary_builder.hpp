#pragma once

#include "libdsge/block_extractor.hpp"
#include "libdsge/expression.hpp"
#include "libdsge/symbol_table.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace libdsge {

struct Declaration {
    std::string name;
    std::string tex_name;
    std::string file;
    std::size_t line{0};
};

// Names separated by blanks or commas, each optionally followed by a quoted
// tex name.
[[nodiscard]] std::vector<Declaration> read_declarations(const Block& block);

// First symbol-table generation: variables, parameters with their governing
// chains, observables and log variables. Transition probabilities and
// measurement-error standard deviations are flagged from their names.
[[nodiscard]] SymbolTable build_dictionary(const BlockSet& blocks);

// Replaces every reference to the original name x of a log variable by
// exp(LOG_x), keeping the time shift.
[[nodiscard]] ExprPtr substitute_log_vars(const ExprPtr& expr, const SymbolTable& table);

}  // namespace libdsge
