#pragma once

#include "libdsge/block_extractor.hpp"
#include "libdsge/symbol_table.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace libdsge {

// p[(chain,state)], value[, lower, upper[, prior]];
struct ParameterValue {
    std::size_t parameter{0};
    std::size_t chain{0};
    std::size_t state{1};
    double value{0.0};
    std::optional<double> lower;
    std::optional<double> upper;
    std::string prior;
    std::string file;
    std::size_t line{0};
};

[[nodiscard]] std::vector<ParameterValue> read_parameterization(const Block& block, const SymbolTable& symbols);

}  // namespace libdsge
