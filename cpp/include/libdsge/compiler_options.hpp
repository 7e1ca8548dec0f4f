#pragma once

#include <cstddef>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>

namespace libdsge {

struct CompilerOptions {
    bool parameter_differentiation{false};
    bool definitions_inserted{false};
    bool definitions_in_param_differentiation{false};
    std::size_t max_deriv_order{2};  // dynamic model, at least 1
    bool add_welfare{false};
    std::optional<bool> stationary_model;  // unset: the growth path is computed

    std::ostream* log{nullptr};  // progress lines, off when null

    // Keys are the field names above; booleans accept true/false/1/0.
    [[nodiscard]] static CompilerOptions from_pairs(const std::map<std::string, std::string>& pairs);

    // ConfigurationError for out-of-range values.
    void validate() const;
};

}  // namespace libdsge
