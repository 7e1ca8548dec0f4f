#pragma once

#include "libdsge/model_types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <string>
#include <vector>

namespace libdsge {

using BoolMatrix = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic>;

// structural equation x endogenous, one matrix per time shift
struct OccurrenceTensor {
    BoolMatrix lead;
    BoolMatrix current;
    BoolMatrix lag;
};

// lead_lag is endogenous x {lead, current, lag}; nonzero cells are numbered
// column-major from 1.
struct Incidence {
    OccurrenceTensor occurrence;
    Eigen::MatrixXi lead_lag;
};

struct VariableClassification {
    std::vector<bool> is_static;
    std::vector<bool> is_predetermined;
    std::vector<bool> is_pred_frwrd_looking;
    std::vector<bool> is_frwrd_looking;
    std::vector<bool> is_state;
};

// Occurrences of the structural equations only.
[[nodiscard]] OccurrenceTensor build_occurrence(const std::vector<Equation>& equations, std::size_t endogenous_count);

[[nodiscard]] Eigen::MatrixXi lead_lag_incidence(const OccurrenceTensor& occurrence);

// ModelError listing every variable without a current occurrence.
void check_current_appearance(const Eigen::MatrixXi& lead_lag, const std::vector<std::string>& names);

[[nodiscard]] Incidence make_incidence(const std::vector<Equation>& equations, const std::vector<std::string>& names);

// Column k of the result is column order[k] of the input.
[[nodiscard]] OccurrenceTensor permute_endogenous(const OccurrenceTensor& occurrence, const std::vector<std::size_t>& order);

// Positions of names sorted alphabetically.
[[nodiscard]] std::vector<std::size_t> alphabetical_order(const std::vector<std::string>& names);

[[nodiscard]] VariableClassification classify_variables(const Eigen::MatrixXi& lead_lag);

}  // namespace libdsge
