#pragma once

#include "libdsge/symbol_id.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

namespace libdsge {

// Partition sizes: static, predetermined only, both predetermined and
// forward-looking, forward-looking only, shocks, endogenous, and the length
// of the v vector.
struct PartitionSizes {
    std::size_t ns{0};
    std::size_t np{0};
    std::size_t nb{0};
    std::size_t nf{0};
    std::size_t ne{0};
    std::size_t nd{0};
    std::size_t nv{0};
    std::size_t parameters{0};
};

// 1-based positions of each partition in v = [b+, f+, s0, p0, b0, f0, p-, b-, e0].
struct VLocations {
    std::vector<std::size_t> b_plus;
    std::vector<std::size_t> f_plus;
    std::vector<std::size_t> s_0;
    std::vector<std::size_t> p_0;
    std::vector<std::size_t> b_0;
    std::vector<std::size_t> f_0;
    std::vector<std::size_t> p_minus;
    std::vector<std::size_t> b_minus;
    std::vector<std::size_t> e_0;
    std::vector<std::size_t> bf_plus;
    std::vector<std::size_t> pb_minus;
    std::vector<std::size_t> t_0;
};

struct DifferentiationList {
    std::vector<SymbolId> wrt;
    PartitionSizes sizes;
    VLocations locations;
    std::vector<std::size_t> order_var;      // 1-based: static, pred, both, frwrd
    std::vector<std::size_t> inv_order_var;  // 1-based inverse of order_var
    std::vector<std::size_t> steady_state_index;  // variable of each y entry of wrt, 1-based
};

// Dynamic differentiation list from the lead/lag incidence: leads, currents and
// lags of the endogenous variables in order_var order, then the shocks, then
// the listed parameters.
[[nodiscard]] DifferentiationList solution_topology(const Eigen::MatrixXi& lead_lag,
                                                    std::size_t exogenous_count,
                                                    const std::vector<std::size_t>& parameters = {});

}  // namespace libdsge
