#include "libdsge/differentiation_list.hpp"

#include "libdsge/incidence.hpp"

#include <numeric>
#include <stdexcept>

namespace libdsge {

namespace {

std::vector<std::size_t> positions(std::size_t& cursor, std::size_t count) {
    std::vector<std::size_t> result(count);
    std::iota(result.begin(), result.end(), cursor + 1);
    cursor += count;
    return result;
}

std::vector<std::size_t> concat(const std::vector<std::size_t>& a, const std::vector<std::size_t>& b) {
    std::vector<std::size_t> result(a);
    result.insert(result.end(), b.begin(), b.end());
    return result;
}

}  // namespace

DifferentiationList solution_topology(const Eigen::MatrixXi& lead_lag,
                                      std::size_t exogenous_count,
                                      const std::vector<std::size_t>& parameters) {
    if (lead_lag.size() > 0 && lead_lag.cols() != 3) {
        throw std::invalid_argument("lead/lag incidence must have three columns");
    }
    const auto classification = classify_variables(lead_lag);
    const auto n = static_cast<std::size_t>(lead_lag.rows());

    DifferentiationList list;
    std::vector<std::size_t> stat, pred, both, frwrd;
    for (std::size_t v = 0; v < n; ++v) {
        if (classification.is_static[v]) {
            stat.push_back(v + 1);
        } else if (classification.is_predetermined[v]) {
            pred.push_back(v + 1);
        } else if (classification.is_pred_frwrd_looking[v]) {
            both.push_back(v + 1);
        } else {
            frwrd.push_back(v + 1);
        }
    }
    list.order_var = concat(concat(stat, pred), concat(both, frwrd));
    list.inv_order_var.resize(n);
    for (std::size_t k = 0; k < n; ++k) {
        list.inv_order_var[list.order_var[k] - 1] = k + 1;
    }

    auto& siz = list.sizes;
    siz.ns = stat.size();
    siz.np = pred.size();
    siz.nb = both.size();
    siz.nf = frwrd.size();
    siz.ne = exogenous_count;
    siz.nd = n;
    siz.parameters = parameters.size();

    auto& loc = list.locations;
    std::size_t cursor = 0;
    loc.b_plus = positions(cursor, siz.nb);
    loc.f_plus = positions(cursor, siz.nf);
    loc.s_0 = positions(cursor, siz.ns);
    loc.p_0 = positions(cursor, siz.np);
    loc.b_0 = positions(cursor, siz.nb);
    loc.f_0 = positions(cursor, siz.nf);
    loc.p_minus = positions(cursor, siz.np);
    loc.b_minus = positions(cursor, siz.nb);
    loc.e_0 = positions(cursor, siz.ne);
    siz.nv = cursor;
    loc.bf_plus = concat(loc.b_plus, loc.f_plus);
    loc.pb_minus = concat(loc.p_minus, loc.b_minus);
    loc.t_0 = concat(concat(loc.s_0, loc.p_0), concat(loc.b_0, loc.f_0));

    // column-major over lead_lag(order_var, :)
    for (Eigen::Index col = 0; col < lead_lag.cols(); ++col) {
        for (std::size_t variable : list.order_var) {
            const int number = lead_lag(static_cast<Eigen::Index>(variable - 1), col);
            if (number > 0) {
                list.wrt.push_back(SymbolId::endogenous(static_cast<std::size_t>(number)));
                list.steady_state_index.push_back(variable);
            }
        }
    }
    for (std::size_t x = 1; x <= exogenous_count; ++x) {
        list.wrt.push_back(SymbolId::exogenous(x));
    }
    for (std::size_t p : parameters) {
        list.wrt.push_back(SymbolId::parameter(p));
    }
    return list;
}

}  // namespace libdsge
