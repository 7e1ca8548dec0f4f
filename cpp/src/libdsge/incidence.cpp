#include "libdsge/incidence.hpp"

#include "libdsge/errors.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace libdsge {

namespace {
constexpr Eigen::Index kLeadColumn = 0;
constexpr Eigen::Index kCurrentColumn = 1;
constexpr Eigen::Index kLagColumn = 2;
}  // namespace

OccurrenceTensor build_occurrence(const std::vector<Equation>& equations, std::size_t endogenous_count) {
    const auto rows = static_cast<Eigen::Index>(
        std::count_if(equations.begin(), equations.end(), [](const Equation& eq) { return eq.type == EquationType::Structural; }));
    const auto cols = static_cast<Eigen::Index>(endogenous_count);
    OccurrenceTensor occurrence{BoolMatrix::Constant(rows, cols, false),
                                BoolMatrix::Constant(rows, cols, false),
                                BoolMatrix::Constant(rows, cols, false)};

    Eigen::Index row = 0;
    for (const auto& equation : equations) {
        if (equation.type != EquationType::Structural) {
            continue;
        }
        for (const auto& item : equation.occurrences) {
            if (item.endogenous >= endogenous_count) {
                throw std::out_of_range("occurrence refers to an unknown endogenous variable");
            }
            const auto col = static_cast<Eigen::Index>(item.endogenous);
            if (item.shift > 0) {
                occurrence.lead(row, col) = true;
            } else if (item.shift < 0) {
                occurrence.lag(row, col) = true;
            } else {
                occurrence.current(row, col) = true;
            }
        }
        ++row;
    }
    return occurrence;
}

Eigen::MatrixXi lead_lag_incidence(const OccurrenceTensor& occurrence) {
    const Eigen::Index n = occurrence.current.cols();
    Eigen::MatrixXi lead_lag = Eigen::MatrixXi::Zero(n, 3);
    const BoolMatrix* shifts[] = {&occurrence.lead, &occurrence.current, &occurrence.lag};
    int counter = 0;
    for (Eigen::Index col = 0; col < 3; ++col) {
        for (Eigen::Index v = 0; v < n; ++v) {
            if (shifts[col]->col(v).any()) {
                lead_lag(v, col) = ++counter;
            }
        }
    }
    return lead_lag;
}

void check_current_appearance(const Eigen::MatrixXi& lead_lag, const std::vector<std::string>& names) {
    std::string missing;
    for (Eigen::Index v = 0; v < lead_lag.rows(); ++v) {
        if (lead_lag(v, kCurrentColumn) == 0) {
            missing += missing.empty() ? "" : ", ";
            missing += names.at(static_cast<std::size_t>(v));
        }
    }
    if (!missing.empty()) {
        throw ModelError("the following variables do not appear as current: " + missing);
    }
}

Incidence make_incidence(const std::vector<Equation>& equations, const std::vector<std::string>& names) {
    Incidence incidence;
    incidence.occurrence = build_occurrence(equations, names.size());
    incidence.lead_lag = lead_lag_incidence(incidence.occurrence);
    check_current_appearance(incidence.lead_lag, names);
    return incidence;
}

OccurrenceTensor permute_endogenous(const OccurrenceTensor& occurrence, const std::vector<std::size_t>& order) {
    const auto n = static_cast<std::size_t>(occurrence.current.cols());
    if (order.size() != n) {
        throw std::invalid_argument("endogenous order has the wrong size");
    }
    OccurrenceTensor permuted{BoolMatrix(occurrence.lead.rows(), occurrence.lead.cols()),
                              BoolMatrix(occurrence.current.rows(), occurrence.current.cols()),
                              BoolMatrix(occurrence.lag.rows(), occurrence.lag.cols())};
    for (std::size_t k = 0; k < n; ++k) {
        const auto to = static_cast<Eigen::Index>(k);
        const auto from = static_cast<Eigen::Index>(order[k]);
        permuted.lead.col(to) = occurrence.lead.col(from);
        permuted.current.col(to) = occurrence.current.col(from);
        permuted.lag.col(to) = occurrence.lag.col(from);
    }
    return permuted;
}

std::vector<std::size_t> alphabetical_order(const std::vector<std::string>& names) {
    std::vector<std::size_t> order(names.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return names[a] < names[b]; });
    return order;
}

VariableClassification classify_variables(const Eigen::MatrixXi& lead_lag) {
    const auto n = static_cast<std::size_t>(lead_lag.rows());
    VariableClassification result{std::vector<bool>(n),
                                  std::vector<bool>(n),
                                  std::vector<bool>(n),
                                  std::vector<bool>(n),
                                  std::vector<bool>(n)};
    for (std::size_t v = 0; v < n; ++v) {
        const auto row = static_cast<Eigen::Index>(v);
        const bool lead = lead_lag(row, kLeadColumn) > 0;
        const bool lag = lead_lag(row, kLagColumn) > 0;
        result.is_static[v] = !lead && !lag;
        result.is_predetermined[v] = !lead && lag;
        result.is_pred_frwrd_looking[v] = lead && lag;
        result.is_frwrd_looking[v] = lead && !lag;
        result.is_state[v] = lag;
    }
    return result;
}

}  // namespace libdsge
