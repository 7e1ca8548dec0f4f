#pragma once

#include "libdsge/model_types.hpp"
#include "libdsge/routine.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace libdsge {

// Enumeration of the regimes: one row per regime, one column per
// non-constant chain, 1-based states, first chain varying slowest.
struct RegimeTable {
    std::vector<std::string> chain_names;
    Eigen::MatrixXi states;

    [[nodiscard]] std::size_t size() const noexcept { return static_cast<std::size_t>(states.rows()); }
};

[[nodiscard]] RegimeTable make_regime_table(const std::vector<MarkovChain>& chains);

// 1-based number of the first regime where chain (0 being the constant
// chain) is in the given 1-based state.
[[nodiscard]] std::size_t first_regime(const RegimeTable& regimes, std::size_t chain, std::size_t state);

struct TransitionProbabilityName {
    std::string chain;
    std::size_t from{0};
    std::size_t to{0};
};

// Splits "<chain>_tp_<i>_<j>"; nullopt for any other name.
[[nodiscard]] std::optional<TransitionProbabilityName> parse_transition_probability_name(const std::string& name);

// Regime transition matrix as "Q_r_s=..." lines, row major. probabilities maps
// a transition-probability name to its printed code; absent entries are zero
// and each diagonal entry is one minus the rest of its row.
[[nodiscard]] Routine transition_matrix_routine(const std::vector<MarkovChain>& chains,
                                                const RegimeTable& regimes,
                                                const std::map<std::string, std::string>& probabilities);

}  // namespace libdsge
