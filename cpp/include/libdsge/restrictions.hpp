#pragma once

#include "libdsge/block_extractor.hpp"
#include "libdsge/expression.hpp"
#include "libdsge/markov_chains.hpp"
#include "libdsge/symbol_table.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace libdsge {

// Names the restriction engine resolves against. governing_chain[i] is 0
// for the constant chain and k for column k - 1 of the regime table.
struct RestrictionContext {
    std::vector<std::string> endogenous_names;
    std::vector<std::string> parameter_names;
    std::vector<std::size_t> governing_chain;
    RegimeTable regimes;
};

[[nodiscard]] RestrictionContext make_restriction_context(const SymbolTable& symbols, const RegimeTable& regimes);

// True when the restriction contains '<' or '>'.
[[nodiscard]] bool is_inequality(const std::string& restriction);

// Rewrites coef(eqtn,vbl,lag[,chain,state]) and a<lag>(eqtn,vbl[,chain,state])
// into <a|b><|lag|>_<eqtn>_<vbl>[(chain,state)], "a" for lags (lag >= 0)
// and "b" for leads. eqtn and vbl are 1-based positions or endogenous names.
[[nodiscard]] ExprPtr normalize_coefficients(const ExprPtr& expr,
                                             const std::vector<std::string>& endogenous_names,
                                             const std::string& file = {},
                                             std::size_t line = 0);

[[nodiscard]] std::string normalize_restriction(const std::string& restriction, const std::vector<std::string>& endogenous_names);

// g(M)>=0, g(M)>0 or g(M)=0 over parameters by regime M_i_j.
struct NonlinearRestriction {
    std::string original;
    std::string code;
    bool is_strict{false};
    bool is_equality{false};
};

// p = h(...) with p absent from h: M_parameter_regime = code.
struct DerivedParameter {
    std::string original;
    std::size_t parameter{0};
    std::size_t regime{1};
    std::string code;
};

struct NonlinearRestrictions {
    std::vector<NonlinearRestriction> restrictions;
    std::vector<DerivedParameter> derived;
};

// Resolves p and p(chain,state) to M_i_j, j being the first regime where the
// chain is in that state (regime 1 when unqualified).
[[nodiscard]] NonlinearRestrictions nonlinear_restrictions_engine(const RestrictionContext& context,
                                                                  const std::vector<std::string>& restrictions);

struct RestrictionSetup {
    std::vector<std::string> linear;
    NonlinearRestrictions nonlinear;
};

// Separates the inequalities from the linear restrictions and runs them
// through the engine. A derived parameter is a ConfigurationError here.
[[nodiscard]] RestrictionSetup setup_nonlinear_restrictions(const std::vector<std::string>& restrictions,
                                                            const RestrictionContext& context);

struct ParameterRestrictions {
    std::vector<std::string> linear;
    std::vector<NonlinearRestriction> nonlinear;
    std::vector<DerivedParameter> derived;
};

// parameter_restrictions block; derived parameters are allowed.
[[nodiscard]] ParameterRestrictions compile_parameter_restrictions(const Block& block, const RestrictionContext& context);

}  // namespace libdsge
