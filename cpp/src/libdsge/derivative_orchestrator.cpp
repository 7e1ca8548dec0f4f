#include "libdsge/derivative_orchestrator.hpp"

#include "libdsge/dictionary_builder.hpp"
#include "libdsge/symbolic_differentiator.hpp"

#include <algorithm>
#include <chrono>
#include <ostream>

namespace libdsge {

namespace {

std::vector<std::string> structural_code(const ModelEquations& model,
                                         const ShadowWriter& shadow,
                                         ShadowForm form,
                                         bool insert_definitions) {
    std::vector<std::string> code;
    for (const auto& equation : model.equations) {
        if (equation.type == EquationType::Structural) {
            code.push_back(shadow.write(equation.residual, form, insert_definitions));
        }
    }
    return code;
}

std::vector<std::string> probability_code(const ModelEquations& model, const ShadowWriter& shadow, bool insert_definitions) {
    std::vector<std::string> code;
    for (const auto& equation : model.equations) {
        if (equation.type == EquationType::TimeVaryingProbability) {
            code.push_back(shadow.write(equation.residual, ShadowForm::Dynamic, insert_definitions));
        }
    }
    return code;
}

Routine function_routine(const std::string& name, std::vector<std::string> code) {
    return Routine{name, input_list(), {"residuals"}, std::move(code)};
}

std::vector<SymbolId> endogenous_range(std::size_t first, std::size_t count) {
    std::vector<SymbolId> wrt;
    wrt.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        wrt.push_back(SymbolId::endogenous(first + i));
    }
    return wrt;
}

// Differentiates and writes one progress line.
class VariantRunner {
public:
    explicit VariantRunner(std::ostream* log) : log_(log) {}

    DerivativeRoutine run(const std::string& name,
                          const std::vector<std::string>& equations,
                          const std::vector<SymbolId>& wrt,
                          std::size_t order) const {
        const auto start = std::chrono::steady_clock::now();
        auto routine = differentiate(name, equations, wrt, order);
        if (log_ != nullptr) {
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
            *log_ << "[libdsge] " << name << ": " << equations.size() << " equations, " << wrt.size()
                  << " variables, order " << order << ", " << elapsed.count() << " seconds\n";
        }
        return routine;
    }

    void note(const std::string& message) const {
        if (log_ != nullptr) {
            *log_ << "[libdsge] " << message << "\n";
        }
    }

private:
    std::ostream* log_;
};

}  // namespace

ModelFunctions model_functions(const ModelEquations& model, const ShadowWriter& shadow, bool insert_definitions) {
    ModelFunctions functions;
    functions.dynamic = function_routine("dynamic", structural_code(model, shadow, ShadowForm::Dynamic, insert_definitions));
    functions.static_model = function_routine("static", structural_code(model, shadow, ShadowForm::Static, insert_definitions));
    functions.balanced_growth_path = function_routine(
        "balanced_growth_path", structural_code(model, shadow, ShadowForm::BalancedGrowthPath, insert_definitions));
    return functions;
}

std::string planner_loss_code(const PlannerObjective& planner,
                              const SymbolTable& symbols,
                              const ShadowWriter& shadow,
                              bool insert_definitions) {
    return shadow.write(substitute_log_vars(planner.loss, symbols), ShadowForm::Dynamic, insert_definitions);
}

ModelDerivatives differentiate_model(const ModelEquations& model,
                                     const ShadowWriter& shadow,
                                     const DifferentiationList& list,
                                     const std::optional<PlannerObjective>& planner,
                                     bool is_linear,
                                     const CompilerOptions& options) {
    options.validate();
    const VariantRunner runner(options.log);
    const bool inserted = options.definitions_inserted;
    const std::size_t n = model.symbols.endogenous().size();

    ModelDerivatives derivatives;
    const auto dynamic = structural_code(model, shadow, ShadowForm::Dynamic, inserted);
    derivatives.dynamic = runner.run("dynamic_derivatives", dynamic, list.wrt, is_linear ? 1 : options.max_deriv_order);

    derivatives.static_model = runner.run("static_derivatives",
                                          structural_code(model, shadow, ShadowForm::Static, inserted),
                                          endogenous_range(1, n),
                                          1);

    if (!options.stationary_model.value_or(false)) {
        derivatives.balanced_growth_path = runner.run("balanced_growth_path_derivatives",
                                                      structural_code(model, shadow, ShadowForm::BalancedGrowthPath, inserted),
                                                      endogenous_range(1, 2 * n),
                                                      1);
    }

    if (options.parameter_differentiation) {
        std::vector<SymbolId> wrt;
        for (std::size_t p = 1; p <= model.symbols.parameters().size(); ++p) {
            wrt.push_back(SymbolId::parameter(p));
        }
        auto equations = dynamic;
        if (!inserted && shadow.definition_count() > 0) {
            if (options.definitions_in_param_differentiation) {
                equations = structural_code(model, shadow, ShadowForm::Dynamic, true);
            } else {
                runner.note("definitions are not used in the differentiation with respect to parameters");
            }
        }
        derivatives.parameters = runner.run("parameter_derivatives", equations, wrt, 1);
    }

    if (planner) {
        std::vector<SymbolId> wrt;
        for (std::size_t v = 0; v < n; ++v) {
            const int number = model.after_reordering.lead_lag(static_cast<Eigen::Index>(v), 1);
            wrt.push_back(SymbolId::endogenous(static_cast<std::size_t>(number)));
        }
        const auto loss = planner_loss_code(*planner, model.symbols, shadow, inserted);
        derivatives.planner = runner.run("planner_derivatives", {loss}, wrt, 2);
    }

    const auto& chains = model.symbols.markov_chains();
    if (std::any_of(chains.begin(), chains.end(), [](const MarkovChain& chain) { return chain.is_endogenous; })) {
        derivatives.probabilities = runner.run("probability_derivatives",
                                               probability_code(model, shadow, inserted),
                                               list.wrt,
                                               options.max_deriv_order);
    }
    return derivatives;
}

}  // namespace libdsge
