#pragma once

#include "libdsge/model_types.hpp"
#include "libdsge/symbol_catalog.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace libdsge {

enum class SymbolFamily {
    Endogenous,
    Exogenous,
    Parameter,
    Definition
};

// Frozen symbol table of one compilation phase. Tables are produced by
// SymbolTableBuilder; a later phase starts a builder from the previous
// generation and builds a new table.
class SymbolTable {
public:
    static constexpr std::size_t npos = SymbolCatalog::npos;

    // Table holding only the constant markov chain.
    SymbolTable();

    [[nodiscard]] const std::vector<EndogenousSymbol>& endogenous() const noexcept { return endogenous_; }

    [[nodiscard]] const std::vector<ExogenousSymbol>& exogenous() const noexcept { return exogenous_; }

    [[nodiscard]] const std::vector<ParameterSymbol>& parameters() const noexcept { return parameters_; }

    [[nodiscard]] const std::vector<ObservableSymbol>& observables() const noexcept { return observables_; }

    [[nodiscard]] const std::vector<std::string>& definitions() const noexcept { return definition_catalog_.names(); }

    [[nodiscard]] const std::vector<MarkovChain>& markov_chains() const noexcept { return chains_; }

    [[nodiscard]] std::optional<SymbolFamily> family(const std::string& name) const;

    [[nodiscard]] std::size_t find_endogenous(const std::string& name) const noexcept;

    [[nodiscard]] std::size_t find_exogenous(const std::string& name) const noexcept;

    [[nodiscard]] std::size_t find_parameter(const std::string& name) const noexcept;

    [[nodiscard]] std::size_t find_definition(const std::string& name) const noexcept;

    [[nodiscard]] std::size_t find_observable(const std::string& name) const noexcept;

    [[nodiscard]] std::size_t find_chain(const std::string& name) const noexcept;

    // Position of LOG_<name> when name was declared in log_vars.
    [[nodiscard]] std::size_t find_log_var(const std::string& original) const noexcept;

    [[nodiscard]] const std::vector<std::string>& endogenous_names() const noexcept { return endogenous_catalog_.names(); }

    [[nodiscard]] const std::vector<std::string>& exogenous_names() const noexcept { return exogenous_catalog_.names(); }

    [[nodiscard]] const std::vector<std::string>& parameter_names() const noexcept { return parameter_catalog_.names(); }

    // User-declared endogenous names after the log_vars renaming.
    [[nodiscard]] std::vector<std::string> original_names() const;

private:
    friend class SymbolTableBuilder;

    std::vector<EndogenousSymbol> endogenous_;
    std::vector<ExogenousSymbol> exogenous_;
    std::vector<ParameterSymbol> parameters_;
    std::vector<ObservableSymbol> observables_;
    std::vector<MarkovChain> chains_;
    SymbolCatalog endogenous_catalog_;
    SymbolCatalog exogenous_catalog_;
    SymbolCatalog parameter_catalog_;
    SymbolCatalog definition_catalog_;
    SymbolCatalog observable_catalog_;
    SymbolCatalog chain_catalog_;
};

class SymbolTableBuilder {
public:
    SymbolTableBuilder();

    explicit SymbolTableBuilder(const SymbolTable& previous);

    // Every add_* call rejects a name already used by any endogenous,
    // exogenous, parameter or definition symbol with a ParseError.
    std::size_t add_endogenous(EndogenousSymbol symbol, const std::string& file = {}, std::size_t line = 0);

    std::size_t add_exogenous(ExogenousSymbol symbol, const std::string& file = {}, std::size_t line = 0);

    std::size_t add_parameter(ParameterSymbol symbol, const std::string& file = {}, std::size_t line = 0);

    std::size_t add_definition(const std::string& name, const std::string& file = {}, std::size_t line = 0);

    // Observables are resolved against the variables when the table is built.
    std::size_t add_observable(ObservableSymbol symbol, const std::string& file = {}, std::size_t line = 0);

    std::size_t add_markov_chain(MarkovChain chain);

    // Renames x to LOG_x and flags it as a log variable.
    void declare_log_var(const std::string& name, const std::string& file = {}, std::size_t line = 0);

    [[nodiscard]] EndogenousSymbol& endogenous(std::size_t index);

    [[nodiscard]] ExogenousSymbol& exogenous(std::size_t index);

    [[nodiscard]] ParameterSymbol& parameter(std::size_t index);

    [[nodiscard]] MarkovChain& markov_chain(std::size_t index);

    [[nodiscard]] std::size_t find_endogenous(const std::string& name) const noexcept;

    // Position k of the new order holds the old endogenous order[k].
    void reorder_endogenous(const std::vector<std::size_t>& order);

    [[nodiscard]] SymbolTable build() const;

private:
    void claim(const std::string& name, SymbolFamily family, const std::string& file, std::size_t line);

    std::vector<EndogenousSymbol> endogenous_;
    std::vector<ExogenousSymbol> exogenous_;
    std::vector<ParameterSymbol> parameters_;
    std::vector<std::string> definitions_;
    std::vector<ObservableSymbol> observables_;
    std::vector<MarkovChain> chains_;
    std::unordered_map<std::string, SymbolFamily> claimed_;
};

}  // namespace libdsge
