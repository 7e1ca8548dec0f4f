#include "libdsge/symbol_table.hpp"

#include "libdsge/errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace libdsge {

namespace {

constexpr const char* kLogPrefix = "LOG_";

std::string family_name(SymbolFamily family) {
    switch (family) {
        case SymbolFamily::Endogenous:
            return "endogenous variable";
        case SymbolFamily::Exogenous:
            return "exogenous variable";
        case SymbolFamily::Parameter:
            return "parameter";
        case SymbolFamily::Definition:
            return "definition";
    }
    return "symbol";
}

template <typename Symbol>
std::vector<std::string> names_of(const std::vector<Symbol>& symbols) {
    std::vector<std::string> names;
    names.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        names.push_back(symbol.name);
    }
    return names;
}

template <typename T>
T& checked_at(std::vector<T>& items, std::size_t index, const char* what) {
    if (index >= items.size()) {
        throw std::out_of_range(std::string(what) + " index out of range");
    }
    return items[index];
}

}  // namespace

SymbolTable::SymbolTable() {
    chains_.push_back(MarkovChain{"const", {}, 1, false});
    chain_catalog_ = SymbolCatalog({"const"});
}

std::optional<SymbolFamily> SymbolTable::family(const std::string& name) const {
    if (endogenous_catalog_.contains(name)) {
        return SymbolFamily::Endogenous;
    }
    if (exogenous_catalog_.contains(name)) {
        return SymbolFamily::Exogenous;
    }
    if (parameter_catalog_.contains(name)) {
        return SymbolFamily::Parameter;
    }
    if (definition_catalog_.contains(name)) {
        return SymbolFamily::Definition;
    }
    return std::nullopt;
}

std::size_t SymbolTable::find_endogenous(const std::string& name) const noexcept {
    return endogenous_catalog_.find_index(name);
}

std::size_t SymbolTable::find_exogenous(const std::string& name) const noexcept {
    return exogenous_catalog_.find_index(name);
}

std::size_t SymbolTable::find_parameter(const std::string& name) const noexcept {
    return parameter_catalog_.find_index(name);
}

std::size_t SymbolTable::find_definition(const std::string& name) const noexcept {
    return definition_catalog_.find_index(name);
}

std::size_t SymbolTable::find_observable(const std::string& name) const noexcept {
    return observable_catalog_.find_index(name);
}

std::size_t SymbolTable::find_chain(const std::string& name) const noexcept {
    return chain_catalog_.find_index(name);
}

std::size_t SymbolTable::find_log_var(const std::string& original) const noexcept {
    const auto index = endogenous_catalog_.find_index(kLogPrefix + original);
    if (index == npos || !endogenous_[index].is_log_var) {
        return npos;
    }
    return index;
}

std::vector<std::string> SymbolTable::original_names() const {
    std::vector<std::string> names;
    for (const auto& symbol : endogenous_) {
        if (symbol.is_original) {
            names.push_back(symbol.name);
        }
    }
    return names;
}

SymbolTableBuilder::SymbolTableBuilder() : chains_{MarkovChain{"const", {}, 1, false}} {}

SymbolTableBuilder::SymbolTableBuilder(const SymbolTable& previous)
    : endogenous_(previous.endogenous_),
      exogenous_(previous.exogenous_),
      parameters_(previous.parameters_),
      definitions_(previous.definitions()),
      observables_(previous.observables_),
      chains_(previous.chains_) {
    for (const auto& symbol : endogenous_) {
        claimed_.emplace(symbol.name, SymbolFamily::Endogenous);
    }
    for (const auto& symbol : exogenous_) {
        claimed_.emplace(symbol.name, SymbolFamily::Exogenous);
    }
    for (const auto& symbol : parameters_) {
        claimed_.emplace(symbol.name, SymbolFamily::Parameter);
    }
    for (const auto& name : definitions_) {
        claimed_.emplace(name, SymbolFamily::Definition);
    }
}

void SymbolTableBuilder::claim(const std::string& name, SymbolFamily family, const std::string& file, std::size_t line) {
    auto it = claimed_.find(name);
    if (it != claimed_.end()) {
        throw ParseError("'" + name + "' is already declared as a " + family_name(it->second), file, line);
    }
    if (name.empty()) {
        throw ParseError("empty symbol name", file, line);
    }
    claimed_.emplace(name, family);
}

std::size_t SymbolTableBuilder::add_endogenous(EndogenousSymbol symbol, const std::string& file, std::size_t line) {
    claim(symbol.name, SymbolFamily::Endogenous, file, line);
    if (symbol.tex_name.empty()) {
        symbol.tex_name = symbol.name;
    }
    endogenous_.push_back(std::move(symbol));
    return endogenous_.size() - 1;
}

std::size_t SymbolTableBuilder::add_exogenous(ExogenousSymbol symbol, const std::string& file, std::size_t line) {
    claim(symbol.name, SymbolFamily::Exogenous, file, line);
    if (symbol.tex_name.empty()) {
        symbol.tex_name = symbol.name;
    }
    exogenous_.push_back(std::move(symbol));
    return exogenous_.size() - 1;
}

std::size_t SymbolTableBuilder::add_parameter(ParameterSymbol symbol, const std::string& file, std::size_t line) {
    if (symbol.governing_chain >= chains_.size()) {
        throw std::out_of_range("governing chain index out of range");
    }
    claim(symbol.name, SymbolFamily::Parameter, file, line);
    if (symbol.tex_name.empty()) {
        symbol.tex_name = symbol.name;
    }
    symbol.is_switching = symbol.governing_chain != 0;
    chains_[symbol.governing_chain].parameters.push_back(symbol.name);
    parameters_.push_back(std::move(symbol));
    return parameters_.size() - 1;
}

std::size_t SymbolTableBuilder::add_definition(const std::string& name, const std::string& file, std::size_t line) {
    claim(name, SymbolFamily::Definition, file, line);
    definitions_.push_back(name);
    return definitions_.size() - 1;
}

std::size_t SymbolTableBuilder::add_observable(ObservableSymbol symbol, const std::string& file, std::size_t line) {
    for (const auto& existing : observables_) {
        if (existing.name == symbol.name) {
            throw ParseError("'" + symbol.name + "' is already declared as an observable", file, line);
        }
    }
    if (symbol.tex_name.empty()) {
        symbol.tex_name = symbol.name;
    }
    symbol.file = file;
    symbol.line = line;
    observables_.push_back(std::move(symbol));
    return observables_.size() - 1;
}

std::size_t SymbolTableBuilder::add_markov_chain(MarkovChain chain) {
    for (const auto& existing : chains_) {
        if (existing.name == chain.name) {
            throw std::invalid_argument("markov chain already registered: " + chain.name);
        }
    }
    chains_.push_back(std::move(chain));
    return chains_.size() - 1;
}

void SymbolTableBuilder::declare_log_var(const std::string& name, const std::string& file, std::size_t line) {
    auto it = claimed_.find(name);
    if (it == claimed_.end() || it->second != SymbolFamily::Endogenous) {
        throw ParseError("log variable '" + name + "' is not an endogenous variable", file, line);
    }
    const std::size_t index = find_endogenous(name);
    if (endogenous_[index].is_log_var) {
        throw ParseError("log variable '" + name + "' declared twice", file, line);
    }
    const std::string renamed = kLogPrefix + name;
    claim(renamed, SymbolFamily::Endogenous, file, line);
    claimed_.erase(name);
    auto& symbol = endogenous_[index];
    if (symbol.tex_name == symbol.name) {
        symbol.tex_name = renamed;
    }
    symbol.name = renamed;
    symbol.is_log_var = true;
}

EndogenousSymbol& SymbolTableBuilder::endogenous(std::size_t index) {
    return checked_at(endogenous_, index, "endogenous");
}

ExogenousSymbol& SymbolTableBuilder::exogenous(std::size_t index) {
    return checked_at(exogenous_, index, "exogenous");
}

ParameterSymbol& SymbolTableBuilder::parameter(std::size_t index) {
    return checked_at(parameters_, index, "parameter");
}

MarkovChain& SymbolTableBuilder::markov_chain(std::size_t index) {
    return checked_at(chains_, index, "markov chain");
}

std::size_t SymbolTableBuilder::find_endogenous(const std::string& name) const noexcept {
    for (std::size_t i = 0; i < endogenous_.size(); ++i) {
        if (endogenous_[i].name == name) {
            return i;
        }
    }
    return SymbolTable::npos;
}

void SymbolTableBuilder::reorder_endogenous(const std::vector<std::size_t>& order) {
    if (order.size() != endogenous_.size()) {
        throw std::invalid_argument("endogenous order has the wrong size");
    }
    std::vector<bool> used(order.size(), false);
    std::vector<EndogenousSymbol> reordered;
    reordered.reserve(order.size());
    for (auto old_index : order) {
        if (old_index >= order.size() || used[old_index]) {
            throw std::invalid_argument("endogenous order is not a permutation");
        }
        used[old_index] = true;
        reordered.push_back(endogenous_[old_index]);
    }
    endogenous_ = std::move(reordered);
}

SymbolTable SymbolTableBuilder::build() const {
    SymbolTable table;
    table.endogenous_ = endogenous_;
    table.exogenous_ = exogenous_;
    table.parameters_ = parameters_;
    table.chains_ = chains_;
    table.endogenous_catalog_ = SymbolCatalog(names_of(endogenous_));
    table.exogenous_catalog_ = SymbolCatalog(names_of(exogenous_));
    table.parameter_catalog_ = SymbolCatalog(names_of(parameters_));
    table.definition_catalog_ = SymbolCatalog(definitions_);
    table.chain_catalog_ = SymbolCatalog(names_of(chains_));

    for (auto& symbol : table.exogenous_) {
        symbol.is_observed = false;
    }
    for (auto observable : observables_) {
        std::size_t index = table.endogenous_catalog_.find_index(observable.name);
        if (index == SymbolTable::npos) {
            index = table.find_log_var(observable.name);
        }
        if (index != SymbolTable::npos) {
            observable.source = ObservableSource::Endogenous;
            observable.source_index = index;
            if (observable.tex_name == observable.name) {
                observable.tex_name = table.endogenous_[index].tex_name;
            }
        } else if ((index = table.exogenous_catalog_.find_index(observable.name)) != SymbolTable::npos) {
            observable.source = ObservableSource::Exogenous;
            observable.source_index = index;
            table.exogenous_[index].is_observed = true;
            if (observable.tex_name == observable.name) {
                observable.tex_name = table.exogenous_[index].tex_name;
            }
        } else {
            throw ParseError("observable '" + observable.name + "' is neither an endogenous nor an exogenous variable",
                             observable.file, observable.line);
        }
        table.observables_.push_back(std::move(observable));
    }
    table.observable_catalog_ = SymbolCatalog(names_of(table.observables_));
    return table;
}

}  // namespace libdsge
