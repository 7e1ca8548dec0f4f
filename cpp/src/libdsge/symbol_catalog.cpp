#include "libdsge/symbol_catalog.hpp"

#include <stdexcept>

namespace libdsge {

SymbolCatalog::SymbolCatalog(std::vector<std::string> names) {
    for (const auto& name : names) {
        if (index_.contains(name)) {
            throw std::invalid_argument("duplicate symbol name: " + name);
        }
        register_name(name);
    }
}

std::size_t SymbolCatalog::register_name(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("symbol name must be non-empty");
    }
    auto it = index_.find(name);
    if (it != index_.end()) {
        return it->second;
    }
    names_.push_back(name);
    const std::size_t idx = names_.size() - 1;
    index_.emplace(name, idx);
    return idx;
}

std::size_t SymbolCatalog::size() const noexcept {
    return names_.size();
}

bool SymbolCatalog::contains(const std::string& name) const noexcept {
    return index_.contains(name);
}

std::size_t SymbolCatalog::find_index(const std::string& name) const noexcept {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return npos;
    }
    return it->second;
}

const std::vector<std::string>& SymbolCatalog::names() const noexcept {
    return names_;
}

}  // namespace libdsge
