#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

namespace libdsge {

// Ordered name → position lookup for one family of symbols.
class SymbolCatalog {
public:
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    SymbolCatalog() = default;

    explicit SymbolCatalog(std::vector<std::string> names);

    // Returns the position of the name, registering it when new.
    std::size_t register_name(const std::string& name);

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] bool contains(const std::string& name) const noexcept;

    [[nodiscard]] std::size_t find_index(const std::string& name) const noexcept;

    [[nodiscard]] const std::vector<std::string>& names() const noexcept;

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace libdsge
