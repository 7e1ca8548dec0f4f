#pragma once

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace libdsge {

enum class SymbolKind {
    Endogenous,
    Exogenous,
    SteadyState,
    Parameter,
    Definition,
    RegimeState,
    ParameterInRegime
};

// Typed name of an entry of the evaluation vocabulary. Numbers are the 1-based
// positions used in printed code: y_3 is the third entry of the y vector.
// Regime states are s0 (current regime) and s1 (next regime).
class SymbolId {
public:
    SymbolId(SymbolKind kind, std::size_t number, std::size_t regime = 0);

    [[nodiscard]] static SymbolId endogenous(std::size_t number);

    [[nodiscard]] static SymbolId exogenous(std::size_t number);

    [[nodiscard]] static SymbolId steady_state(std::size_t number);

    [[nodiscard]] static SymbolId parameter(std::size_t number);

    [[nodiscard]] static SymbolId definition(std::size_t number);

    [[nodiscard]] static SymbolId regime_state(std::size_t which);

    [[nodiscard]] static SymbolId parameter_in_regime(std::size_t number, std::size_t regime);

    [[nodiscard]] SymbolKind kind() const noexcept { return kind_; }

    [[nodiscard]] std::size_t number() const noexcept { return number_; }

    [[nodiscard]] std::size_t regime() const noexcept { return regime_; }

    [[nodiscard]] std::string render() const;

    // Inverse of render(); nullopt for text outside the vocabulary.
    [[nodiscard]] static std::optional<SymbolId> parse(std::string_view text);

    auto operator<=>(const SymbolId&) const = default;

private:
    SymbolKind kind_;
    std::size_t number_;
    std::size_t regime_;
};

// Argument names of every printed routine.
[[nodiscard]] const std::vector<std::string>& input_list();

[[nodiscard]] std::string vocabulary_prefix(SymbolKind kind);

[[nodiscard]] std::vector<std::string> render_all(const std::vector<SymbolId>& symbols);

}  // namespace libdsge
