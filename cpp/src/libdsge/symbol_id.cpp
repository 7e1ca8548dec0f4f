#include "libdsge/symbol_id.hpp"

#include <charconv>
#include <stdexcept>

namespace libdsge {

namespace {
std::optional<std::size_t> parse_number(std::string_view text) {
    if (text.empty() || (text.size() > 1 && text.front() == '0')) {
        return std::nullopt;
    }
    std::size_t value = 0;
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}
}  // namespace

SymbolId::SymbolId(SymbolKind kind, std::size_t number, std::size_t regime)
    : kind_(kind), number_(number), regime_(regime) {
    if (kind == SymbolKind::RegimeState) {
        if (number > 1) {
            throw std::invalid_argument("regime state must be s0 or s1");
        }
    } else if (number == 0) {
        throw std::invalid_argument("symbol numbers are 1-based");
    }
    if (kind == SymbolKind::ParameterInRegime && regime == 0) {
        throw std::invalid_argument("regime numbers are 1-based");
    }
}

SymbolId SymbolId::endogenous(std::size_t number) {
    return SymbolId(SymbolKind::Endogenous, number);
}

SymbolId SymbolId::exogenous(std::size_t number) {
    return SymbolId(SymbolKind::Exogenous, number);
}

SymbolId SymbolId::steady_state(std::size_t number) {
    return SymbolId(SymbolKind::SteadyState, number);
}

SymbolId SymbolId::parameter(std::size_t number) {
    return SymbolId(SymbolKind::Parameter, number);
}

SymbolId SymbolId::definition(std::size_t number) {
    return SymbolId(SymbolKind::Definition, number);
}

SymbolId SymbolId::regime_state(std::size_t which) {
    return SymbolId(SymbolKind::RegimeState, which);
}

SymbolId SymbolId::parameter_in_regime(std::size_t number, std::size_t regime) {
    return SymbolId(SymbolKind::ParameterInRegime, number, regime);
}

std::string vocabulary_prefix(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Endogenous:
            return "y";
        case SymbolKind::Exogenous:
            return "x";
        case SymbolKind::SteadyState:
            return "ss";
        case SymbolKind::Parameter:
            return "param";
        case SymbolKind::Definition:
            return "def";
        case SymbolKind::RegimeState:
            return "s";
        case SymbolKind::ParameterInRegime:
            return "M";
    }
    throw std::invalid_argument("unknown symbol kind");
}

std::string SymbolId::render() const {
    if (kind_ == SymbolKind::RegimeState) {
        return "s" + std::to_string(number_);
    }
    std::string text = vocabulary_prefix(kind_) + "_" + std::to_string(number_);
    if (kind_ == SymbolKind::ParameterInRegime) {
        text += "_" + std::to_string(regime_);
    }
    return text;
}

std::optional<SymbolId> SymbolId::parse(std::string_view text) {
    if (text == "s0") {
        return regime_state(0);
    }
    if (text == "s1") {
        return regime_state(1);
    }
    const auto underscore = text.find('_');
    if (underscore == std::string_view::npos) {
        return std::nullopt;
    }
    const std::string_view prefix = text.substr(0, underscore);
    const std::string_view rest = text.substr(underscore + 1);

    if (prefix == "M") {
        const auto second = rest.find('_');
        if (second == std::string_view::npos) {
            return std::nullopt;
        }
        auto number = parse_number(rest.substr(0, second));
        auto regime = parse_number(rest.substr(second + 1));
        if (!number || !regime || *number == 0 || *regime == 0) {
            return std::nullopt;
        }
        return parameter_in_regime(*number, *regime);
    }

    auto number = parse_number(rest);
    if (!number || *number == 0) {
        return std::nullopt;
    }
    if (prefix == "y") {
        return endogenous(*number);
    }
    if (prefix == "x") {
        return exogenous(*number);
    }
    if (prefix == "ss") {
        return steady_state(*number);
    }
    if (prefix == "param") {
        return parameter(*number);
    }
    if (prefix == "def") {
        return definition(*number);
    }
    return std::nullopt;
}

const std::vector<std::string>& input_list() {
    static const std::vector<std::string> inputs{"y", "x", "ss", "param", "def", "s0", "s1"};
    return inputs;
}

std::vector<std::string> render_all(const std::vector<SymbolId>& symbols) {
    std::vector<std::string> names;
    names.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        names.push_back(symbol.render());
    }
    return names;
}

}  // namespace libdsge
