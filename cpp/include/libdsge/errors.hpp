#pragma once

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

namespace libdsge {

// Structural error in the model text: unknown block, duplicate symbol,
// malformed statement, unresolved reference.
class ParseError : public std::invalid_argument {
public:
    ParseError(const std::string& message, std::string file, std::size_t line);

    [[nodiscard]] const std::string& file() const noexcept;

    [[nodiscard]] std::size_t line() const noexcept;

    [[nodiscard]] const std::string& detail() const noexcept;

private:
    std::string file_;
    std::size_t line_;
    std::string detail_;
};

// Semantic error in an otherwise well-formed model.
class ModelError : public std::invalid_argument {
public:
    static constexpr std::size_t no_equation = std::numeric_limits<std::size_t>::max();

    explicit ModelError(const std::string& message, std::size_t equation = no_equation);

    [[nodiscard]] std::size_t equation() const noexcept;

private:
    std::size_t equation_;
};

class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace libdsge
