#include "libdsge/errors.hpp"

#include <utility>

namespace libdsge {

namespace {
std::string located(const std::string& message, const std::string& file, std::size_t line) {
    if (file.empty()) {
        return "line " + std::to_string(line) + ": " + message;
    }
    return file + ":" + std::to_string(line) + ": " + message;
}

std::string with_equation(const std::string& message, std::size_t equation) {
    if (equation == ModelError::no_equation) {
        return message;
    }
    // equation numbers are reported 1-based like the model file
    return "equation (" + std::to_string(equation + 1) + ") " + message;
}
}  // namespace

ParseError::ParseError(const std::string& message, std::string file, std::size_t line)
    : std::invalid_argument(located(message, file, line)),
      file_(std::move(file)),
      line_(line),
      detail_(message) {}

const std::string& ParseError::file() const noexcept {
    return file_;
}

std::size_t ParseError::line() const noexcept {
    return line_;
}

const std::string& ParseError::detail() const noexcept {
    return detail_;
}

ModelError::ModelError(const std::string& message, std::size_t equation)
    : std::invalid_argument(with_equation(message, equation)), equation_(equation) {}

std::size_t ModelError::equation() const noexcept {
    return equation_;
}

}  // namespace libdsge
