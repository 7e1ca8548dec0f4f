#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace libdsge {

enum class MathFunction {
    Exp,
    Log,
    Log10,
    Sqrt,
    Abs,
    Sign,
    Sin,
    Cos,
    Tan,
    Asin,
    Acos,
    Atan,
    Sinh,
    Cosh,
    Tanh,
    NormCdf,
    NormPdf,
    Erf,
    Min,
    Max
};

class FunctionRegistry {
public:
    [[nodiscard]] static std::optional<MathFunction> find(const std::string& name);

    [[nodiscard]] static std::string name(MathFunction function);

    [[nodiscard]] static std::size_t arity(MathFunction function) noexcept;
};

}  // namespace libdsge
