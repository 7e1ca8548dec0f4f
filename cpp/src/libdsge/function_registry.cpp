#include "libdsge/function_registry.hpp"

#include <stdexcept>

namespace libdsge {

std::optional<MathFunction> FunctionRegistry::find(const std::string& name) {
    if (name == "exp") {
        return MathFunction::Exp;
    }
    if (name == "log" || name == "ln") {
        return MathFunction::Log;
    }
    if (name == "log10") {
        return MathFunction::Log10;
    }
    if (name == "sqrt") {
        return MathFunction::Sqrt;
    }
    if (name == "abs") {
        return MathFunction::Abs;
    }
    if (name == "sign") {
        return MathFunction::Sign;
    }
    if (name == "sin") {
        return MathFunction::Sin;
    }
    if (name == "cos") {
        return MathFunction::Cos;
    }
    if (name == "tan") {
        return MathFunction::Tan;
    }
    if (name == "asin") {
        return MathFunction::Asin;
    }
    if (name == "acos") {
        return MathFunction::Acos;
    }
    if (name == "atan") {
        return MathFunction::Atan;
    }
    if (name == "sinh") {
        return MathFunction::Sinh;
    }
    if (name == "cosh") {
        return MathFunction::Cosh;
    }
    if (name == "tanh") {
        return MathFunction::Tanh;
    }
    if (name == "normcdf") {
        return MathFunction::NormCdf;
    }
    if (name == "normpdf") {
        return MathFunction::NormPdf;
    }
    if (name == "erf") {
        return MathFunction::Erf;
    }
    if (name == "min") {
        return MathFunction::Min;
    }
    if (name == "max") {
        return MathFunction::Max;
    }
    return std::nullopt;
}

std::string FunctionRegistry::name(MathFunction function) {
    switch (function) {
        case MathFunction::Exp:
            return "exp";
        case MathFunction::Log:
            return "log";
        case MathFunction::Log10:
            return "log10";
        case MathFunction::Sqrt:
            return "sqrt";
        case MathFunction::Abs:
            return "abs";
        case MathFunction::Sign:
            return "sign";
        case MathFunction::Sin:
            return "sin";
        case MathFunction::Cos:
            return "cos";
        case MathFunction::Tan:
            return "tan";
        case MathFunction::Asin:
            return "asin";
        case MathFunction::Acos:
            return "acos";
        case MathFunction::Atan:
            return "atan";
        case MathFunction::Sinh:
            return "sinh";
        case MathFunction::Cosh:
            return "cosh";
        case MathFunction::Tanh:
            return "tanh";
        case MathFunction::NormCdf:
            return "normcdf";
        case MathFunction::NormPdf:
            return "normpdf";
        case MathFunction::Erf:
            return "erf";
        case MathFunction::Min:
            return "min";
        case MathFunction::Max:
            return "max";
    }
    throw std::invalid_argument("unknown math function");
}

std::size_t FunctionRegistry::arity(MathFunction function) noexcept {
    return (function == MathFunction::Min || function == MathFunction::Max) ? 2 : 1;
}

}  // namespace libdsge
