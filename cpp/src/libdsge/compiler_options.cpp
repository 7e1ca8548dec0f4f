#include "libdsge/compiler_options.hpp"

#include "libdsge/errors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace libdsge {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool parse_flag(const std::string& key, const std::string& value) {
    const auto text = lowercase(value);
    if (text == "true" || text == "1") {
        return true;
    }
    if (text == "false" || text == "0") {
        return false;
    }
    throw ConfigurationError("option '" + key + "' expects true or false, got '" + value + "'");
}

std::size_t parse_order(const std::string& key, const std::string& value) {
    // stoul skips leading blanks and wraps negative values
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigurationError("option '" + key + "' expects a positive integer, got '" + value + "'");
    }
    std::size_t consumed = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigurationError("option '" + key + "' expects a positive integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigurationError("option '" + key + "' expects a positive integer, got '" + value + "'");
    }
    return static_cast<std::size_t>(parsed);
}

}  // namespace

CompilerOptions CompilerOptions::from_pairs(const std::map<std::string, std::string>& pairs) {
    CompilerOptions options;
    for (const auto& [key, value] : pairs) {
        if (key == "parameter_differentiation") {
            options.parameter_differentiation = parse_flag(key, value);
        } else if (key == "definitions_inserted") {
            options.definitions_inserted = parse_flag(key, value);
        } else if (key == "definitions_in_param_differentiation") {
            options.definitions_in_param_differentiation = parse_flag(key, value);
        } else if (key == "max_deriv_order") {
            options.max_deriv_order = parse_order(key, value);
        } else if (key == "add_welfare") {
            options.add_welfare = parse_flag(key, value);
        } else if (key == "stationary_model") {
            if (!value.empty()) {
                options.stationary_model = parse_flag(key, value);
            }
        } else {
            throw ConfigurationError("unknown option '" + key + "'");
        }
    }
    options.validate();
    return options;
}

void CompilerOptions::validate() const {
    if (max_deriv_order < 1) {
        throw ConfigurationError("max_deriv_order must be at least 1");
    }
}

}  // namespace libdsge
