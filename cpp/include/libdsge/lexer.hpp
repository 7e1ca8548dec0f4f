#pragma once

#include "libdsge/source_text.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace libdsge {

enum class TokenKind {
    Identifier,
    Number,
    String,
    Operator,
    Punctuation
};

struct Token {
    TokenKind kind;
    std::string text;
    std::string file;
    std::size_t line{0};

    [[nodiscard]] bool is(TokenKind k, const char* value) const { return kind == k && text == value; }
};

// Tokenizes one source line. Throws ParseError on characters outside the grammar.
[[nodiscard]] std::vector<Token> tokenize(const SourceLine& line);

[[nodiscard]] std::vector<Token> tokenize(const std::vector<SourceLine>& lines);

// Tokenizes a free-standing expression (restrictions, shadow code).
[[nodiscard]] std::vector<Token> tokenize(const std::string& text);

}  // namespace libdsge
