#include "libdsge/lexer.hpp"

#include "libdsge/errors.hpp"

#include <cctype>
#include <iterator>

namespace libdsge {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::vector<Token> tokenize(const SourceLine& line) {
    std::vector<Token> tokens;
    const std::string& source = line.text;
    auto push = [&](TokenKind kind, std::string text) {
        tokens.push_back(Token{kind, std::move(text), line.file, line.line});
    };

    for (std::size_t i = 0; i < source.size();) {
        const char ch = source[i];
        if (is_space(ch)) {
            ++i;
            continue;
        }

        if (is_identifier_start(ch)) {
            const std::size_t start = i;
            while (i < source.size() && is_identifier_char(source[i])) {
                ++i;
            }
            push(TokenKind::Identifier, source.substr(start, i - start));
            continue;
        }

        if (is_digit(ch) || (ch == '.' && i + 1 < source.size() && is_digit(source[i + 1]))) {
            const std::size_t start = i;
            while (i < source.size() && is_digit(source[i])) {
                ++i;
            }
            if (i < source.size() && source[i] == '.') {
                ++i;
                while (i < source.size() && is_digit(source[i])) {
                    ++i;
                }
            }
            if (i < source.size() && (source[i] == 'e' || source[i] == 'E')) {
                std::size_t j = i + 1;
                if (j < source.size() && (source[j] == '+' || source[j] == '-')) {
                    ++j;
                }
                if (j < source.size() && is_digit(source[j])) {
                    i = j;
                    while (i < source.size() && is_digit(source[i])) {
                        ++i;
                    }
                }
            }
            push(TokenKind::Number, source.substr(start, i - start));
            continue;
        }

        if (ch == '"') {
            const std::size_t start = ++i;
            while (i < source.size() && source[i] != '"') {
                ++i;
            }
            if (i >= source.size()) {
                throw ParseError("unterminated quoted name", line.file, line.line);
            }
            push(TokenKind::String, source.substr(start, i - start));
            ++i;
            continue;
        }

        if (i + 1 < source.size()) {
            const std::string pair = source.substr(i, 2);
            if (pair == "<=" || pair == ">=" || pair == "==" || pair == "!=" || pair == "~=") {
                push(TokenKind::Operator, pair == "~=" ? std::string("!=") : pair);
                i += 2;
                continue;
            }
        }

        switch (ch) {
            case '+':
            case '-':
            case '*':
            case '/':
            case '^':
            case '<':
            case '>':
            case '=':
                push(TokenKind::Operator, std::string(1, ch));
                ++i;
                continue;
            case '(':
            case ')':
            case '{':
            case '}':
            case ',':
            case ';':
            case '#':
                push(TokenKind::Punctuation, std::string(1, ch));
                ++i;
                continue;
            default:
                break;
        }
        throw ParseError(std::string("unexpected character '") + ch + "'", line.file, line.line);
    }
    return tokens;
}

std::vector<Token> tokenize(const std::vector<SourceLine>& lines) {
    std::vector<Token> tokens;
    for (const auto& line : lines) {
        auto part = tokenize(line);
        tokens.insert(tokens.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }
    return tokens;
}

std::vector<Token> tokenize(const std::string& text) {
    return tokenize(SourceLine{text, {}, 0});
}

}  // namespace libdsge
