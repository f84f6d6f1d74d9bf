#pragma once

#include "lexer/sourceLocation.hpp"
#include "lexer/tokenType.hpp"

#include <string>

namespace cfgjson {

struct Token {
    TokenType type = TokenType::END_OF_FILE;
    // Raw source text; quotes and brackets are kept for STRING and BRACKET_EXPRESSION
    std::string lexeme;
    SourceLocation location;

    size_t line() const { return location.line; }
    size_t column() const { return location.column; }
};

} // namespace cfgjson
