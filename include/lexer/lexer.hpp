#pragma once

#include "lexer/token.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cfgjson {

class Lexer {
public:
    explicit Lexer(std::string source, std::string filename = "<stdin>");

    // Tokenize the entire source; the last token is always END_OF_FILE
    std::vector<Token> tokenize();

    // Get next token. Returns END_OF_FILE once the input is exhausted, and
    // keeps returning it on further calls.
    Token next_token();

    const std::string& filename() const { return filename_; }

private:
    std::string source_;
    std::string filename_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    char current() const;
    char advance();
    void advance_by(size_t count);
    bool at_end() const;
    bool starts_with(std::string_view text) const;

    void skip_line_comment();
    void skip_block_comment();
    void skip_whitespace();

    Token make_token(TokenType type, std::string lexeme, size_t line, size_t column) const;
    std::optional<Token> scan_bracket_expression();
    std::optional<Token> scan_keyword();
    std::optional<Token> scan_identifier();
    std::optional<Token> scan_number();
    std::optional<Token> scan_string();
};

// Whitespace-separated words between the outer brackets of a bracket
// expression: "[+ a  0x10]" -> {"+", "a", "0x10"}
std::vector<std::string> splitBracketExpression(std::string_view text);

bool isArithmeticOperator(std::string_view word);

} // namespace cfgjson
