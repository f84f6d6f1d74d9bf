#include "lexer/lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace cfgjson {

// Checked in order: compound forms come before anything they could be
// mistaken for, and `true`/`false` before the identifier rule.
static constexpr std::array<std::pair<std::string_view, TokenType>, 11> keywords = {{
    {"struct{", TokenType::STRUCT_START},
    {"(list", TokenType::LIST_START},
    {"chr(", TokenType::CHR_START},
    {":=", TokenType::DEFINE},
    {";", TokenType::SEMICOLON},
    {"=", TokenType::ASSIGN},
    {",", TokenType::COMMA},
    {"}", TokenType::STRUCT_END},
    {")", TokenType::RPAREN},
    {"true", TokenType::BOOL_TRUE},
    {"false", TokenType::BOOL_FALSE},
}};

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

static bool is_hex_digit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

std::vector<std::string> splitBracketExpression(std::string_view text) {
    if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
        text = text.substr(1, text.size() - 2);
    }

    std::vector<std::string> words;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space(text[i])) {
            i++;
        }
        size_t start = i;
        while (i < text.size() && !is_space(text[i])) {
            i++;
        }
        if (i > start) {
            words.emplace_back(text.substr(start, i - start));
        }
    }
    return words;
}

bool isArithmeticOperator(std::string_view word) {
    return word == "+" || word == "-" || word == "*" || word == "/";
}

Lexer::Lexer(std::string source, std::string filename)
    : source_(std::move(source)), filename_(std::move(filename)) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next_token());
        if (tokens.back().type == TokenType::END_OF_FILE) {
            break;
        }
    }
    return tokens;
}

Token Lexer::next_token() {
    while (!at_end()) {
        char c = current();

        if (c == '#') {
            skip_line_comment();
            continue;
        }
        if (is_space(c)) {
            skip_whitespace();
            continue;
        }
        if (starts_with("{-")) {
            skip_block_comment();
            continue;
        }

        if (c == '[') {
            if (auto token = scan_bracket_expression()) {
                return *token;
            }
        }
        if (auto token = scan_keyword()) {
            return *token;
        }
        if (auto token = scan_identifier()) {
            return *token;
        }
        if (auto token = scan_number()) {
            return *token;
        }
        if (auto token = scan_string()) {
            return *token;
        }

        // Unrecognized characters are dropped without a diagnostic
        advance();
    }

    return make_token(TokenType::END_OF_FILE, "", line_, column_);
}

char Lexer::current() const {
    if (at_end()) return '\0';
    return source_[pos_];
}

char Lexer::advance() {
    char c = source_[pos_++];
    if (c == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    return c;
}

void Lexer::advance_by(size_t count) {
    for (size_t i = 0; i < count && !at_end(); i++) {
        advance();
    }
}

bool Lexer::at_end() const {
    return pos_ >= source_.size();
}

bool Lexer::starts_with(std::string_view text) const {
    return std::string_view(source_).substr(pos_).starts_with(text);
}

void Lexer::skip_line_comment() {
    while (!at_end() && current() != '\n') {
        advance();
    }
    if (!at_end()) {
        advance(); // newline
    }
}

void Lexer::skip_block_comment() {
    advance_by(2); // {-
    while (!at_end()) {
        if (starts_with("-}")) {
            advance_by(2);
            return;
        }
        advance();
    }
}

void Lexer::skip_whitespace() {
    while (!at_end() && is_space(current())) {
        advance();
    }
}

Token Lexer::make_token(TokenType type, std::string lexeme, size_t line, size_t column) const {
    Token token;
    token.type = type;
    token.lexeme = std::move(lexeme);
    token.location = {line, column, filename_};
    return token;
}

std::optional<Token> Lexer::scan_bracket_expression() {
    // Find the matching ']' by counting square brackets only
    int depth = 0;
    size_t end = pos_;
    for (; end < source_.size(); end++) {
        if (source_[end] == '[') {
            depth++;
        } else if (source_[end] == ']' && --depth == 0) {
            break;
        }
    }
    if (end == source_.size()) {
        return std::nullopt;
    }

    std::string lexeme = source_.substr(pos_, end - pos_ + 1);
    auto words = splitBracketExpression(lexeme);
    if (words.size() < 2 || !isArithmeticOperator(words.front())) {
        return std::nullopt;
    }

    size_t line = line_;
    size_t column = column_;
    advance_by(lexeme.size());
    return make_token(TokenType::BRACKET_EXPRESSION, std::move(lexeme), line, column);
}

std::optional<Token> Lexer::scan_keyword() {
    for (const auto& [pattern, type] : keywords) {
        if (starts_with(pattern)) {
            size_t line = line_;
            size_t column = column_;
            advance_by(pattern.size());
            return make_token(type, std::string(pattern), line, column);
        }
    }
    return std::nullopt;
}

std::optional<Token> Lexer::scan_identifier() {
    if (!is_identifier_start(current())) {
        return std::nullopt;
    }

    size_t line = line_;
    size_t column = column_;
    std::string id;
    while (!at_end() && is_identifier_char(current())) {
        id += advance();
    }
    return make_token(TokenType::IDENTIFIER, std::move(id), line, column);
}

std::optional<Token> Lexer::scan_number() {
    if (!is_digit(current())) {
        return std::nullopt;
    }

    size_t line = line_;
    size_t column = column_;
    std::string num;

    bool hex = current() == '0' && pos_ + 2 < source_.size() &&
               (source_[pos_ + 1] == 'x' || source_[pos_ + 1] == 'X') && is_hex_digit(source_[pos_ + 2]);
    if (hex) {
        num += advance(); // 0
        num += advance(); // x
        while (!at_end() && is_hex_digit(current())) {
            num += advance();
        }
        return make_token(TokenType::HEX, std::move(num), line, column);
    }

    while (!at_end() && is_digit(current())) {
        num += advance();
    }
    return make_token(TokenType::DECIMAL, std::move(num), line, column);
}

std::optional<Token> Lexer::scan_string() {
    char quote = current();
    if (quote != '"' && quote != '\'') {
        return std::nullopt;
    }

    // A quote preceded by a backslash does not close the string
    size_t end = pos_ + 1;
    while (end < source_.size() && !(source_[end] == quote && source_[end - 1] != '\\')) {
        end++;
    }
    if (end >= source_.size()) {
        // Unterminated: the opening quote is skipped as an unknown character
        return std::nullopt;
    }

    size_t line = line_;
    size_t column = column_;
    std::string lexeme = source_.substr(pos_, end - pos_ + 1);
    advance_by(lexeme.size());
    return make_token(TokenType::STRING, std::move(lexeme), line, column);
}

} // namespace cfgjson
