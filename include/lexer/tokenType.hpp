#pragma once

#include <string_view>

namespace cfgjson {

/**
 * @brief Token kinds of the configuration language
 *
 * Compound forms (`struct{`, `(list`, `chr(`, `:=` and whole bracket
 * expressions) are single tokens. A lone `(`, `{` or `]` has no kind of its
 * own: the lexer skips it like any other unrecognized character.
 */
enum class TokenType {
  // Literals & Identifiers
  IDENTIFIER,
  DECIMAL,
  HEX,
  STRING,
  BOOL_TRUE,
  BOOL_FALSE,

  // Compound openers
  LIST_START,   // (list
  STRUCT_START, // struct{
  CHR_START,    // chr(

  // Delimiters
  RPAREN,     // )
  STRUCT_END, // }
  ASSIGN,     // =
  DEFINE,     // :=
  COMMA,
  SEMICOLON,

  // `[op arg1 arg2]`, kept verbatim and evaluated by the parser
  BRACKET_EXPRESSION,

  END_OF_FILE
};

// Convert token type to string for diagnostics and token dumps
constexpr std::string_view tokenTypeToString(TokenType type) {
  switch (type) {
  case TokenType::IDENTIFIER:
    return "IDENTIFIER";
  case TokenType::DECIMAL:
    return "DECIMAL";
  case TokenType::HEX:
    return "HEX";
  case TokenType::STRING:
    return "STRING";
  case TokenType::BOOL_TRUE:
    return "TRUE";
  case TokenType::BOOL_FALSE:
    return "FALSE";
  case TokenType::LIST_START:
    return "LIST_START";
  case TokenType::STRUCT_START:
    return "STRUCT_START";
  case TokenType::CHR_START:
    return "CHR_START";
  case TokenType::RPAREN:
    return "RPAREN";
  case TokenType::STRUCT_END:
    return "STRUCT_END";
  case TokenType::ASSIGN:
    return "ASSIGN";
  case TokenType::DEFINE:
    return "DEFINE";
  case TokenType::COMMA:
    return "COMMA";
  case TokenType::SEMICOLON:
    return "SEMICOLON";
  case TokenType::BRACKET_EXPRESSION:
    return "BRACKET_EXPRESSION";
  case TokenType::END_OF_FILE:
    return "EOF";
  default:
    return "UNKNOWN";
  }
}

} // namespace cfgjson
