#pragma once

#include "lexer/token.hpp"
#include "parser/diagnostic.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace cfgjson {

// Raised on the first structural mismatch; aborts the whole parse.
class SyntaxError : public std::runtime_error {
public:
  explicit SyntaxError(Diagnostic diagnostic)
      : std::runtime_error(diagnostic.toString()), diagnostic_(std::move(diagnostic)) {}

  // `expected` describes what the grammar wanted at `actual`'s position
  static SyntaxError expected(std::string_view expected, const Token &actual) {
    return SyntaxError(Diagnostic(std::string(expected), std::string(tokenTypeToString(actual.type)),
                                  actual.location.filename, actual.line(), actual.column()));
  }

  static SyntaxError at(const Token &token, std::string message) {
    return SyntaxError(Diagnostic(std::move(message), token.location.filename, token.line(), token.column()));
  }

  const Diagnostic &diagnostic() const { return diagnostic_; }
  size_t line() const { return diagnostic_.line; }
  size_t column() const { return diagnostic_.column; }

private:
  Diagnostic diagnostic_;
};

} // namespace cfgjson
