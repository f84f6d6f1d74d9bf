#pragma once

#include "lexer/token.hpp"
#include "parser/parseContext.hpp"
#include "value/value.hpp"

#include <cstdint>
#include <string_view>

namespace cfgjson {

/**
 * Parse a decimal or `0x`/`0X` hexadecimal integer literal.
 *
 * Decimal literals may carry a leading sign. Throws SyntaxError located at
 * `origin` when the text is not a literal ("arguments must be numeric") or
 * does not fit in 64 bits ("integer out of range").
 */
std::int64_t parseIntegerLiteral(std::string_view text, const Token &origin);

/**
 * Evaluate a BRACKET_EXPRESSION token: `[op arg1]` or `[op arg1 arg2]`.
 *
 * Each argument is a bound constant or an integer literal. With a single
 * argument the operator is ignored and the argument is returned as-is.
 * Division floors and yields 0 for a zero divisor. Words after the second
 * argument are ignored.
 */
Value evaluateBracketExpression(const Token &token, const ConstantTable &constants);

} // namespace cfgjson
