#include "parser/bracketExpression.hpp"

#include "lexer/lexer.hpp"
#include "parser/syntaxError.hpp"

#include <charconv>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

namespace cfgjson {

// Drops `_` digit separators. Each one must sit between two digits, or
// directly after a 0x prefix; false when a separator is misplaced.
static bool stripDigitSeparators(std::string_view digits, bool afterPrefix, std::string &out) {
	for (size_t i = 0; i < digits.size(); i++) {
		if (digits[i] != '_') {
			out += digits[i];
			continue;
		}
		bool leading = i == 0 && !afterPrefix;
		bool trailing = i + 1 == digits.size();
		if (leading || trailing || digits[i + 1] == '_') {
			return false;
		}
	}
	return true;
}

std::int64_t parseIntegerLiteral(std::string_view text, const Token &origin) {
	std::string_view digits = text;
	int base = 10;
	bool negative = false;
	if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
		base = 16;
		digits.remove_prefix(2);
	} else if (!digits.empty() && (digits[0] == '+' || digits[0] == '-')) {
		negative = digits[0] == '-';
		digits.remove_prefix(1);
	}
	if (digits.empty() || digits[0] == '+' || digits[0] == '-') {
		throw SyntaxError::at(origin, "arguments must be numeric");
	}

	std::string plain = negative ? "-" : "";
	if (!stripDigitSeparators(digits, base == 16, plain)) {
		throw SyntaxError::at(origin, "arguments must be numeric");
	}

	std::int64_t result = 0;
	const char *last = plain.data() + plain.size();
	auto [end, error] = std::from_chars(plain.data(), last, result, base);
	if (error == std::errc::result_out_of_range) {
		throw SyntaxError::at(origin, "integer out of range: " + std::string(text));
	}
	if (error != std::errc() || end != last) {
		throw SyntaxError::at(origin, "arguments must be numeric");
	}
	return result;
}

static Value resolveArgument(const std::string &word, const Token &token, const ConstantTable &constants) {
	if (const Value *bound = constants.lookup(word)) {
		return *bound;
	}
	return Value::integer(parseIntegerLiteral(word, token));
}

constexpr std::int64_t int64Min = std::numeric_limits<std::int64_t>::min();
constexpr std::int64_t int64Max = std::numeric_limits<std::int64_t>::max();

// The checked operations return false when the result does not fit in int64

static bool checkedAdd(std::int64_t lhs, std::int64_t rhs, std::int64_t &result) {
	if ((rhs > 0 && lhs > int64Max - rhs) || (rhs < 0 && lhs < int64Min - rhs)) {
		return false;
	}
	result = lhs + rhs;
	return true;
}

static bool checkedSubtract(std::int64_t lhs, std::int64_t rhs, std::int64_t &result) {
	if ((rhs < 0 && lhs > int64Max + rhs) || (rhs > 0 && lhs < int64Min + rhs)) {
		return false;
	}
	result = lhs - rhs;
	return true;
}

static bool checkedMultiply(std::int64_t lhs, std::int64_t rhs, std::int64_t &result) {
	if (lhs != 0 && rhs != 0) {
		bool overflow;
		if (lhs > 0) {
			overflow = rhs > 0 ? lhs > int64Max / rhs : rhs < int64Min / lhs;
		} else {
			overflow = rhs > 0 ? lhs < int64Min / rhs : rhs < int64Max / lhs;
		}
		if (overflow) {
			return false;
		}
	}
	result = lhs * rhs;
	return true;
}

// Floor division; the caller has excluded a zero divisor
static bool floorDivide(std::int64_t lhs, std::int64_t rhs, std::int64_t &result) {
	if (lhs == int64Min && rhs == -1) {
		return false;
	}
	result = lhs / rhs;
	if (lhs % rhs != 0 && ((lhs < 0) != (rhs < 0))) {
		result--;
	}
	return true;
}

Value evaluateBracketExpression(const Token &token, const ConstantTable &constants) {
	std::vector<std::string> words = splitBracketExpression(token.lexeme);
	if (words.size() < 2) {
		throw SyntaxError::at(token, "malformed expression: " + token.lexeme);
	}

	const std::string &op = words[0];
	if (!isArithmeticOperator(op)) {
		throw SyntaxError::at(token, "unknown operation: " + op);
	}

	Value first = resolveArgument(words[1], token, constants);
	if (words.size() == 2) {
		return first;
	}
	Value second = resolveArgument(words[2], token, constants);
	if (!first.isInteger() || !second.isInteger()) {
		throw SyntaxError::at(token, "arguments must be numeric: " + token.lexeme);
	}

	std::int64_t lhs = first.asInteger();
	std::int64_t rhs = second.asInteger();
	std::int64_t result = 0;
	bool overflow = false;
	switch (op[0]) {
	case '+':
		overflow = !checkedAdd(lhs, rhs, result);
		break;
	case '-':
		overflow = !checkedSubtract(lhs, rhs, result);
		break;
	case '*':
		overflow = !checkedMultiply(lhs, rhs, result);
		break;
	case '/':
		if (rhs != 0) {
			overflow = !floorDivide(lhs, rhs, result);
		}
		break;
	}
	if (overflow) {
		throw SyntaxError::at(token, "integer out of range: " + token.lexeme);
	}
	return Value::integer(result);
}

} // namespace cfgjson
