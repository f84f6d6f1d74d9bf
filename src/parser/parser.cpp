#include "parser/parser.hpp"

#include "parser/bracketExpression.hpp"
#include "parser/syntaxError.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace cfgjson {

// Strip the quotes and unescape \" and \'; other backslashes are kept
static std::string unquote(const std::string& lexeme) {
    std::string body = lexeme.substr(1, lexeme.size() - 2);
    for (std::string_view escape : {"\\\"", "\\'"}) {
        std::string out;
        size_t start = 0;
        size_t found;
        while ((found = body.find(escape, start)) != std::string::npos) {
            out.append(body, start, found - start);
            out += escape[1];
            start = found + escape.size();
        }
        out.append(body, start);
        body = std::move(out);
    }
    return body;
}

static bool is_valid_code_point(std::int64_t code) {
    return code >= 0 && code <= 0x10FFFF && !(code >= 0xD800 && code <= 0xDFFF);
}

static std::string encode_utf8(std::int64_t code) {
    auto cp = static_cast<std::uint32_t>(code);
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

namespace {

// Counts one level of nesting for the lifetime of a parse_list, parse_struct
// or parse_chr call
class NestingGuard {
public:
    NestingGuard(ParseContext& context, const Token& start) : context_(context) {
        if (context_.depth >= context_.maxDepth) {
            throw SyntaxError::at(start, "nesting too deep");
        }
        context_.depth++;
    }
    ~NestingGuard() { context_.depth--; }

    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

private:
    ParseContext& context_;
};

} // namespace

Parser::Parser(Lexer& lexer) : lexer_(lexer), current_(lexer.next_token()) {}

Document Parser::parse() {
    ParseContext context;
    return parse(context);
}

Document Parser::parse(ParseContext& context) {
    Document document;
    while (current_.type != TokenType::END_OF_FILE) {
        parse_statement(context, document);
        context.statementCount++;
    }
    return document;
}

void Parser::advance() {
    current_ = lexer_.next_token();
}

void Parser::eat(TokenType type) {
    if (current_.type != type) {
        throw SyntaxError::expected(tokenTypeToString(type), current_);
    }
    advance();
}

void Parser::skip_optional_semicolon() {
    if (current_.type == TokenType::SEMICOLON) {
        eat(TokenType::SEMICOLON);
    }
}

void Parser::parse_statement(ParseContext& context, Document& document) {
    if (current_.type == TokenType::SEMICOLON) {
        eat(TokenType::SEMICOLON);
        return;
    }

    if (current_.type != TokenType::IDENTIFIER) {
        // Only the last bare value survives
        document.set(std::string(bareValueKey), parse_value(context));
        return;
    }

    std::string name = current_.lexeme;
    eat(TokenType::IDENTIFIER);

    switch (current_.type) {
        case TokenType::DEFINE: {
            eat(TokenType::DEFINE);
            Value value = parse_value(context);
            context.constants.define(name, value);
            skip_optional_semicolon();
            document.set(name, std::move(value));
            break;
        }
        case TokenType::ASSIGN: {
            eat(TokenType::ASSIGN);
            Value value = parse_value(context);
            skip_optional_semicolon();
            document.set(name, std::move(value));
            break;
        }
        case TokenType::STRUCT_START:
            document.set(name, parse_struct(context));
            break;
        default:
            document.set(name, Value::identifier(name));
            break;
    }
}

Value Parser::parse_value(ParseContext& context) {
    Token token = current_;

    switch (token.type) {
        case TokenType::DECIMAL:
        case TokenType::HEX: {
            std::int64_t number = parseIntegerLiteral(token.lexeme, token);
            advance();
            return Value::integer(number);
        }
        case TokenType::STRING:
            advance();
            return Value::text(unquote(token.lexeme));
        case TokenType::BOOL_TRUE:
            advance();
            return Value::boolean(true);
        case TokenType::BOOL_FALSE:
            advance();
            return Value::boolean(false);
        case TokenType::IDENTIFIER: {
            advance();
            if (const Value* bound = context.constants.lookup(token.lexeme)) {
                return *bound;
            }
            return Value::identifier(token.lexeme);
        }
        case TokenType::LIST_START:
            return parse_list(context);
        case TokenType::STRUCT_START:
            return parse_struct(context);
        case TokenType::CHR_START:
            return parse_chr(context);
        case TokenType::BRACKET_EXPRESSION: {
            Value result = evaluateBracketExpression(token, context.constants);
            advance();
            return result;
        }
        default:
            throw SyntaxError::expected("value", token);
    }
}

Value Parser::parse_list(ParseContext& context) {
    NestingGuard nesting(context, current_);
    eat(TokenType::LIST_START);
    ValueList items;
    while (current_.type != TokenType::RPAREN && current_.type != TokenType::END_OF_FILE) {
        items.push_back(parse_value(context));
        if (current_.type == TokenType::COMMA) {
            eat(TokenType::COMMA);
        }
    }
    eat(TokenType::RPAREN);
    return Value::list(std::move(items));
}

Value Parser::parse_struct(ParseContext& context) {
    NestingGuard nesting(context, current_);
    eat(TokenType::STRUCT_START);
    ValueMap fields;
    while (current_.type != TokenType::STRUCT_END && current_.type != TokenType::END_OF_FILE) {
        // Anything that cannot start a field is dropped
        if (current_.type != TokenType::IDENTIFIER) {
            advance();
            continue;
        }

        std::string name = current_.lexeme;
        eat(TokenType::IDENTIFIER);
        eat(TokenType::ASSIGN);
        fields.set(name, parse_value(context));

        if (current_.type == TokenType::COMMA) {
            eat(TokenType::COMMA);
        }
    }
    eat(TokenType::STRUCT_END);
    return Value::structure(std::move(fields));
}

Value Parser::parse_chr(ParseContext& context) {
    Token start = current_;
    NestingGuard nesting(context, start);
    eat(TokenType::CHR_START);
    Value argument = parse_value(context);
    eat(TokenType::RPAREN);

    if (!argument.isInteger()) {
        return Value::text("?");
    }
    if (!is_valid_code_point(argument.asInteger())) {
        throw SyntaxError::at(start, "character code out of range: " + std::to_string(argument.asInteger()));
    }
    return Value::text(encode_utf8(argument.asInteger()));
}

Document parseDocument(const std::string& source, const std::string& filename) {
    Lexer lexer(source, filename);
    Parser parser(lexer);
    return parser.parse();
}

} // namespace cfgjson
