#pragma once

#include "lexer/lexer.hpp"
#include "parser/parseContext.hpp"
#include "value/value.hpp"

#include <string>

namespace cfgjson {

/**
 * Recursive-descent parser with a single token of lookahead.
 *
 * Statements:
 *   `;`                  empty statement
 *   name := value [;]    binds a constant and a document entry
 *   name = value [;]     binds a document entry only
 *   name struct{...}     struct bound without an operator
 *   name                 bare name, bound to itself
 *   value                stored under `_value`
 *
 * Throws SyntaxError on the first mismatch; no partial document is returned.
 */
class Parser {
public:
    // Reads the first token immediately
    explicit Parser(Lexer& lexer);

    // Parse with a fresh context
    Document parse();

    // Parse using a caller-owned context (its constant table is filled in)
    Document parse(ParseContext& context);

private:
    Lexer& lexer_;
    Token current_;

    void advance();
    void eat(TokenType type);
    void skip_optional_semicolon();

    void parse_statement(ParseContext& context, Document& document);
    Value parse_value(ParseContext& context);
    Value parse_list(ParseContext& context);
    Value parse_struct(ParseContext& context);
    Value parse_chr(ParseContext& context);
};

// Lex and parse a whole source text
Document parseDocument(const std::string& source, const std::string& filename = "<stdin>");

} // namespace cfgjson
