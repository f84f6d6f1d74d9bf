#include <gtest/gtest.h>

#include "lexer/lexer.hpp"
#include "parser/parser.hpp"
#include "parser/syntaxError.hpp"

#include <string>

using namespace cfgjson;

namespace {

Document parse(const std::string& source) {
    return parseDocument(source, "<test>");
}

// Runs the parser and returns the syntax error it raises
SyntaxError parseError(const std::string& source) {
    try {
        parse(source);
    } catch (const SyntaxError& e) {
        return e;
    }
    ADD_FAILURE() << "no syntax error for: " << source;
    return SyntaxError(Diagnostic("no error"));
}

} // namespace

TEST(ParserTest, HexDefinition) {
    Document doc = parse("a := 0xFF");
    EXPECT_EQ(doc.at("a"), Value::integer(255));
}

TEST(ParserTest, ScalarAssignments) {
    Document doc = parse("n = 42; s = \"text\"; t = true; f = false;");

    EXPECT_EQ(doc.at("n"), Value::integer(42));
    EXPECT_EQ(doc.at("s"), Value::text("text"));
    EXPECT_EQ(doc.at("t"), Value::boolean(true));
    EXPECT_EQ(doc.at("f"), Value::boolean(false));
}

TEST(ParserTest, ConstantSubstitution) {
    Document doc = parse("port := 8080\nserver = struct{ port = port }");

    EXPECT_EQ(doc.at("port"), Value::integer(8080));
    EXPECT_EQ(doc.at("server").asStruct().at("port"), Value::integer(8080));
}

TEST(ParserTest, RedefinitionDoesNotChangeEarlierSubstitutions) {
    Document doc = parse("x := 1; a = x; x := 2; b = x");

    EXPECT_EQ(doc.at("a"), Value::integer(1));
    EXPECT_EQ(doc.at("b"), Value::integer(2));
    EXPECT_EQ(doc.at("x"), Value::integer(2));
    EXPECT_EQ(doc.keys(), (std::vector<std::string>{"x", "a", "b"}));
}

TEST(ParserTest, PlainAssignmentIsNotAConstant) {
    Document doc = parse("x = 5; y = x");
    EXPECT_EQ(doc.at("y"), Value::identifier("x"));
}

TEST(ParserTest, UndefinedNameBecomesIdentifier) {
    Document doc = parse("mode = production");
    EXPECT_EQ(doc.at("mode"), Value::identifier("production"));
}

TEST(ParserTest, ConstantsOwnedByCallerContext) {
    Lexer lexer("limit := [* 4 256]; other = 1", "<test>");
    Parser parser(lexer);
    ParseContext context;
    Document doc = parser.parse(context);

    ASSERT_NE(context.constants.lookup("limit"), nullptr);
    EXPECT_EQ(*context.constants.lookup("limit"), Value::integer(1024));
    EXPECT_FALSE(context.constants.contains("other"));
    EXPECT_EQ(context.statementCount, 2u);
    EXPECT_EQ(doc.size(), 2u);
}

TEST(ParserTest, ListLiteral) {
    Document doc = parse("l = (list 1,2,3)");
    EXPECT_EQ(doc.at("l"), Value::list({Value::integer(1), Value::integer(2), Value::integer(3)}));
}

TEST(ParserTest, ListToleratesTrailingAndMissingCommas) {
    Document doc = parse("a = (list 1, 2,)\nb = (list 1 2)\nc = (list)");

    EXPECT_EQ(doc.at("a").asList().size(), 2u);
    EXPECT_EQ(doc.at("b").asList().size(), 2u);
    EXPECT_TRUE(doc.at("c").asList().empty());
}

TEST(ParserTest, StructBoundWithoutOperator) {
    Document doc = parse("p struct{x=1,y=2}");

    const ValueMap& p = doc.at("p").asStruct();
    EXPECT_EQ(p.keys(), (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(p.at("x"), Value::integer(1));
    EXPECT_EQ(p.at("y"), Value::integer(2));
}

TEST(ParserTest, StructSkipsStrayTokens) {
    Document doc = parse("p = struct{ 5, x = 1 ; 'junk' y = 2, }");

    const ValueMap& p = doc.at("p").asStruct();
    EXPECT_EQ(p.keys(), (std::vector<std::string>{"x", "y"}));
}

TEST(ParserTest, NestedStructuresKeepOrder) {
    Document doc = parse(
        "cfg = struct{\n"
        "  name = 'svc',\n"
        "  items = (list struct{ b = 1, a = 2 }, (list true)),\n"
        "}\n");

    const ValueMap& cfg = doc.at("cfg").asStruct();
    EXPECT_EQ(cfg.keys(), (std::vector<std::string>{"name", "items"}));
    const ValueList& items = cfg.at("items").asList();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].asStruct().keys(), (std::vector<std::string>{"b", "a"}));
    EXPECT_EQ(items[1], Value::list({Value::boolean(true)}));
}

TEST(ParserTest, StringUnescaping) {
    Document doc = parse("a = \"a\\\"b\"\nb = 'it\\'s'\nc = 'back\\\\slash\\n'");

    EXPECT_EQ(doc.at("a").asText(), "a\"b");
    EXPECT_EQ(doc.at("b").asText(), "it's");
    EXPECT_EQ(doc.at("c").asText(), "back\\\\slash\\n");
}

TEST(ParserTest, CharacterConversion) {
    Document doc = parse("c := chr(65)\nsmile = chr(0x263A)\nq = chr('x')\nn := 66\nb = chr(n)");

    EXPECT_EQ(doc.at("c"), Value::text("A"));
    EXPECT_EQ(doc.at("smile"), Value::text("\xE2\x98\xBA"));
    EXPECT_EQ(doc.at("q"), Value::text("?"));
    EXPECT_EQ(doc.at("b"), Value::text("B"));
}

TEST(ParserTest, CharacterCodeOutOfRange) {
    SyntaxError error = parseError("c = chr(0x110000)");
    EXPECT_EQ(error.line(), 1u);
    EXPECT_EQ(error.column(), 5u);
}

TEST(ParserTest, BracketExpressions) {
    Document doc = parse(
        "n := 10\n"
        "sum = [+ 2 3]\n"
        "diff = [- n 3]\n"
        "prod = [* 4 5]\n"
        "quot = [/ 7 2]\n"
        "zero = [/ 5 0]\n"
        "single = [+ 5]\n");

    EXPECT_EQ(doc.at("sum"), Value::integer(5));
    EXPECT_EQ(doc.at("diff"), Value::integer(7));
    EXPECT_EQ(doc.at("prod"), Value::integer(20));
    EXPECT_EQ(doc.at("quot"), Value::integer(3));
    EXPECT_EQ(doc.at("zero"), Value::integer(0));
    EXPECT_EQ(doc.at("single"), Value::integer(5));
}

TEST(ParserTest, BareNameBindsToItself) {
    Document doc = parse("verbose\nlevel = 3");

    EXPECT_EQ(doc.at("verbose"), Value::identifier("verbose"));
    EXPECT_EQ(doc.keys(), (std::vector<std::string>{"verbose", "level"}));
}

TEST(ParserTest, BareNameOverwritesEarlierEntry) {
    Document doc = parse("a := 1; a");
    EXPECT_EQ(doc.at("a"), Value::identifier("a"));
}

TEST(ParserTest, BareValueIsStoredUnderSyntheticKey) {
    EXPECT_EQ(parse("(list 1, 2)").at("_value").asList().size(), 2u);
    EXPECT_EQ(parse("1 2").at("_value"), Value::integer(2));
}

TEST(ParserTest, EmptyStatementsAndComments) {
    Document doc = parse(";;\n# header\n{- block\ncomment -}\na = 1;;");

    EXPECT_EQ(doc.size(), 1u);
    EXPECT_EQ(doc.at("a"), Value::integer(1));
    EXPECT_TRUE(parse("").empty());
}

TEST(ParserTest, RepeatedNameKeepsFirstPosition) {
    Document doc = parse("a = 1; b = 2; a = 3");

    EXPECT_EQ(doc.keys(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(doc.at("a"), Value::integer(3));
}

TEST(ParserTest, Deterministic) {
    const std::string source = "w := 3; box = struct{ w = w, h = [* w 2], tags = (list 'a', b) }";
    EXPECT_EQ(parse(source), parse(source));
}

TEST(ParserTest, MissingValue) {
    SyntaxError error = parseError("a = ");

    EXPECT_EQ(error.line(), 1u);
    EXPECT_EQ(error.column(), 5u);
    EXPECT_EQ(error.diagnostic().expected, "value");
    EXPECT_EQ(error.diagnostic().actual, "EOF");
}

TEST(ParserTest, UnexpectedValueToken) {
    SyntaxError error = parseError("a = )");

    EXPECT_EQ(error.column(), 5u);
    EXPECT_EQ(error.diagnostic().actual, "RPAREN");
}

TEST(ParserTest, UnclosedList) {
    SyntaxError error = parseError("a = 1\nb = (list 1,\n");

    EXPECT_EQ(error.line(), 3u);
    EXPECT_EQ(error.column(), 1u);
    EXPECT_EQ(error.diagnostic().expected, "RPAREN");
}

TEST(ParserTest, StructFieldWithoutAssign) {
    SyntaxError error = parseError("p struct{ x 1 }");

    EXPECT_EQ(error.column(), 13u);
    EXPECT_EQ(error.diagnostic().expected, "ASSIGN");
    EXPECT_EQ(error.diagnostic().actual, "DECIMAL");
}

TEST(ParserTest, UnclosedStruct) {
    SyntaxError error = parseError("p = struct{ x = 1,");
    EXPECT_EQ(error.diagnostic().expected, "STRUCT_END");
}

TEST(ParserTest, ChrRequiresClosingParen) {
    SyntaxError error = parseError("c = chr(65");
    EXPECT_EQ(error.diagnostic().expected, "RPAREN");
}

TEST(ParserTest, IntegerLiteralOutOfRange) {
    EXPECT_THROW(parse("big = 99999999999999999999"), SyntaxError);
}

TEST(ParserTest, ErrorMessageCarriesLocation) {
    SyntaxError error = parseError("a = 1\nb = ;");
    EXPECT_STREQ(error.what(), "<test>:2:5: expected value, got SEMICOLON");
}

TEST(ParserTest, DeepNestingIsASyntaxError) {
    std::string source = "a = ";
    for (int i = 0; i < 100000; i++) {
        source += "(list ";
    }
    SyntaxError error = parseError(source);
    EXPECT_EQ(error.diagnostic().message, "nesting too deep");
    EXPECT_EQ(error.line(), 1u);

    std::string structs = "a = ";
    for (int i = 0; i < 5000; i++) {
        structs += "struct{ x = ";
    }
    EXPECT_EQ(parseError(structs).diagnostic().message, "nesting too deep");

    std::string chrs = "a = ";
    for (int i = 0; i < 5000; i++) {
        chrs += "chr(";
    }
    EXPECT_EQ(parseError(chrs).diagnostic().message, "nesting too deep");
}

TEST(ParserTest, NestingUpToTheLimitIsAccepted) {
    std::string source = "a = ";
    for (int i = 0; i < 1000; i++) {
        source += "(list ";
    }
    source += "1";
    for (int i = 0; i < 1000; i++) {
        source += ")";
    }

    ParseContext context;
    Lexer lexer(source, "<test>");
    Document document = Parser(lexer).parse(context);

    const Value* level = &document.at("a");
    for (int i = 0; i < 1000; i++) {
        ASSERT_TRUE(level->isList());
        level = &level->asList().front();
    }
    EXPECT_EQ(level->asInteger(), 1);
    EXPECT_EQ(context.depth, 0u);
}

TEST(ParserTest, NestingLimitComesFromTheContext) {
    ParseContext shallow;
    shallow.maxDepth = 2;
    Lexer ok("a = (list (list 1))", "<test>");
    EXPECT_NO_THROW(Parser(ok).parse(shallow));

    ParseContext limited;
    limited.maxDepth = 2;
    Lexer tooDeep("b = (list (list (list 1)))", "<test>");
    EXPECT_THROW(Parser(tooDeep).parse(limited), SyntaxError);
}
