#include <catch2/catch.hpp>
#include <gapline/lang/trivia.hpp>

using namespace gapline;

TEST_CASE("whitespace and end-of-line predicates", "[trivia]") {
    REQUIRE(is_whitespace(TriviaKind::Whitespace));
    REQUIRE_FALSE(is_whitespace(TriviaKind::EndOfLine));
    REQUIRE(is_end_of_line(TriviaKind::EndOfLine));
    REQUIRE_FALSE(is_end_of_line(TriviaKind::Whitespace));

    REQUIRE(is_whitespace_or_end_of_line(TriviaKind::Whitespace));
    REQUIRE(is_whitespace_or_end_of_line(TriviaKind::EndOfLine));
    REQUIRE_FALSE(is_whitespace_or_end_of_line(TriviaKind::Comment));
    REQUIRE_FALSE(is_whitespace_or_end_of_line(TriviaKind::IfDirective));
}

TEST_CASE("directive predicate covers the four conditional kinds", "[trivia]") {
    REQUIRE(is_directive(TriviaKind::IfDirective));
    REQUIRE(is_directive(TriviaKind::ElifDirective));
    REQUIRE(is_directive(TriviaKind::ElseDirective));
    REQUIRE(is_directive(TriviaKind::EndIfDirective));

    REQUIRE_FALSE(is_directive(TriviaKind::Whitespace));
    REQUIRE_FALSE(is_directive(TriviaKind::EndOfLine));
    REQUIRE_FALSE(is_directive(TriviaKind::Comment));
    REQUIRE_FALSE(is_directive(TriviaKind::Other));
}

TEST_CASE("predicates on trivia values", "[trivia]") {
    REQUIRE(is_whitespace(Trivia::whitespace("  ")));
    REQUIRE(is_end_of_line(Trivia::end_of_line("\r\n")));
    REQUIRE_FALSE(is_directive(Trivia::comment("// x")));
    REQUIRE(Trivia::end_of_line().text == "\n");
}

TEST_CASE("kind_name", "[trivia]") {
    REQUIRE(std::string(kind_name(TriviaKind::Whitespace)) == "Whitespace");
    REQUIRE(std::string(kind_name(TriviaKind::EndIfDirective)) == "EndIfDirective");
    REQUIRE(std::string(kind_name(TriviaKind::Other)) == "Other");
}

TEST_CASE("to_text concatenates in order", "[trivia]") {
    TriviaList list = {
        Trivia::whitespace("  "),
        Trivia::comment("// note"),
        Trivia::end_of_line(),
    };
    REQUIRE(to_text(list) == "  // note\n");
    REQUIRE(to_text({}) == "");
}

TEST_CASE("classify_directive with default spellings", "[trivia][directive]") {
    DirectiveTable table;
    REQUIRE(classify_directive(table, "`ifdef SIM\n") == TriviaKind::IfDirective);
    REQUIRE(classify_directive(table, "`ifndef SYNTH\n") == TriviaKind::IfDirective);
    REQUIRE(classify_directive(table, "`elsif FPGA\n") == TriviaKind::ElifDirective);
    REQUIRE(classify_directive(table, "`else\n") == TriviaKind::ElseDirective);
    REQUIRE(classify_directive(table, "`endif") == TriviaKind::EndIfDirective);
    REQUIRE(classify_directive(table, "#if DEBUG\r\n") == TriviaKind::IfDirective);
    REQUIRE(classify_directive(table, "  #endif // DEBUG\n") == TriviaKind::EndIfDirective);
}

TEST_CASE("classify_directive rejects non-conditional directives", "[trivia][directive]") {
    DirectiveTable table;
    REQUIRE(classify_directive(table, "`define WIDTH 8\n") == TriviaKind::Other);
    REQUIRE(classify_directive(table, "`endiffy\n") == TriviaKind::Other);
    REQUIRE(classify_directive(table, "") == TriviaKind::Other);
    REQUIRE(classify_directive(table, "   \n") == TriviaKind::Other);
}

TEST_CASE("classify_directive with custom table", "[trivia][directive]") {
    DirectiveTable table;
    table.if_spellings = {"%if"};
    table.endif_spellings = {"%endif"};
    REQUIRE(classify_directive(table, "%if X\n") == TriviaKind::IfDirective);
    REQUIRE(classify_directive(table, "%endif\n") == TriviaKind::EndIfDirective);
    REQUIRE(classify_directive(table, "`ifdef X\n") == TriviaKind::Other);
}

TEST_CASE("make_directive keeps the full text", "[trivia][directive]") {
    DirectiveTable table;
    Trivia t = make_directive(table, "`ifdef SIM\n");
    REQUIRE(t.kind == TriviaKind::IfDirective);
    REQUIRE(t.text == "`ifdef SIM\n");
}
