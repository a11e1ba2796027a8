#include <gapline/config.hpp>
#include <gapline/lang/blank_lines.hpp>
#include <gapline/lang/token_stream.hpp>
#include <gapline/lang/trivia_compose.hpp>
#include <gapline/lang/trivia_scan.hpp>
#include <iostream>

using namespace gapline;

static const char* kConfig = R"(
[log]
level = "debug"
)";

static Token tok(int line, int col, TokenKind kind, const char* text,
                 TriviaList leading, TriviaList trailing) {
    Token t;
    t.kind = kind;
    t.text = text;
    t.pos = SourcePos{"top.sv", line, col};
    t.leading = std::move(leading);
    t.trailing = std::move(trailing);
    return t;
}

// module top;
//
//
//   wire a;   // spare
// `ifdef SIM
//
//   wire b;
// `endif
// endmodule
static TokenStream build_stream(const DirectiveTable& table) {
    auto ws = [](const char* s) { return Trivia::whitespace(s); };
    auto eol = [] { return Trivia::end_of_line(); };
    return TokenStream({
        tok(1, 1, TokenKind::Keyword, "module", {}, {ws(" ")}),
        tok(1, 8, TokenKind::Identifier, "top", {}, {}),
        tok(1, 11, TokenKind::Punctuation, ";", {}, {eol()}),
        tok(4, 3, TokenKind::Keyword, "wire", {eol(), eol(), ws("  ")}, {ws(" ")}),
        tok(4, 8, TokenKind::Identifier, "a", {}, {}),
        tok(4, 9, TokenKind::Punctuation, ";", {},
            {ws("   "), Trivia::comment("// spare"), eol()}),
        tok(7, 3, TokenKind::Keyword, "wire",
            {make_directive(table, "`ifdef SIM\n"), eol(), ws("  ")}, {ws(" ")}),
        tok(7, 8, TokenKind::Identifier, "b", {}, {}),
        tok(7, 9, TokenKind::Punctuation, ";", {}, {eol()}),
        tok(9, 1, TokenKind::Keyword, "endmodule", {make_directive(table, "`endif\n")}, {eol()}),
        tok(10, 1, TokenKind::Eof, "", {}, {}),
    });
}

static void print_list(const char* label, const TriviaList& list) {
    std::cout << "    " << label << ":";
    for (const auto& t : list) std::cout << " " << kind_name(t.kind);
    std::cout << "\n";
}

int main() {
    auto cfg = Config::parse(kConfig);
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    cfg.value().apply();

    TokenStream stream = build_stream(cfg.value().directives);
    std::cout << "--- input ---\n" << stream.text();

    std::vector<Token> fixed;
    for (size_t i = 0; i < stream.size(); ++i) {
        const Token& t = stream.tokens()[i];
        std::cout << t.pos.file << ":" << t.pos.line << ":" << t.pos.col << " ["
                  << i << "] " << token_kind_name(t.kind) << " '" << t.text << "'"
                  << (has_leading_blank_lines(t) ? "  (blank lines before)" : "") << "\n";
        print_list("leading", t.leading);
        print_list("trailing", t.trailing);

        if (!t.trailing.empty()) {
            auto gap = containing_trivia_list(stream, i, t.trailing.front());
            if (gap.is_err()) {
                std::cerr << gap.error().format() << "\n";
                return 1;
            }
            if (auto cut = trailing_whitespace_index(gap.value().trivia)) {
                std::cout << "    gap whitespace starts at " << *cut << "\n";
            }
        }

        fixed.push_back(has_leading_blank_lines(t) ? without_leading_blank_lines(t) : t);
    }

    std::cout << "--- without blank lines ---\n" << TokenStream(std::move(fixed)).text();
    return 0;
}
