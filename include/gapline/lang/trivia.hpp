#pragma once

#include <string>
#include <vector>

namespace gapline {

enum class TriviaKind {
    Whitespace,
    EndOfLine,
    Comment,
    IfDirective,     // `ifdef, `ifndef, #if ...
    ElifDirective,   // `elsif, #elif
    ElseDirective,   // `else, #else
    EndIfDirective,  // `endif, #endif
    Other            // `define, skipped text, anything else
};

// A non-semantic span of source text attached to a token. Conditional
// directives carry their own line terminator in `text`; no EndOfLine
// trivium follows them for that line.
struct Trivia {
    TriviaKind kind;
    std::string text;

    static Trivia whitespace(std::string text) { return {TriviaKind::Whitespace, std::move(text)}; }
    static Trivia end_of_line(std::string text = "\n") { return {TriviaKind::EndOfLine, std::move(text)}; }
    static Trivia comment(std::string text) { return {TriviaKind::Comment, std::move(text)}; }
    static Trivia other(std::string text) { return {TriviaKind::Other, std::move(text)}; }

    bool operator==(const Trivia& o) const { return kind == o.kind && text == o.text; }
    bool operator!=(const Trivia& o) const { return !(*this == o); }
};

using TriviaList = std::vector<Trivia>;

bool is_whitespace(TriviaKind kind);
bool is_end_of_line(TriviaKind kind);
bool is_whitespace_or_end_of_line(TriviaKind kind);
bool is_directive(TriviaKind kind);

inline bool is_whitespace(const Trivia& t) { return is_whitespace(t.kind); }
inline bool is_end_of_line(const Trivia& t) { return is_end_of_line(t.kind); }
inline bool is_whitespace_or_end_of_line(const Trivia& t) { return is_whitespace_or_end_of_line(t.kind); }
inline bool is_directive(const Trivia& t) { return is_directive(t.kind); }

const char* kind_name(TriviaKind kind);

// Concatenated source text of a trivia list
std::string to_text(const TriviaList& list);

// Spellings of the conditional-compilation keywords, per directive kind.
// Defaults cover Verilog compiler directives and the C preprocessor.
struct DirectiveTable {
    std::vector<std::string> if_spellings = {"`ifdef", "`ifndef", "#if", "#ifdef", "#ifndef"};
    std::vector<std::string> elif_spellings = {"`elsif", "#elif"};
    std::vector<std::string> else_spellings = {"`else", "#else"};
    std::vector<std::string> endif_spellings = {"`endif", "#endif"};
};

// Kind of the directive whose keyword starts `text`; Other when the keyword
// is not a conditional directive.
TriviaKind classify_directive(const DirectiveTable& table, const std::string& text);

// Builds a directive trivium from its full text (keyword, operands, line
// terminator) using classify_directive().
Trivia make_directive(const DirectiveTable& table, std::string text);

} // namespace gapline
