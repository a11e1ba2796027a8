#pragma once

#include <gapline/lang/trivia.hpp>
#include <string>

namespace gapline {

// Source position for diagnostics reported by the host
struct SourcePos {
    std::string file;
    int line = 1;
    int col = 1;
};

enum class TokenKind {
    Identifier,
    Keyword,
    Number,
    StringLiteral,
    Operator,
    Punctuation,
    Eof          // zero-width; holds the trivia at end of file
};

// Immutable lexical token. The trailing list runs through the line break
// ending the token's line; blank lines and indentation of the next line
// belong to the next token's leading list.
struct Token {
    TokenKind kind;
    std::string text;
    SourcePos pos;
    TriviaList leading;
    TriviaList trailing;

    Token with_leading(TriviaList list) const {
        Token t = *this;
        t.leading = std::move(list);
        return t;
    }

    Token with_trailing(TriviaList list) const {
        Token t = *this;
        t.trailing = std::move(list);
        return t;
    }

    // leading + text + trailing
    std::string full_text() const;
};

const char* token_kind_name(TokenKind kind);

} // namespace gapline
