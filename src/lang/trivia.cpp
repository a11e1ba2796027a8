#include <gapline/lang/trivia.hpp>
#include <algorithm>

namespace gapline {

bool is_whitespace(TriviaKind kind) {
    return kind == TriviaKind::Whitespace;
}

bool is_end_of_line(TriviaKind kind) {
    return kind == TriviaKind::EndOfLine;
}

bool is_whitespace_or_end_of_line(TriviaKind kind) {
    return kind == TriviaKind::Whitespace || kind == TriviaKind::EndOfLine;
}

bool is_directive(TriviaKind kind) {
    switch (kind) {
    case TriviaKind::IfDirective:
    case TriviaKind::ElifDirective:
    case TriviaKind::ElseDirective:
    case TriviaKind::EndIfDirective:
        return true;
    default:
        return false;
    }
}

const char* kind_name(TriviaKind kind) {
    switch (kind) {
    case TriviaKind::Whitespace:     return "Whitespace";
    case TriviaKind::EndOfLine:      return "EndOfLine";
    case TriviaKind::Comment:        return "Comment";
    case TriviaKind::IfDirective:    return "IfDirective";
    case TriviaKind::ElifDirective:  return "ElifDirective";
    case TriviaKind::ElseDirective:  return "ElseDirective";
    case TriviaKind::EndIfDirective: return "EndIfDirective";
    case TriviaKind::Other:          return "Other";
    }
    return "Unknown";
}

std::string to_text(const TriviaList& list) {
    std::string out;
    for (const auto& t : list) out += t.text;
    return out;
}

static bool contains(const std::vector<std::string>& spellings, const std::string& word) {
    return std::find(spellings.begin(), spellings.end(), word) != spellings.end();
}

TriviaKind classify_directive(const DirectiveTable& table, const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && (text[begin] == ' ' || text[begin] == '\t')) ++begin;
    size_t end = begin;
    while (end < text.size() && text[end] != ' ' && text[end] != '\t' &&
           text[end] != '\r' && text[end] != '\n') {
        ++end;
    }
    if (begin == end) return TriviaKind::Other;

    std::string keyword = text.substr(begin, end - begin);
    if (contains(table.if_spellings, keyword))    return TriviaKind::IfDirective;
    if (contains(table.elif_spellings, keyword))  return TriviaKind::ElifDirective;
    if (contains(table.else_spellings, keyword))  return TriviaKind::ElseDirective;
    if (contains(table.endif_spellings, keyword)) return TriviaKind::EndIfDirective;
    return TriviaKind::Other;
}

Trivia make_directive(const DirectiveTable& table, std::string text) {
    TriviaKind kind = classify_directive(table, text);
    return Trivia{kind, std::move(text)};
}

} // namespace gapline
