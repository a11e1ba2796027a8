#include <gapline/lang/blank_lines.hpp>
#include <gapline/lang/trivia_scan.hpp>
#include <gapline/log.hpp>

namespace gapline {

TriviaList without_trailing_whitespace(const TriviaList& list) {
    auto start = trailing_whitespace_index(list);
    if (!start) return list;
    return TriviaList(list.begin(), list.begin() + *start);
}

TriviaList without_leading_whitespace(const TriviaList& list) {
    auto start = first_non_whitespace_index(list);
    if (!start) return TriviaList();
    return TriviaList(list.begin() + *start, list.end());
}

bool has_leading_blank_lines(const TriviaList& leading) {
    size_t i = leading.size();

    // indentation on the token's own line
    while (i > 0 && is_whitespace(leading[i - 1])) --i;
    if (i == 0 || !is_end_of_line(leading[i - 1])) return false;

    // the first line break ends the preceding line, every further one a blank line
    int blank_lines = -1;
    for (; i > 0; --i) {
        const Trivia& t = leading[i - 1];
        if (is_whitespace(t)) continue;
        if (is_end_of_line(t)) {
            ++blank_lines;
            continue;
        }
        if (is_directive(t)) ++blank_lines;
        return blank_lines > 0;
    }
    return true;
}

bool has_leading_blank_lines(const Token& token) {
    return has_leading_blank_lines(token.leading);
}

TriviaList without_leading_blank_lines(const TriviaList& leading) {
    size_t indent = leading.size();
    while (indent > 0 && is_whitespace(leading[indent - 1])) --indent;

    size_t i = indent;
    while (i > 0 && is_whitespace_or_end_of_line(leading[i - 1])) --i;

    size_t keep = 0;
    if (i > 0 && is_directive(leading[i - 1])) {
        keep = i;
    } else if (i > 0) {
        size_t eol = i;
        while (eol < indent && !is_end_of_line(leading[eol])) ++eol;
        if (eol == indent) return leading;  // content on the token's line
        keep = eol + 1;
    }

    if (keep == indent) return leading;

    log::debug("removing %zu blank-line trivia before indentation", indent - keep);
    TriviaList out(leading.begin(), leading.begin() + keep);
    out.insert(out.end(), leading.begin() + indent, leading.end());
    return out;
}

Token without_leading_blank_lines(const Token& token) {
    return token.with_leading(without_leading_blank_lines(token.leading));
}

} // namespace gapline
