#include <gapline/lang/trivia_scan.hpp>

namespace gapline {

std::optional<size_t> first_non_whitespace_index(const TriviaList& list) {
    for (size_t i = 0; i < list.size(); ++i) {
        if (!is_whitespace_or_end_of_line(list[i])) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<size_t> first_non_blank_line_index(const TriviaList& list) {
    if (list.empty()) return std::nullopt;
    size_t anchor = first_non_whitespace_index(list).value_or(list.size());

    // Walk back from the anchor to the line break ending the last blank line
    for (size_t i = anchor; i > 0; --i) {
        size_t p = i - 1;
        if (is_end_of_line(list[p])) {
            if (p == list.size() - 1) return std::nullopt;
            return p + 1;
        }
    }
    return 0;
}

std::optional<size_t> trailing_whitespace_index(const TriviaList& list) {
    size_t start = list.size();
    bool after_is_eol = false;

    for (size_t i = list.size(); i > 0; --i) {
        const Trivia& t = list[i - 1];
        if (!is_whitespace_or_end_of_line(t)) {
            // keep the terminator of the content's own line
            if (after_is_eol) ++start;
            break;
        }
        start = i - 1;
        after_is_eol = is_end_of_line(t);
    }

    if (start >= list.size()) return std::nullopt;
    return start;
}

} // namespace gapline
