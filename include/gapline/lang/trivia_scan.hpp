#pragma once

#include <gapline/lang/trivia.hpp>
#include <optional>

namespace gapline {

// Index of the first trivium that is neither whitespace nor a line break.
// nullopt for an empty or all-whitespace list.
std::optional<size_t> first_non_whitespace_index(const TriviaList& list);

// Index where the content region starts: the indentation on the content's
// own line, or the content itself. Trivia before it form whole blank lines.
// Returns 0 when there is no full blank line before the content, and nullopt
// when the list is empty or ends in a line break with nothing after it.
std::optional<size_t> first_non_blank_line_index(const TriviaList& list);

// Index where the removable whitespace at the end of the list starts. The
// line break directly after the last non-whitespace trivium is kept.
// nullopt when nothing is removable.
std::optional<size_t> trailing_whitespace_index(const TriviaList& list);

} // namespace gapline
