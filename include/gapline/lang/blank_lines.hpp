#pragma once

#include <gapline/lang/token.hpp>

namespace gapline {

// List without its removable trailing whitespace (see trailing_whitespace_index)
TriviaList without_trailing_whitespace(const TriviaList& list);

// List starting at its first non-whitespace trivium; empty if there is none
TriviaList without_leading_whitespace(const TriviaList& list);

// True when a whole blank line separates the token from whatever precedes
// it. Indentation on the token's own line is ignored, and a conditional
// directive counts as ending its own line. A leading list made only of line
// breaks and whitespace (e.g. at start of file) counts as blank.
bool has_leading_blank_lines(const TriviaList& leading);
bool has_leading_blank_lines(const Token& token);

// Removes the blank lines between the token's indentation and the preceding
// content. Conditional directives and the line break ending the content's
// line are never removed.
TriviaList without_leading_blank_lines(const TriviaList& leading);
Token without_leading_blank_lines(const Token& token);

} // namespace gapline
