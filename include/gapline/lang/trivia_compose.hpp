#pragma once

#include <gapline/lang/token_stream.hpp>
#include <gapline/result.hpp>

namespace gapline {

// The trivia between two adjacent tokens seen as one list, with the
// position of the trivium it was built for.
struct ContainingTriviaList {
    TriviaList trivia;
    size_t index = 0;
};

// Builds the containing list of `trivium`, which must be a reference into
// the leading or trailing list of stream token `token_index`:
//   trailing trivium -> token.trailing ++ next.leading
//   leading trivium  -> previous.trailing ++ token.leading
// A missing neighbor contributes nothing. Fails with NotFound when the
// trivium is not owned by the token, OutOfRange for a bad token index.
Result<ContainingTriviaList> containing_trivia_list(const TokenStream& stream,
                                                    size_t token_index,
                                                    const Trivia& trivium);

} // namespace gapline
