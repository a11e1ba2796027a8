#pragma once

#include <gapline/lang/token.hpp>
#include <gapline/result.hpp>
#include <optional>
#include <vector>

namespace gapline {

// Ordered, immutable token sequence as produced by the parser. Tokens are
// addressed by index; references handed out stay valid for the stream's
// lifetime.
class TokenStream {
public:
    TokenStream() = default;
    explicit TokenStream(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    size_t size() const { return tokens_.size(); }
    bool empty() const { return tokens_.empty(); }

    Result<const Token*> at(size_t index) const;

    // Neighbors; nullptr at either end of the stream or for a bad index
    const Token* previous(size_t index) const;
    const Token* next(size_t index) const;

    // Index of a token held by this stream (address identity)
    std::optional<size_t> index_of(const Token& token) const;

    // Reconstructs the source text; equals the parser input when the stream
    // satisfies the completeness invariant.
    std::string text() const;

    const std::vector<Token>& tokens() const { return tokens_; }

private:
    std::vector<Token> tokens_;
};

} // namespace gapline
