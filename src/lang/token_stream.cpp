#include <gapline/lang/token_stream.hpp>
#include <functional>

namespace gapline {

std::string Token::full_text() const {
    std::string out = to_text(leading);
    out += text;
    out += to_text(trailing);
    return out;
}

const char* token_kind_name(TokenKind kind) {
    switch (kind) {
    case TokenKind::Identifier:    return "Identifier";
    case TokenKind::Keyword:       return "Keyword";
    case TokenKind::Number:        return "Number";
    case TokenKind::StringLiteral: return "StringLiteral";
    case TokenKind::Operator:      return "Operator";
    case TokenKind::Punctuation:   return "Punctuation";
    case TokenKind::Eof:           return "Eof";
    }
    return "Unknown";
}

Result<const Token*> TokenStream::at(size_t index) const {
    if (index >= tokens_.size()) {
        return GapError{GapError::OutOfRange,
            "token index out of range (stream has " +
            std::to_string(tokens_.size()) + " tokens)"}.at_token(index);
    }
    return Result<const Token*>::ok(&tokens_[index]);
}

const Token* TokenStream::previous(size_t index) const {
    if (index == 0 || index > tokens_.size()) return nullptr;
    return &tokens_[index - 1];
}

const Token* TokenStream::next(size_t index) const {
    if (index + 1 >= tokens_.size()) return nullptr;
    return &tokens_[index + 1];
}

std::optional<size_t> TokenStream::index_of(const Token& token) const {
    if (tokens_.empty()) return std::nullopt;
    const Token* first = tokens_.data();
    const Token* p = &token;
    std::less<const Token*> before;
    if (before(p, first) || !before(p, first + tokens_.size())) return std::nullopt;
    return static_cast<size_t>(p - first);
}

std::string TokenStream::text() const {
    std::string out;
    for (const auto& tok : tokens_) {
        out += tok.full_text();
    }
    return out;
}

} // namespace gapline
