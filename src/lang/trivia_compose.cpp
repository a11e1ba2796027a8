#include <gapline/lang/trivia_compose.hpp>
#include <gapline/log.hpp>

namespace gapline {

static std::optional<size_t> position_in(const TriviaList& list, const Trivia& trivium) {
    for (size_t i = 0; i < list.size(); ++i) {
        if (&list[i] == &trivium) return i;
    }
    return std::nullopt;
}

static TriviaList concat(const TriviaList* first, const TriviaList& second) {
    TriviaList out;
    out.reserve((first ? first->size() : 0) + second.size());
    if (first) out.insert(out.end(), first->begin(), first->end());
    out.insert(out.end(), second.begin(), second.end());
    return out;
}

Result<ContainingTriviaList> containing_trivia_list(const TokenStream& stream,
                                                    size_t token_index,
                                                    const Trivia& trivium) {
    auto tok = stream.at(token_index);
    if (tok.is_err()) {
        log::error("containing_trivia_list: token %zu: %s", token_index,
                   tok.error().message.c_str());
        return std::move(tok).error();
    }
    const Token& token = *tok.value();

    if (auto i = position_in(token.trailing, trivium)) {
        const Token* next = stream.next(token_index);
        ContainingTriviaList result;
        result.trivia = next ? concat(&token.trailing, next->leading) : token.trailing;
        result.index = *i;
        return Result<ContainingTriviaList>::ok(std::move(result));
    }

    if (auto j = position_in(token.leading, trivium)) {
        const Token* prev = stream.previous(token_index);
        ContainingTriviaList result;
        result.trivia = concat(prev ? &prev->trailing : nullptr, token.leading);
        result.index = (prev ? prev->trailing.size() : 0) + *j;
        return Result<ContainingTriviaList>::ok(std::move(result));
    }

    log::error("containing_trivia_list: %s trivium is not owned by token %zu ('%s')",
               kind_name(trivium.kind), token_index, token.text.c_str());
    return GapError{GapError::NotFound,
        "trivium is not part of the leading or trailing trivia of its token",
        "pass the token that owns the trivium, and a reference into the stream"}
        .at_token(token_index);
}

} // namespace gapline
