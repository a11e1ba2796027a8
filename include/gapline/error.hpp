#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace gapline {

struct GapError {
    enum Code {
        Config,      // bad value in a config document
        Parse,       // config text is not valid TOML
        NotFound,    // trivium not owned by the token passed with it
        OutOfRange   // token index past the end of the stream
    };

    Code code;
    std::string message;
    std::string hint;
    // Stream index of the token the caller passed, for contract violations
    std::optional<std::size_t> token_index;

    GapError() = default;
    GapError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    GapError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    GapError& at_token(std::size_t index) {
        token_index = index;
        return *this;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace gapline
