#include <gapline/error.hpp>

namespace gapline {

const char* GapError::code_name(Code c) {
    switch (c) {
        case Config:     return "Config";
        case Parse:      return "Parse";
        case NotFound:   return "NotFound";
        case OutOfRange: return "OutOfRange";
    }
    return "Unknown";
}

std::string GapError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (token_index) {
        result += "\n  --> token ";
        result += std::to_string(*token_index);
    }

    return result;
}

} // namespace gapline
