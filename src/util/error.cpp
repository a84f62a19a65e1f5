#include <ctext/error.hpp>

namespace ctext {

const char* CtextError::code_name(Code c) {
    switch (c) {
        case IO:                  return "IO";
        case Eof:                 return "Eof";
        case UnterminatedComment: return "UnterminatedComment";
        case TokenTooLarge:       return "TokenTooLarge";
        case MissingParen:        return "MissingParen";
        case MissingSemicolon:    return "MissingSemicolon";
        case Config:              return "Config";
        case InvalidArg:          return "InvalidArg";
    }
    return "Unknown";
}

std::string CtextError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace ctext
