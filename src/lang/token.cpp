#include <ctext/lang/token.hpp>

namespace ctext {

std::string Position::str() const {
    std::string s = file.empty() ? "<input>" : file;
    if (is_valid()) {
        s += ":";
        s += std::to_string(line);
        s += ":";
        s += std::to_string(col);
    }
    return s;
}

bool operator==(const Position& a, const Position& b) {
    return a.file == b.file && a.line == b.line && a.col == b.col;
}

bool operator!=(const Position& a, const Position& b) {
    return !(a == b);
}

const char* token_type_name(TokenType t) {
    switch (t) {
    case TokenType::Error:   return "error";
    case TokenType::Comment: return "comment";
    case TokenType::Text:    return "text";
    }
    return "?";
}

} // namespace ctext
