#pragma once

#include <string>

namespace ctext {

// Source position for tokens and error reporting. A line of 0 means unset.
struct Position {
    std::string file;
    int line = 0;
    int col = 0;

    bool is_valid() const { return line > 0; }

    // "file:line:col", with "<input>" standing in for an empty file name
    std::string str() const;
};

bool operator==(const Position& a, const Position& b);
bool operator!=(const Position& a, const Position& b);

enum class TokenType {
    Error,    // terminal condition, see Scanner::error()
    Comment,  // "// ...\n" or "/* ... */", delimiters included
    Text      // run of non-comment source
};

const char* token_type_name(TokenType t);

struct Token {
    TokenType type = TokenType::Error;
    Position pos;       // first character of the span
    std::string text;   // raw bytes of the span, '\r' removed
};

} // namespace ctext
