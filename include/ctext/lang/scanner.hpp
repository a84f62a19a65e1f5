#pragma once

#include <ctext/lang/token.hpp>
#include <ctext/result.hpp>
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace ctext {

// Splits C source into alternating Comment and Text tokens.
//
// Pull-based: each next() reads just enough of the stream to produce one
// token. Once next() returns TokenType::Error it keeps returning it, and
// error() holds the reason; plain end of input is CtextError::Eof.
// Concatenating the text of every token reproduces the input with all
// '\r' bytes removed.
class Scanner {
public:
    explicit Scanner(std::istream& in, std::string filename = "");

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    // Largest token, in bytes, before next() fails with TokenTooLarge.
    // Zero (the default) means unlimited.
    void set_max_buffer(size_t max_bytes) { max_buf_ = max_bytes; }
    size_t max_buffer() const { return max_buf_; }

    TokenType next();

    const Token& token() const { return token_; }
    const std::string& token_text() const { return token_.text; }

    // Only meaningful after next() returned TokenType::Error
    const CtextError& error() const { return error_; }
    bool at_eof() const { return failed_ && error_.code == CtextError::Eof; }

    // Position of the next unread byte
    const Position& position() const { return cursor_; }

private:
    enum class Opener { None, Line, Block };

    void reset_token();
    void begin_comment(Opener kind, const Position& slash);
    bool append(char c, const Position& at);
    void track_literal(char c, const Position& at);
    char last_byte() const;
    TokenType emit(TokenType type);
    TokenType fail(CtextError err);
    TokenType finish_at_eof();

    std::istream& in_;
    size_t max_buf_ = 0;

    Position cursor_;
    Position last_pos_;
    Token token_;

    bool failed_ = false;
    CtextError error_;

    // Comment opener consumed while flushing the preceding text
    Opener carry_ = Opener::None;
    Position carry_pos_;

    // Per-token state, reset by next()
    bool in_string_ = false;
    bool in_char_ = false;
    bool escaped_ = false;
    int block_depth_ = 0;
    bool in_line_comment_ = false;
};

// Scan an in-memory source into its full token list.
Result<std::vector<Token>> tokenize(const std::string& source,
                                    const std::string& filename = "",
                                    size_t max_buffer = 0);

} // namespace ctext
