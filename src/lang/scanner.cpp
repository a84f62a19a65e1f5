#include <ctext/lang/scanner.hpp>
#include <ctext/log.hpp>
#include <ctext/name.hpp>
#include <sstream>

namespace ctext {

Scanner::Scanner(std::istream& in, std::string filename)
    : in_(in) {
    cursor_.file = std::move(filename);
    cursor_.line = 1;
    cursor_.col = 1;
    last_pos_.file = cursor_.file;
    token_.pos.file = cursor_.file;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

void Scanner::reset_token() {
    token_.type = TokenType::Error;
    token_.text.clear();
    token_.pos = Position{cursor_.file, 0, 0};

    in_string_ = false;
    in_char_ = false;
    escaped_ = false;
    block_depth_ = 0;
    in_line_comment_ = false;
}

char Scanner::last_byte() const {
    return token_.text.empty() ? '\0' : token_.text.back();
}

bool Scanner::append(char c, const Position& at) {
    if (max_buf_ != 0 && token_.text.size() >= max_buf_) {
        fail(CtextError{CtextError::TokenTooLarge,
            "token exceeds maximum buffer size of " + std::to_string(max_buf_) + " bytes",
            "raise the limit with --max-buffer or [scan] max-buffer",
            token_.pos.file, token_.pos.line});
        return false;
    }
    token_.text.push_back(c);
    last_pos_ = at;
    return true;
}

// The opener's two bytes always start the token, so the closing "*/" of a
// block comment is searched for from index 2 onwards.
void Scanner::begin_comment(Opener kind, const Position& slash) {
    token_.pos = slash;
    token_.text = kind == Opener::Line ? "//" : "/*";
    last_pos_ = Position{slash.file, slash.line, slash.col + 1};
    if (kind == Opener::Line) {
        in_line_comment_ = true;
    } else {
        block_depth_ = 1;
    }
}

void Scanner::track_literal(char c, const Position& at) {
    if (escaped_) {
        escaped_ = false;
    } else if (c == '\\') {
        escaped_ = true;
    } else if (c == '"' && in_string_) {
        in_string_ = false;
    } else if (c == '\'' && in_char_) {
        in_char_ = false;
    } else if (c == '\n') {
        log::at(log::Debug, at, "unterminated %s literal",
                in_string_ ? "string" : "character");
        in_string_ = false;
        in_char_ = false;
    }
}

TokenType Scanner::emit(TokenType type) {
    token_.type = type;
    log::at(log::Trace, token_.pos, "%s token, %zu bytes",
            token_type_name(type), token_.text.size());
    return type;
}

TokenType Scanner::fail(CtextError err) {
    failed_ = true;
    error_ = std::move(err);
    token_.type = TokenType::Error;
    return TokenType::Error;
}

TokenType Scanner::finish_at_eof() {
    if (token_.text.empty()) {
        return fail(CtextError{CtextError::Eof, "end of input"});
    }
    if (block_depth_ > 0) {
        return fail(CtextError{CtextError::UnterminatedComment,
            "unexpected end of multi-line comment",
            "block comment opened here is never closed with */",
            token_.pos.file, token_.pos.line});
    }
    // Buffered bytes go out first; the following call reports Eof.
    return emit(in_line_comment_ ? TokenType::Comment : TokenType::Text);
}

// ---------------------------------------------------------------------------
// Token loop
// ---------------------------------------------------------------------------

TokenType Scanner::next() {
    if (failed_) return TokenType::Error;

    reset_token();

    if (carry_ != Opener::None) {
        begin_comment(carry_, carry_pos_);
        carry_ = Opener::None;
    }

    while (true) {
        int ch = in_.get();
        if (ch == std::char_traits<char>::eof()) {
            if (in_.bad()) {
                return fail(CtextError{CtextError::IO,
                    "read error on input stream", "",
                    cursor_.file, cursor_.line});
            }
            return finish_at_eof();
        }

        char c = static_cast<char>(ch);
        if (c == '\r') continue;

        Position here = cursor_;
        if (c == '\n') {
            ++cursor_.line;
            cursor_.col = 1;
        } else {
            ++cursor_.col;
        }
        if (token_.text.empty()) token_.pos = here;

        if (in_line_comment_) {
            if (!append(c, here)) return TokenType::Error;
            if (c == '\n') return emit(TokenType::Comment);
            continue;
        }

        if (block_depth_ > 0) {
            // "/*" inside a block comment does not nest
            bool closes = c == '/' && last_byte() == '*' && token_.text.size() >= 3;
            if (!append(c, here)) return TokenType::Error;
            if (closes) return emit(TokenType::Comment);
            continue;
        }

        if (in_string_ || in_char_) {
            track_literal(c, here);
            if (!append(c, here)) return TokenType::Error;
            continue;
        }

        if ((c == '/' || c == '*') && last_byte() == '/') {
            Opener kind = c == '/' ? Opener::Line : Opener::Block;
            Position slash = last_pos_;
            if (token_.text.size() > 1) {
                token_.text.pop_back();
                carry_ = kind;
                carry_pos_ = slash;
                return emit(TokenType::Text);
            }
            begin_comment(kind, slash);
            continue;
        }

        if (c == '"' && last_byte() != '\\') {
            in_string_ = true;
        } else if (c == '\'' && opens_char_literal(token_.text)) {
            in_char_ = true;
        }
        if (!append(c, here)) return TokenType::Error;
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<std::vector<Token>> tokenize(const std::string& source,
                                    const std::string& filename,
                                    size_t max_buffer) {
    std::istringstream in(source);
    Scanner scanner(in, filename);
    scanner.set_max_buffer(max_buffer);

    std::vector<Token> tokens;
    while (scanner.next() != TokenType::Error) {
        tokens.push_back(scanner.token());
    }
    if (!scanner.at_eof()) {
        return scanner.error();
    }
    return Result<std::vector<Token>>::ok(std::move(tokens));
}

} // namespace ctext
