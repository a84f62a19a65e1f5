#include <ctext/lang/macro.hpp>
#include <ctext/lang/scanner.hpp>
#include <ctext/log.hpp>
#include <algorithm>
#include <sstream>

namespace ctext {

// ---------------------------------------------------------------------------
// Invocation
// ---------------------------------------------------------------------------

std::string Invocation::str() const {
    std::string s = name + "( ";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) s += ", ";
        s += args[i];
    }
    s += " );";
    return s;
}

bool operator==(const Invocation& a, const Invocation& b) {
    return a.name == b.name && a.start_line == b.start_line &&
           a.end_line == b.end_line && a.args == b.args;
}

bool operator!=(const Invocation& a, const Invocation& b) {
    return !(a == b);
}

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// InvocationScanner
// ---------------------------------------------------------------------------

InvocationScanner::InvocationScanner(const NameSet& names, InvocationCallback callback)
    : names_(names), callback_(std::move(callback)) {}

Status InvocationScanner::feed(const Token& tok) {
    if (tok.type != TokenType::Text) return ok_status();

    // A comment separates identifiers
    CTEXT_TRY(end_identifier());

    file_ = tok.pos.file;
    if (tok.pos.is_valid() && tok.pos.line != line_) {
        line_ = tok.pos.line;
        line_text_.clear();
    }

    for (char c : tok.text) {
        CTEXT_TRY(step(c));
    }
    return ok_status();
}

Status InvocationScanner::finish() {
    CTEXT_TRY(end_identifier());

    switch (state_) {
    case State::Search:
        return ok_status();
    case State::AwaitParen:
        return CtextError{CtextError::MissingParen,
            "macro function missing opening parentheses",
            "input ends after '" + inv_.name + "'",
            file_, inv_.start_line};
    case State::Args:
        return CtextError{CtextError::MissingSemicolon,
            "macro invocation missing terminating semicolon",
            "'" + inv_.name + "(' is still open at end of input",
            file_, inv_.start_line};
    }
    return ok_status();
}

Status InvocationScanner::step(char c) {
    if (c == '\r') return ok_status();

    Status st = ok_status();
    switch (state_) {
    case State::Search:     st = search(c); break;
    case State::AwaitParen: st = await_paren(c); break;
    case State::Args:       parse_arg(c); break;
    }

    if (c == '\n') {
        ++line_;
        line_text_.clear();
    } else {
        line_text_.push_back(c);
    }
    return st;
}

Status InvocationScanner::search(char c) {
    if (in_string_ || in_char_) {
        if (escaped_) {
            escaped_ = false;
        } else if (c == '\\') {
            escaped_ = true;
        } else if ((c == '"' && in_string_) || (c == '\'' && in_char_) || c == '\n') {
            in_string_ = false;
            in_char_ = false;
        }
        return ok_status();
    }

    if (is_ident_char(c)) {
        if (ident_.empty()) {
            ident_line_ = line_;
            ident_col_ = line_text_.size();
        }
        ident_ += c;
        return ok_status();
    }

    CTEXT_TRY(end_identifier());
    if (state_ == State::AwaitParen) {
        return await_paren(c);
    }

    bool escaped_quote = !line_text_.empty() && line_text_.back() == '\\';
    if (c == '"' && !escaped_quote) {
        in_string_ = true;
    } else if (c == '\'' && opens_char_literal(line_text_)) {
        in_char_ = true;
    }
    return ok_status();
}

Status InvocationScanner::end_identifier() {
    if (ident_.empty()) return ok_status();

    std::string word = std::move(ident_);
    ident_.clear();

    if (!names_.matches(word)) return ok_status();

    if (skip_occurrence()) {
        log::trace("%s:%d: skipping '%s' in preprocessor directive",
                   file_.empty() ? "<input>" : file_.c_str(), ident_line_, word.c_str());
        return ok_status();
    }

    inv_ = Invocation{};
    inv_.name = std::move(word);
    inv_.start_line = ident_line_;
    state_ = State::AwaitParen;
    return ok_status();
}

// Preprocessor lines never hold calls, except the body of a #define. The
// name right after "# define" is the macro being defined.
bool InvocationScanner::skip_occurrence() const {
    size_t end = std::min(ident_col_, line_text_.size());
    size_t p = 0;
    while (p < end && is_blank(line_text_[p])) ++p;
    if (p == end || line_text_[p] != '#') return false;

    ++p;
    while (p < end && is_blank(line_text_[p])) ++p;
    size_t q = p;
    while (q < end && is_ident_char(line_text_[q])) ++q;

    if (line_text_.compare(p, q - p, "define") != 0) return true;

    for (size_t k = q; k < end; ++k) {
        if (!is_blank(line_text_[k])) return false;
    }
    return true;
}

Status InvocationScanner::await_paren(char c) {
    if (c == '(') {
        state_ = State::Args;
        paren_depth_ = 0;
        arg_.clear();
        in_string_ = false;
        in_char_ = false;
        escaped_ = false;
        return ok_status();
    }
    if (is_space(c)) return ok_status();

    return CtextError{CtextError::MissingParen,
        "macro function missing opening parentheses",
        "'" + inv_.name + "' is followed by '" + std::string(1, c) + "'",
        file_, line_};
}

void InvocationScanner::parse_arg(char c) {
    if (in_string_ || in_char_) {
        arg_ += c;
        if (escaped_) {
            escaped_ = false;
        } else if (c == '\\') {
            escaped_ = true;
        } else if (c == '\'' && in_char_) {
            in_char_ = false;
        } else if (c == '"' && in_string_) {
            in_string_ = false;
            if (paren_depth_ == 0) flush_arg();
        }
        return;
    }

    switch (c) {
    case ' ':
    case ',':
        if (paren_depth_ > 0) {
            arg_ += c;
        } else {
            flush_arg();
        }
        break;
    case '"':
        if (arg_.empty() || arg_.back() != '\\') in_string_ = true;
        arg_ += c;
        break;
    case '\'':
        if (opens_char_literal(arg_)) in_char_ = true;
        arg_ += c;
        break;
    case '(':
        arg_ += c;
        ++paren_depth_;
        break;
    case ')':
        if (paren_depth_ > 0) {
            arg_ += c;
            --paren_depth_;
        }
        if (paren_depth_ == 0) flush_arg();
        break;
    case ';':
        emit();
        break;
    default:
        arg_ += c;
        break;
    }
}

void InvocationScanner::flush_arg() {
    std::string arg = trim(arg_);
    arg_.clear();
    if (!arg.empty()) {
        inv_.args.push_back(std::move(arg));
    }
}

void InvocationScanner::emit() {
    flush_arg();
    inv_.end_line = line_;
    ++emitted_;

    log::debug("%s:%d-%d: %s with %zu argument(s)",
               file_.empty() ? "<input>" : file_.c_str(),
               inv_.start_line, inv_.end_line, inv_.name.c_str(), inv_.args.size());
    callback_(inv_);

    state_ = State::Search;
    paren_depth_ = 0;
    in_string_ = false;
    in_char_ = false;
    escaped_ = false;
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Status scan_invocations(std::istream& in, const NameSet& names,
                        const InvocationCallback& callback,
                        const ScanOptions& opts) {
    Scanner scanner(in, opts.filename);
    scanner.set_max_buffer(opts.max_buffer);
    InvocationScanner extractor(names, callback);

    while (scanner.next() != TokenType::Error) {
        CTEXT_TRY(extractor.feed(scanner.token()));
    }
    if (!scanner.at_eof()) {
        return scanner.error();
    }
    return extractor.finish();
}

Status scan_invocations(const std::string& source, const NameSet& names,
                        const InvocationCallback& callback,
                        const ScanOptions& opts) {
    std::istringstream in(source);
    return scan_invocations(in, names, callback, opts);
}

Result<std::vector<Invocation>> collect_invocations(const std::string& source,
                                                    const NameSet& names,
                                                    const ScanOptions& opts) {
    std::vector<Invocation> out;
    CTEXT_TRY(scan_invocations(source, names,
        [&out](const Invocation& inv) { out.push_back(inv); }, opts));
    return Result<std::vector<Invocation>>::ok(std::move(out));
}

} // namespace ctext
