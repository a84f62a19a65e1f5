#pragma once

#include <ctext/lang/token.hpp>
#include <ctext/name.hpp>
#include <ctext/result.hpp>
#include <cstddef>
#include <functional>
#include <istream>
#include <string>
#include <vector>

namespace ctext {

// One call of a function-like macro
struct Invocation {
    std::string name;
    int start_line = 0;   // line of the macro name
    int end_line = 0;     // line of the terminating ';'
    std::vector<std::string> args;

    // "NAME( a, b );"
    std::string str() const;
};

bool operator==(const Invocation& a, const Invocation& b);
bool operator!=(const Invocation& a, const Invocation& b);

using InvocationCallback = std::function<void(const Invocation&)>;

struct ScanOptions {
    std::string filename;
    size_t max_buffer = 0;  // see Scanner::set_max_buffer
};

// Finds invocations of the named macros in a stream of scanner tokens.
//
// Text tokens are read as one continuous character stream; comment tokens
// are ignored, so a comment inside an argument list acts as nothing at all
// and a macro name inside a comment never matches. Names inside string or
// character literals never match either.
class InvocationScanner {
public:
    InvocationScanner(const NameSet& names, InvocationCallback callback);

    // Process the next token in source order
    Status feed(const Token& tok);

    // Call once after the last token; fails if an invocation is still open
    Status finish();

    size_t count() const { return emitted_; }

private:
    enum class State { Search, AwaitParen, Args };

    Status step(char c);
    Status search(char c);
    Status await_paren(char c);
    void parse_arg(char c);
    Status end_identifier();
    bool skip_occurrence() const;
    void flush_arg();
    void emit();

    const NameSet& names_;
    InvocationCallback callback_;
    size_t emitted_ = 0;

    State state_ = State::Search;
    std::string file_;
    int line_ = 1;

    // Current source line, used to recognise preprocessor directives
    std::string line_text_;

    bool in_string_ = false;
    bool in_char_ = false;
    bool escaped_ = false;

    std::string ident_;
    int ident_line_ = 0;
    size_t ident_col_ = 0;  // offset of ident_ within line_text_

    Invocation inv_;
    int paren_depth_ = 0;
    std::string arg_;
};

// Scan a stream for invocations of the given names, calling back once per
// invocation in source order. Invocations reported before an error stand.
Status scan_invocations(std::istream& in, const NameSet& names,
                        const InvocationCallback& callback,
                        const ScanOptions& opts = {});

Status scan_invocations(const std::string& source, const NameSet& names,
                        const InvocationCallback& callback,
                        const ScanOptions& opts = {});

Result<std::vector<Invocation>> collect_invocations(const std::string& source,
                                                    const NameSet& names,
                                                    const ScanOptions& opts = {});

} // namespace ctext
