#include <ctext/lang/strip.hpp>
#include <ctext/lang/scanner.hpp>
#include <algorithm>
#include <sstream>

namespace ctext {

Status strip_comments(std::ostream& out, std::istream& in,
                      const StripOptions& opts) {
    Scanner scanner(in, opts.filename);
    scanner.set_max_buffer(opts.max_buffer);

    TokenType tt;
    while ((tt = scanner.next()) != TokenType::Error) {
        const std::string& text = scanner.token_text();
        if (tt == TokenType::Text) {
            out.write(text.data(), static_cast<std::streamsize>(text.size()));
        } else if (opts.keep_lines) {
            auto n = std::count(text.begin(), text.end(), '\n');
            out << std::string(static_cast<size_t>(n), '\n');
        }
        if (!out) {
            return CtextError{CtextError::IO, "write error on output stream",
                "", opts.filename, scanner.token().pos.line};
        }
    }
    if (!scanner.at_eof()) {
        return scanner.error();
    }
    return ok_status();
}

Result<std::string> strip_comments(const std::string& source,
                                   const StripOptions& opts) {
    std::istringstream in(source);
    std::ostringstream out;
    CTEXT_TRY(strip_comments(out, in, opts));
    return Result<std::string>::ok(out.str());
}

} // namespace ctext
