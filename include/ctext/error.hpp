#pragma once

#include <string>

namespace ctext {

struct CtextError {
    enum Code {
        IO,
        Eof,
        UnterminatedComment,
        TokenTooLarge,
        MissingParen,
        MissingSemicolon,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    CtextError() = default;
    CtextError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    CtextError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    CtextError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace ctext
