#pragma once

#include <ctext/result.hpp>
#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

namespace ctext {

struct StripOptions {
    std::string filename;
    size_t max_buffer = 0;
    // Write the newlines a comment contained so that the remaining code
    // keeps its line numbers
    bool keep_lines = false;
};

// Copy C source from in to out with every comment removed. Text between
// comments is written byte for byte (minus '\r'), including whitespace
// that preceded a trailing comment.
Status strip_comments(std::ostream& out, std::istream& in,
                      const StripOptions& opts = {});

Result<std::string> strip_comments(const std::string& source,
                                   const StripOptions& opts = {});

} // namespace ctext
