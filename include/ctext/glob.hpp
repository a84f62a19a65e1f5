#pragma once

#include <string>

namespace ctext {

// Match a glob pattern against an identifier.
// Supports: * (any run of chars), ? (single char), [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& text);

// True if the string contains any glob metacharacter
bool glob_has_meta(const std::string& s);

} // namespace ctext
