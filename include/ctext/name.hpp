#pragma once

#include <ctext/result.hpp>
#include <string>
#include <unordered_set>
#include <vector>

namespace ctext {

// Target macro name: a C identifier [A-Za-z_][A-Za-z0-9_]*, or a glob
// pattern over identifiers such as "LOG_*" or "TRACE[0-9]".
struct MacroName {
    static Result<MacroName> parse(const std::string& raw);

    const std::string& raw() const { return raw_; }
    bool is_pattern() const { return pattern_; }
    bool matches(const std::string& ident) const;

private:
    std::string raw_;
    bool pattern_ = false;
};

// The set of macro names an extraction run looks for. Plain names are
// matched exactly, patterns with glob_match(); a match always covers a
// whole identifier.
class NameSet {
public:
    static Result<NameSet> create(const std::vector<std::string>& raw);

    bool matches(const std::string& ident) const;

    bool empty() const { return names_.empty(); }
    size_t size() const { return names_.size(); }
    const std::vector<MacroName>& names() const { return names_; }

private:
    std::vector<MacroName> names_;
    std::unordered_set<std::string> exact_;
    std::vector<MacroName> patterns_;
};

bool is_ident_start(char c);
bool is_ident_char(char c);

// Whether a single quote that follows preceding opens a character
// constant. A quote right after an identifier or number ("don't",
// "1'000") does not, unless that word is an encoding prefix (L, u, U,
// u8). A quote after a backslash never does.
bool opens_char_literal(const std::string& preceding);

} // namespace ctext
