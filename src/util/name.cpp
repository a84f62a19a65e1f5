#include <ctext/name.hpp>
#include <ctext/glob.hpp>
#include <cctype>

namespace ctext {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool opens_char_literal(const std::string& preceding) {
    if (preceding.empty()) return true;
    char last = preceding.back();
    if (last == '\\') return false;
    if (!is_ident_char(last)) return true;

    size_t start = preceding.size();
    while (start > 0 && is_ident_char(preceding[start - 1])) --start;
    std::string word = preceding.substr(start);
    return word == "L" || word == "u" || word == "U" || word == "u8";
}

static bool is_glob_char(char c) {
    return c == '*' || c == '?' || c == '[' || c == ']' || c == '!' || c == '-';
}

Result<MacroName> MacroName::parse(const std::string& raw) {
    if (raw.empty()) {
        return CtextError{CtextError::InvalidArg, "empty macro name"};
    }

    MacroName name;
    name.raw_ = raw;
    name.pattern_ = glob_has_meta(raw);

    if (!name.pattern_ && !is_ident_start(raw[0])) {
        return CtextError{CtextError::InvalidArg,
            "invalid macro name '" + raw + "'",
            "macro names must start with a letter or '_'"};
    }

    for (char c : raw) {
        if (is_ident_char(c)) continue;
        if (name.pattern_ && is_glob_char(c)) continue;
        return CtextError{CtextError::InvalidArg,
            "invalid character '" + std::string(1, c) +
            "' in macro name '" + raw + "'",
            name.pattern_ ? "allowed: [A-Za-z0-9_] and glob characters *?[]!-"
                          : "allowed: [A-Za-z0-9_]"};
    }

    return Result<MacroName>::ok(std::move(name));
}

bool MacroName::matches(const std::string& ident) const {
    return pattern_ ? glob_match(raw_, ident) : raw_ == ident;
}

Result<NameSet> NameSet::create(const std::vector<std::string>& raw) {
    NameSet set;
    for (const auto& r : raw) {
        auto name = MacroName::parse(r);
        if (name.is_err()) return std::move(name).error();

        if (name.value().is_pattern()) {
            set.patterns_.push_back(name.value());
        } else if (!set.exact_.insert(r).second) {
            continue; // duplicate
        }
        set.names_.push_back(std::move(name).value());
    }
    return Result<NameSet>::ok(std::move(set));
}

bool NameSet::matches(const std::string& ident) const {
    if (ident.empty() || !is_ident_start(ident[0])) return false;
    if (exact_.count(ident)) return true;
    for (const auto& p : patterns_) {
        if (p.matches(ident)) return true;
    }
    return false;
}

} // namespace ctext
