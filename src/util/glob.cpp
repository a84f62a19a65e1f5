#include <ctext/glob.hpp>

namespace ctext {

static bool match_from(const std::string& pat, size_t pi,
                       const std::string& str, size_t si) {
    while (pi < pat.size() && si < str.size()) {
        char pc = pat[pi];

        if (pc == '*') {
            pi++;
            // Consecutive stars collapse
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_from(pat, pi, str, k)) return true;
            }
            return false;
        }

        if (pc == '?') {
            pi++;
            si++;
            continue;
        }

        if (pc == '[') {
            pi++; // skip '['
            bool negate = false;
            if (pi < pat.size() && pat[pi] == '!') {
                negate = true;
                pi++;
            }
            bool matched = false;
            char sc = str[si];
            while (pi < pat.size() && pat[pi] != ']') {
                char lo = pat[pi];
                if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
                    char hi = pat[pi + 2];
                    if (sc >= lo && sc <= hi) matched = true;
                    pi += 3;
                } else {
                    if (sc == lo) matched = true;
                    pi++;
                }
            }
            if (pi < pat.size()) pi++; // skip ']'
            if (negate) matched = !matched;
            if (!matched) return false;
            si++;
            continue;
        }

        if (pc != str[si]) return false;
        pi++;
        si++;
    }

    while (pi < pat.size() && pat[pi] == '*') pi++;

    return pi == pat.size() && si == str.size();
}

bool glob_match(const std::string& pattern, const std::string& text) {
    return match_from(pattern, 0, text, 0);
}

bool glob_has_meta(const std::string& s) {
    return s.find_first_of("*?[") != std::string::npos;
}

} // namespace ctext
