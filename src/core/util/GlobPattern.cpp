#include "GlobPattern.h"

namespace strata::core::util {

std::string globToRegex(const std::string& glob) {
    std::string out;
    out.reserve(glob.size() * 2 + 2);
    out.push_back('^');

    for (char c : glob) {
        switch (c) {
            case '*':
                out += ".*";
                break;
            case '?':
                out.push_back('.');
                break;
            case '.': case '\\': case '+': case '^': case '$': case '|':
            case '(': case ')': case '[': case ']': case '{': case '}':
                out.push_back('\\');
                out.push_back(c);
                break;
            default:
                out.push_back(c);
                break;
        }
    }

    out.push_back('$');
    return out;
}

GlobPattern::GlobPattern(const std::string& glob)
    : glob_(glob),
      regex_(globToRegex(glob), std::regex::ECMAScript | std::regex::icase) {}

bool GlobPattern::matches(const std::string& text) const {
    return std::regex_match(text, regex_);
}

} // namespace strata::core::util
