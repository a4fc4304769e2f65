#include <tyck/pattern_list.hpp>
#include <algorithm>
#include <cctype>

namespace tyck {

Result<Pattern> Pattern::compile(const std::string& source) {
    try {
        std::regex re(source, std::regex::ECMAScript);
        return Result<Pattern>::ok(Pattern(source, std::move(re)));
    } catch (const std::regex_error& e) {
        return TyckError{TyckError::Regex,
            "invalid regular expression '" + source + "': " + e.what()};
    }
}

bool Pattern::matches(const std::string& input) const {
    return std::regex_search(input, re_, std::regex_constants::match_continuous);
}

std::string Pattern::replace(const std::string& input, const std::string& replacement) const {
    return std::regex_replace(input, re_, replacement);
}

std::string translate_backrefs(const std::string& replacement) {
    std::string out;
    out.reserve(replacement.size());
    for (size_t i = 0; i < replacement.size(); i++) {
        char c = replacement[i];
        if (c == '\\' && i + 1 < replacement.size()) {
            char next = replacement[i + 1];
            // "\N" is always a single-digit group. Emit the two-digit "$0N" form so
            // a digit that follows stays literal ("\10" is group 1 then '0').
            if (next == '0') {
                out += "$&";
                i++;
                continue;
            }
            if (std::isdigit(static_cast<unsigned char>(next))) {
                out += "$0";
                out.push_back(next);
                i++;
                continue;
            }
            if (next == '\\') {
                out.push_back('\\');
                i++;
                continue;
            }
        }
        // A literal '$' must not be read as a group reference
        if (c == '$') {
            out += "$$";
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::optional<std::string> rewrite_first(const PatternList<std::string>& list,
                                         const std::string& input) {
    const auto* entry = list.find_entry(input);
    if (!entry) return std::nullopt;
    return entry->first.replace(input, entry->second);
}

Result<RegexList> RegexList::compile(const std::vector<std::string>& sources) {
    std::vector<Pattern> patterns;
    patterns.reserve(sources.size());
    for (const auto& source : sources) {
        auto pat = Pattern::compile(source);
        if (pat.is_err()) return std::move(pat).error();
        patterns.push_back(std::move(pat).value());
    }
    return Result<RegexList>::ok(RegexList(std::move(patterns)));
}

bool RegexList::matches_any(const std::string& input) const {
    return std::any_of(patterns_.begin(), patterns_.end(),
                       [&](const Pattern& p) { return p.matches(input); });
}

} // namespace tyck
