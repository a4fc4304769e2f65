#pragma once

#include <tyck/result.hpp>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace tyck {

// A compiled regular expression that remembers its source text.
// Two patterns are equal when their sources are equal.
class Pattern {
public:
    static Result<Pattern> compile(const std::string& source);

    const std::string& source() const { return source_; }

    // True when the expression matches starting at offset 0 of `input`.
    // The match does not have to consume the whole input.
    bool matches(const std::string& input) const;

    // Replace every match in `input` with `replacement` ("$1" group syntax).
    std::string replace(const std::string& input, const std::string& replacement) const;

    bool operator==(const Pattern& other) const { return source_ == other.source_; }
    bool operator!=(const Pattern& other) const { return !(*this == other); }

private:
    Pattern(std::string source, std::regex re)
        : source_(std::move(source)), re_(std::move(re)) {}

    std::string source_;
    std::regex re_;
};

// Convert "\1"-style group references into the "$01" form std::regex uses.
// "\0" is the whole match.
std::string translate_backrefs(const std::string& replacement);

// Ordered (pattern, value) pairs. Lookup is first-match-wins, so order is
// exactly the configured order.
template<typename T>
class PatternList {
public:
    using Entry = std::pair<Pattern, T>;

    PatternList() = default;
    explicit PatternList(std::vector<Entry> entries) : entries_(std::move(entries)) {}

    static Result<PatternList> compile(const std::vector<std::pair<std::string, T>>& raw) {
        std::vector<Entry> entries;
        entries.reserve(raw.size());
        for (const auto& [source, value] : raw) {
            auto pat = Pattern::compile(source);
            if (pat.is_err()) return std::move(pat).error();
            entries.emplace_back(std::move(pat).value(), value);
        }
        return Result<PatternList>::ok(PatternList(std::move(entries)));
    }

    // Value of the first matching pattern, nullptr when nothing matches.
    const T* find(const std::string& input) const {
        const Entry* e = find_entry(input);
        return e ? &e->second : nullptr;
    }

    const Entry* find_entry(const std::string& input) const {
        for (const auto& entry : entries_) {
            if (entry.first.matches(input)) return &entry;
        }
        return nullptr;
    }

    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    bool operator==(const PatternList& other) const { return entries_ == other.entries_; }
    bool operator!=(const PatternList& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

// Rewrite `input` with the replacement template of the first matching
// pattern. nullopt when no pattern matches; an empty string is a valid
// rewrite result.
std::optional<std::string> rewrite_first(const PatternList<std::string>& list,
                                         const std::string& input);

// Ordered patterns without associated values.
class RegexList {
public:
    RegexList() = default;
    explicit RegexList(std::vector<Pattern> patterns) : patterns_(std::move(patterns)) {}

    static Result<RegexList> compile(const std::vector<std::string>& sources);

    bool matches_any(const std::string& input) const;

    const std::vector<Pattern>& patterns() const { return patterns_; }
    size_t size() const { return patterns_.size(); }
    bool empty() const { return patterns_.empty(); }

    bool operator==(const RegexList& other) const { return patterns_ == other.patterns_; }
    bool operator!=(const RegexList& other) const { return !(*this == other); }

private:
    std::vector<Pattern> patterns_;
};

} // namespace tyck
