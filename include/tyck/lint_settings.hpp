#pragma once

#include <tyck/result.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tyck {

enum class Severity { Off, Warn, Err };

const char* severity_name(Severity s);
Result<Severity> parse_severity(const std::string& name);

// Severity per lint rule, with a fallback for rules never mentioned.
class LintSettings {
public:
    LintSettings() = default;
    explicit LintSettings(Severity default_severity)
        : default_(default_severity) {}

    // Returns a copy with `rule` set to `severity`.
    LintSettings with_value(const std::string& rule, Severity severity) const;

    // Returns a copy whose fallback severity is `severity`. Explicit rules stay.
    LintSettings with_default(Severity severity) const;

    Severity default_value() const { return default_; }
    Severity get_value(const std::string& rule) const;
    bool is_explicit(const std::string& rule) const;
    bool is_enabled(const std::string& rule) const { return get_value(rule) != Severity::Off; }

    // Rules with an explicit severity, in name order.
    const std::map<std::string, Severity>& explicit_values() const { return explicit_; }

    bool operator==(const LintSettings& other) const {
        return default_ == other.default_ && explicit_ == other.explicit_;
    }
    bool operator!=(const LintSettings& other) const { return !(*this == other); }

private:
    Severity default_ = Severity::Off;
    std::map<std::string, Severity> explicit_;
};

// Lint rules that a "@flow strict"-style file opts into.
class StrictModeSettings {
public:
    StrictModeSettings() = default;
    explicit StrictModeSettings(std::set<std::string> rules) : rules_(std::move(rules)) {}

    bool contains(const std::string& rule) const { return rules_.count(rule) > 0; }
    const std::set<std::string>& rules() const { return rules_; }
    bool empty() const { return rules_.empty(); }

    // Strict files report every strict rule as an error on top of `base`.
    LintSettings apply_to(const LintSettings& base) const;

    bool operator==(const StrictModeSettings& other) const { return rules_ == other.rules_; }
    bool operator!=(const StrictModeSettings& other) const { return !(*this == other); }

private:
    std::set<std::string> rules_;
};

} // namespace tyck
