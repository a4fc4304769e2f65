#include <tyck/lint_settings.hpp>

namespace tyck {

const char* severity_name(Severity s) {
    switch (s) {
        case Severity::Off:  return "off";
        case Severity::Warn: return "warn";
        case Severity::Err:  return "error";
    }
    return "unknown";
}

Result<Severity> parse_severity(const std::string& name) {
    if (name == "off" || name == "0") return Result<Severity>::ok(Severity::Off);
    if (name == "warn" || name == "1") return Result<Severity>::ok(Severity::Warn);
    if (name == "error" || name == "2") return Result<Severity>::ok(Severity::Err);
    return TyckError{TyckError::Config,
        "unknown lint severity '" + name + "'",
        "expected one of: off, warn, error"};
}

LintSettings LintSettings::with_value(const std::string& rule, Severity severity) const {
    LintSettings copy = *this;
    copy.explicit_[rule] = severity;
    return copy;
}

LintSettings LintSettings::with_default(Severity severity) const {
    LintSettings copy = *this;
    copy.default_ = severity;
    return copy;
}

Severity LintSettings::get_value(const std::string& rule) const {
    auto it = explicit_.find(rule);
    if (it == explicit_.end()) return default_;
    return it->second;
}

bool LintSettings::is_explicit(const std::string& rule) const {
    return explicit_.count(rule) > 0;
}

LintSettings StrictModeSettings::apply_to(const LintSettings& base) const {
    LintSettings out = base;
    for (const auto& rule : rules_) {
        out = out.with_value(rule, Severity::Err);
    }
    return out;
}

} // namespace tyck
