#include <catch2/catch.hpp>
#include <tyck/lint_settings.hpp>
#include <set>
#include <string>

using namespace tyck;

TEST_CASE("parse severity names and numbers", "[lint]") {
    REQUIRE(parse_severity("off").value() == Severity::Off);
    REQUIRE(parse_severity("warn").value() == Severity::Warn);
    REQUIRE(parse_severity("error").value() == Severity::Err);
    REQUIRE(parse_severity("2").value() == Severity::Err);
    auto bad = parse_severity("fatal");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == TyckError::Config);
}

TEST_CASE("severity names", "[lint]") {
    REQUIRE(std::string(severity_name(Severity::Err)) == "error");
    REQUIRE(std::string(severity_name(Severity::Off)) == "off");
}

TEST_CASE("unset rules use the default", "[lint]") {
    LintSettings lints(Severity::Warn);
    REQUIRE(lints.get_value("anything") == Severity::Warn);
    REQUIRE_FALSE(lints.is_explicit("anything"));
    REQUIRE(lints.is_enabled("anything"));
    REQUIRE_FALSE(LintSettings().is_enabled("anything"));
}

TEST_CASE("with_value returns a new table", "[lint]") {
    LintSettings base;
    LintSettings changed = base.with_value("sketchy-null", Severity::Err);
    REQUIRE(base.get_value("sketchy-null") == Severity::Off);
    REQUIRE(changed.get_value("sketchy-null") == Severity::Err);
    REQUIRE(changed.is_explicit("sketchy-null"));
    REQUIRE(base != changed);
}

TEST_CASE("with_default keeps explicit rules", "[lint]") {
    LintSettings lints = LintSettings().with_value("a", Severity::Off).with_default(Severity::Err);
    REQUIRE(lints.default_value() == Severity::Err);
    REQUIRE(lints.get_value("a") == Severity::Off);
    REQUIRE(lints.get_value("b") == Severity::Err);
    REQUIRE(lints.explicit_values().size() == 1);
}

TEST_CASE("strict mode raises its rules to errors", "[lint]") {
    StrictModeSettings strict(std::set<std::string>{"unclear-type", "untyped-import"});
    LintSettings base = LintSettings(Severity::Warn).with_value("unclear-type", Severity::Off);
    LintSettings applied = strict.apply_to(base);
    REQUIRE(applied.get_value("unclear-type") == Severity::Err);
    REQUIRE(applied.get_value("untyped-import") == Severity::Err);
    REQUIRE(applied.get_value("sketchy-null") == Severity::Warn);
    REQUIRE(strict.contains("untyped-import"));
    REQUIRE_FALSE(StrictModeSettings().contains("untyped-import"));
}
