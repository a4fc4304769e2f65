#include <catch2/catch.hpp>
#include <tyck/options.hpp>
#include <functional>
#include <set>
#include <utility>
#include <vector>

using namespace tyck;

static Options make_options(const std::function<void(OptionsData&)>& tweak) {
    OptionsData data;
    data.root = "/project";
    tweak(data);
    auto r = Options::create(std::move(data));
    REQUIRE(r.is_ok());
    return r.value();
}

static const std::vector<ComponentSyntax> all_levels = {
    ComponentSyntax::Off, ComponentSyntax::Parsing, ComponentSyntax::FullSupport
};

// ===== Component syntax =====

TEST_CASE("component syntax levels map to (typechecked, parsed)", "[decisions]") {
    auto off = make_options([](OptionsData& d) { d.component_syntax = ComponentSyntax::Off; });
    REQUIRE_FALSE(off.typecheck_component_syntax());
    REQUIRE_FALSE(off.parse_component_syntax());

    auto parsing = make_options([](OptionsData& d) { d.component_syntax = ComponentSyntax::Parsing; });
    REQUIRE_FALSE(parsing.typecheck_component_syntax());
    REQUIRE(parsing.parse_component_syntax());

    auto full = make_options([](OptionsData& d) { d.component_syntax = ComponentSyntax::FullSupport; });
    REQUIRE(full.typecheck_component_syntax());
    REQUIRE(full.parse_component_syntax());
}

TEST_CASE("typechecked component syntax implies parsed", "[decisions]") {
    for (auto level : all_levels) {
        auto opts = make_options([&](OptionsData& d) { d.component_syntax = level; });
        if (opts.typecheck_component_syntax()) {
            REQUIRE(opts.parse_component_syntax());
        }
    }
}

// ===== Per-file component syntax =====

TEST_CASE("include prefix enables typechecking when global level is off", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.component_syntax = ComponentSyntax::Off;
        d.component_syntax_includes = {"src/components"};
    });
    REQUIRE(opts.typecheck_component_syntax_in_file(FileKey::source("src/components/Button.js")));
    REQUIRE_FALSE(opts.typecheck_component_syntax_in_file(FileKey::source("src/utils/math.js")));
}

TEST_CASE("include prefix enables typechecking when global level is parsing", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.component_syntax = ComponentSyntax::Parsing;
        d.component_syntax_includes = {"lib/", "src/ui"};
    });
    REQUIRE(opts.typecheck_component_syntax_in_file(FileKey::source("src/ui/App.js")));
    REQUIRE(opts.typecheck_component_syntax_in_file(FileKey::lib("lib/react.js")));
    REQUIRE_FALSE(opts.typecheck_component_syntax_in_file(FileKey::source("test/App.js")));
}

TEST_CASE("full support typechecks every file regardless of includes", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.component_syntax = ComponentSyntax::FullSupport;
        d.component_syntax_includes = {"src/ui"};
    });
    REQUIRE(opts.typecheck_component_syntax_in_file(FileKey::source("anywhere/else.js")));
}

TEST_CASE("empty include list equals the global predicate", "[decisions]") {
    const std::vector<std::string> paths = {
        "src/a.js", "", "/abs/path/b.js", "lib/c.js", "src/components/d.js"
    };
    for (auto level : all_levels) {
        auto opts = make_options([&](OptionsData& d) { d.component_syntax = level; });
        for (const auto& p : paths) {
            REQUIRE(opts.typecheck_component_syntax_in_file(FileKey::source(p)) ==
                    opts.typecheck_component_syntax());
        }
    }
}

TEST_CASE("include prefix is a raw string prefix, not a path segment", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.component_syntax_includes = {"src/foo"};
    });
    REQUIRE(opts.typecheck_component_syntax_in_file(FileKey::source("src/foo/x.js")));
    // Sharp edge: the prefix also covers a sibling directory sharing its name
    REQUIRE(opts.typecheck_component_syntax_in_file(FileKey::source("src/foobar/x.js")));
    REQUIRE(opts.typecheck_component_syntax_in_file(FileKey::source("src/foo.js")));
}

TEST_CASE("include prefix comparison is case sensitive", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.component_syntax_includes = {"src/foo"};
    });
    REQUIRE_FALSE(opts.typecheck_component_syntax_in_file(FileKey::source("Src/foo/x.js")));
    REQUIRE_FALSE(opts.typecheck_component_syntax_in_file(FileKey::source("./src/foo/x.js")));
}

// ===== Profiling =====

TEST_CASE("profiling truth table", "[decisions]") {
    struct Row { bool profile; bool quiet; bool expected; };
    const Row rows[] = {
        {false, false, false},
        {false, true,  false},
        {true,  false, true},
        {true,  true,  false},
    };
    for (const auto& row : rows) {
        auto opts = make_options([&](OptionsData& d) {
            d.profile = row.profile;
            d.quiet = row.quiet;
        });
        INFO("profile=" << row.profile << " quiet=" << row.quiet);
        REQUIRE(opts.should_profile() == row.expected);
    }
}

// ===== Renders / strict es6 =====

TEST_CASE("renders validation widens by prefix", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.renders_type_validation = false;
        d.renders_type_validation_includes = {"src/renders"};
    });
    REQUIRE(opts.renders_type_validation_in_file(FileKey::source("src/renders/a.js")));
    REQUIRE_FALSE(opts.renders_type_validation_in_file(FileKey::source("src/other/a.js")));

    auto global = make_options([](OptionsData& d) { d.renders_type_validation = true; });
    REQUIRE(global.renders_type_validation_in_file(FileKey::source("src/other/a.js")));
}

TEST_CASE("strict es6 import export narrows by exclude prefix", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.strict_es6_import_export = true;
        d.strict_es6_import_export_excludes = {"legacy/"};
    });
    REQUIRE(opts.strict_es6_import_export_in_file(FileKey::source("src/a.js")));
    REQUIRE_FALSE(opts.strict_es6_import_export_in_file(FileKey::source("legacy/a.js")));

    auto off = make_options([](OptionsData& d) { d.strict_es6_import_export = false; });
    REQUIRE_FALSE(off.strict_es6_import_export_in_file(FileKey::source("src/a.js")));
}

// ===== Relay =====

TEST_CASE("relay integration respects excludes", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.enable_relay_integration = true;
        d.relay_integration_excludes = RegexList::compile({"/project/legacy/"}).value();
    });
    REQUIRE(opts.relay_integration_in_file(FileKey::source("/project/src/a.js")));
    REQUIRE_FALSE(opts.relay_integration_in_file(FileKey::source("/project/legacy/a.js")));

    auto disabled = make_options([](OptionsData& d) { d.enable_relay_integration = false; });
    REQUIRE_FALSE(disabled.relay_integration_in_file(FileKey::source("/project/src/a.js")));
}

TEST_CASE("relay module prefix applies to matching includes only", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.relay_integration_module_prefix = std::string("__generated__/");
        d.relay_integration_module_prefix_includes = RegexList::compile({"/project/web/"}).value();
    });
    auto hit = opts.relay_integration_module_prefix_for_file(FileKey::source("/project/web/a.js"));
    REQUIRE(hit.has_value());
    REQUIRE(*hit == "__generated__/");
    REQUIRE_FALSE(opts.relay_integration_module_prefix_for_file(
        FileKey::source("/project/mobile/a.js")).has_value());
}

TEST_CASE("relay module prefix with no includes applies everywhere", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.relay_integration_module_prefix = std::string("gen/");
    });
    REQUIRE(opts.relay_integration_module_prefix_for_file(FileKey::source("x.js")) == std::string("gen/"));

    auto none = make_options([](OptionsData&) {});
    REQUIRE_FALSE(none.relay_integration_module_prefix_for_file(FileKey::source("x.js")).has_value());
}

// ===== Haste paths =====

TEST_CASE("haste paths are empty under the node module system", "[decisions]") {
    auto opts = make_options([](OptionsData& d) { d.module_system = ModuleSystem::Node; });
    REQUIRE_FALSE(opts.is_haste_path("/project/src/a.js"));
}

TEST_CASE("haste paths use project root includes and node_modules excludes", "[decisions]") {
    auto opts = make_options([](OptionsData& d) { d.module_system = ModuleSystem::Haste; });
    REQUIRE(opts.is_haste_path("/project/src/a.js"));
    REQUIRE_FALSE(opts.is_haste_path("/project/node_modules/react/index.js"));
    REQUIRE_FALSE(opts.is_haste_path("/elsewhere/a.js"));
}

TEST_CASE("haste paths tolerate a root with a trailing slash", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.module_system = ModuleSystem::Haste;
        d.root = "/project/";
    });
    REQUIRE(opts.is_haste_path("/project/src/a.js"));
    REQUIRE_FALSE(opts.is_haste_path("/project/node_modules/react/index.js"));
}

// ===== Rollouts =====

TEST_CASE("rollout lookup is exact", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.enabled_rollouts = {{"new_merge", "enabled"}, {"fast_path", ""}};
    });
    REQUIRE(opts.rollout_variant("new_merge") == std::string("enabled"));
    REQUIRE(opts.rollout_enabled("new_merge", "enabled"));
    REQUIRE_FALSE(opts.rollout_enabled("new_merge", "disabled"));
    REQUIRE_FALSE(opts.rollout_variant("new").has_value());
    REQUIRE_FALSE(opts.rollout_variant("NEW_MERGE").has_value());
    // Present with an empty variant is still present
    REQUIRE(opts.rollout_variant("fast_path") == std::string(""));
}

// ===== Pattern lists through Options =====

TEST_CASE("module name mappers resolve first match", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.module_name_mappers = PatternList<std::string>::compile({
            {"^image!(.*)$", "stubs/$1"},
            {"^image!", "never"},
        }).value();
    });
    REQUIRE(opts.map_module_name("image!logo") == std::string("stubs/logo"));
    REQUIRE_FALSE(opts.map_module_name("react").has_value());
}

TEST_CASE("missing module generator returns the configured command", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.missing_module_generators = PatternList<std::string>::compile({
            {"^gen/", "make gen"},
        }).value();
    });
    REQUIRE(opts.missing_module_generator("gen/types") == std::string("make gen"));
    REQUIRE_FALSE(opts.missing_module_generator("src/types").has_value());
}

TEST_CASE("haste name reducer rewrites a path", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.haste_name_reducers = PatternList<std::string>::compile({
            {"^.*/([a-zA-Z0-9$_.-]+)\\.js$", "$1"},
        }).value();
    });
    REQUIRE(opts.reduce_haste_name("/project/src/Button.js") == std::string("Button"));
    REQUIRE_FALSE(opts.reduce_haste_name("/project/src/style.css").has_value());
}

// ===== Lints / log saving =====

TEST_CASE("lint severity falls back to the default", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.lint_severities = LintSettings(Severity::Warn).with_value("sketchy-null", Severity::Err);
        d.strict_mode = StrictModeSettings(std::set<std::string>{"unclear-type"});
    });
    REQUIRE(opts.lint_severity("sketchy-null") == Severity::Err);
    REQUIRE(opts.lint_severity("untyped-import") == Severity::Warn);
    REQUIRE(opts.is_strict_lint("unclear-type"));
    REQUIRE_FALSE(opts.is_strict_lint("sketchy-null"));
}

TEST_CASE("log saving lookup by event", "[decisions]") {
    auto opts = make_options([](OptionsData& d) {
        d.log_saving["recheck"] = LogSaving{500, 10, 0.5};
    });
    auto saving = opts.log_saving_for("recheck");
    REQUIRE(saving.has_value());
    REQUIRE(saving->threshold_time_ms == 500);
    REQUIRE(saving->limit == 10);
    REQUIRE(saving->rate == 0.5);
    REQUIRE_FALSE(opts.log_saving_for("init").has_value());
}
