// demo_options.cpp
//
// Builds the effective options for a project root and prints what the
// derived decisions say about a few files. Run it with:
//
//     ./demo_options                               # no args -> "missing arg" error
//     ./demo_options path/to/project               # reads <root>/.tyckconfig.toml
//     ./demo_options path/to/project src/a.js lib/b.js
//
// Set TYCK_LOG=debug to see which config layers were applied.

#include <tyck/config.hpp>
#include <tyck/log.hpp>
#include <tyck/options.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace tyck;

static Result<std::string> parse_args(int argc, char** argv) {
    if (argc < 2) {
        return TyckError{
            TyckError::InvalidArg,
            "no project root specified",
            "usage: demo_options <root> [file...]"
        };
    }
    return Result<std::string>::ok(argv[1]);
}

static const char* yes_no(bool b) {
    return b ? "yes" : "no";
}

static void print_summary(const Options& opts) {
    std::cout << "root:              " << opts.root() << "\n"
              << "config hash:       " << opts.config_hash() << "\n"
              << "module system:     " << module_system_name(opts.module_system()) << "\n"
              << "component syntax:  " << component_syntax_name(opts.component_syntax()) << "\n"
              << "casting syntax:    " << casting_syntax_name(opts.casting_syntax()) << "\n"
              << "react runtime:     " << react_runtime_name(opts.react_runtime()) << "\n"
              << "saved state:       " << saved_state_fetcher_name(opts.saved_state_fetcher()) << "\n"
              << "max workers:       " << opts.max_workers() << "\n"
              << "log file:          " << opts.log_file() << "\n"
              << "profiling:         " << yes_no(opts.should_profile()) << "\n";

    const JsxMode& jsx = opts.jsx();
    switch (jsx.kind) {
        case JsxMode::Kind::React:
            std::cout << "jsx:               React.createElement\n";
            break;
        case JsxMode::Kind::Pragma:
            std::cout << "jsx:               " << jsx.pragma << "\n";
            break;
    }

    for (const auto& [name, variant] : opts.enabled_rollouts()) {
        std::cout << "rollout:           " << name << " = " << variant << "\n";
    }
}

static void print_file(const Options& opts, const std::string& path) {
    FileKey file = FileKey::source(path);
    std::cout << "\n" << path << "\n"
              << "  typecheck components:  " << yes_no(opts.typecheck_component_syntax_in_file(file)) << "\n"
              << "  renders validation:    " << yes_no(opts.renders_type_validation_in_file(file)) << "\n"
              << "  strict es6 imports:    " << yes_no(opts.strict_es6_import_export_in_file(file)) << "\n"
              << "  relay integration:     " << yes_no(opts.relay_integration_in_file(file)) << "\n"
              << "  haste path:            " << yes_no(opts.is_haste_path(path)) << "\n";

    if (auto prefix = opts.relay_integration_module_prefix_for_file(file)) {
        std::cout << "  relay module prefix:   " << *prefix << "\n";
    }
    if (auto reduced = opts.reduce_haste_name(path)) {
        std::cout << "  haste name:            " << *reduced << "\n";
    }
}

int main(int argc, char** argv) {
    log::init_from_env();

    auto root = parse_args(argc, argv);
    if (root.is_err()) {
        std::cerr << root.error().format() << "\n";
        return 1;
    }

    std::vector<std::string> layers = {
        global_config_path(),
        project_config_path(root.value(), ".tyckconfig"),
    };

    auto opts = effective_options(root.value(), layers);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 1;
    }

    print_summary(opts.value());
    for (int i = 2; i < argc; i++) {
        print_file(opts.value(), argv[i]);
    }
    return 0;
}
