#pragma once

#include <tyck/file_key.hpp>
#include <tyck/lint_settings.hpp>
#include <tyck/pattern_list.hpp>
#include <tyck/result.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tyck {

enum class ModuleSystem { Node, Haste };

enum class SavedStateFetcher { Dummy, Local, Scm, Fb };

enum class ReactRuntime { Automatic, Classic };

enum class ComponentSyntax { Off, Parsing, FullSupport };

enum class CastingSyntax { Colon, As, Both };

enum class ChannelMode { Pipe, Socket };

// How JSX elements are desugared.
struct JsxMode {
    enum class Kind {
        React,   // React.createElement(name, props, ...children)
        Pragma   // `pragma(name, props, ...children)`
    };
    Kind kind = Kind::React;
    std::string pragma;   // Kind::Pragma: callee expression, e.g. "h" or "Preact.h"

    static JsxMode react() { return JsxMode{}; }
    static JsxMode with_pragma(std::string callee) {
        return JsxMode{Kind::Pragma, std::move(callee)};
    }

    bool operator==(const JsxMode& o) const { return kind == o.kind && pragma == o.pragma; }
    bool operator!=(const JsxMode& o) const { return !(*this == o); }
};

struct FormatOptions {
    bool bracket_spacing = true;
    bool single_quotes = false;

    bool operator==(const FormatOptions& o) const {
        return bracket_spacing == o.bracket_spacing && single_quotes == o.single_quotes;
    }
    bool operator!=(const FormatOptions& o) const { return !(*this == o); }
};

// Worker GC tuning. Absent values leave the runtime default in place.
struct GcControl {
    std::optional<int> minor_heap_size;
    std::optional<int> major_heap_increment;
    std::optional<int> space_overhead;
    std::optional<int> window_size;
    std::optional<int> custom_major_ratio;
    std::optional<int> custom_minor_ratio;
    std::optional<int> custom_minor_max_size;

    bool operator==(const GcControl& o) const;
    bool operator!=(const GcControl& o) const { return !(*this == o); }
};

// Thresholds for persisting timing samples of one logged event.
struct LogSaving {
    int threshold_time_ms = 0;
    std::optional<int> limit;
    double rate = 0.0;    // sampling probability in [0, 1]

    bool operator==(const LogSaving& o) const {
        return threshold_time_ms == o.threshold_time_ms && limit == o.limit && rate == o.rate;
    }
    bool operator!=(const LogSaving& o) const { return !(*this == o); }
};

struct SlowToCheckLogging {
    std::optional<double> slow_files_logging_threshold_time;
    std::optional<int> slow_expressions_logging_threshold;

    bool operator==(const SlowToCheckLogging& o) const {
        return slow_files_logging_threshold_time == o.slow_files_logging_threshold_time &&
               slow_expressions_logging_threshold == o.slow_expressions_logging_threshold;
    }
    bool operator!=(const SlowToCheckLogging& o) const { return !(*this == o); }
};

// Checker trace output settings.
struct Verbose {
    int indent = 2;
    int depth = 1;
    bool enabled_during_flowlib = false;
    std::optional<std::vector<std::string>> focused_files;

    bool operator==(const Verbose& o) const {
        return indent == o.indent && depth == o.depth &&
               enabled_during_flowlib == o.enabled_during_flowlib &&
               focused_files == o.focused_files;
    }
    bool operator!=(const Verbose& o) const { return !(*this == o); }
};

// Which files make up the project and how modules map to files.
struct FileOptions {
    std::optional<std::string> default_lib_dir;
    RegexList ignores;
    RegexList untyped;
    RegexList declarations;
    std::vector<std::string> includes;
    std::vector<std::string> lib_paths;
    std::vector<std::string> module_file_exts = {".js", ".mjs", ".cjs", ".jsx", ".json"};
    std::vector<std::string> module_resource_exts = {
        ".css", ".jpg", ".png", ".gif", ".eot", ".svg", ".ttf",
        ".woff", ".woff2", ".mp4", ".webm"};
    bool multi_platform = false;
    std::vector<std::string> node_resolver_dirnames = {"node_modules"};
    bool implicitly_include_root = true;

    bool operator==(const FileOptions& o) const;
    bool operator!=(const FileOptions& o) const { return !(*this == o); }
};

unsigned default_max_workers();

// Every tunable setting, each with a default. This is the mutable staging
// form; Options::create turns it into the immutable record.
struct OptionsData {
    bool all = false;
    bool any_propagation = true;
    bool autoimports = true;
    bool autoimports_ranked_by_usage = false;
    bool automatic_require_default = false;
    bool babel_loose_array_spread = false;
    CastingSyntax casting_syntax = CastingSyntax::As;
    ChannelMode channel_mode = ChannelMode::Pipe;
    ComponentSyntax component_syntax = ComponentSyntax::Off;
    std::vector<std::string> component_syntax_includes;
    bool component_syntax_deep_read_only = false;
    std::string config_hash;
    std::string config_name = ".tyckconfig";
    bool debug = false;
    bool direct_dependent_files_fix = true;
    bool distributed = false;
    bool enable_const_params = false;
    bool enable_relay_integration = false;
    std::map<std::string, std::string> enabled_rollouts;
    bool enforce_strict_call_arity = true;
    bool enums = false;
    bool estimate_recheck_time = true;
    bool exact_by_default = true;
    std::optional<std::string> facebook_fbs;
    std::optional<std::string> facebook_fbt;
    bool facebook_module_interop = false;
    FileOptions file_options;
    FormatOptions format;
    GcControl gc_worker;
    bool global_find_ref = false;
    bool global_rename = false;
    std::optional<std::string> haste_module_ref_prefix;
    std::optional<std::string> haste_module_ref_prefix_legacy_interop;
    PatternList<std::string> haste_name_reducers;
    std::vector<std::string> haste_paths_excludes = {"**/node_modules/**"};
    std::vector<std::string> haste_paths_includes = {"<PROJECT_ROOT>/**"};
    bool ignore_non_literal_requires = false;
    bool include_suppressions = false;
    bool include_warnings = false;
    bool incremental_error_collation = false;
    JsxMode jsx = JsxMode::react();
    bool lazy_mode = false;
    LintSettings lint_severities;
    std::string log_file;
    std::map<std::string, LogSaving> log_saving;
    bool long_lived_workers = false;
    int max_files_checked_per_worker = 100;
    int max_header_tokens = 10;
    int max_literal_length = 100;
    double max_seconds_for_check_per_worker = 5.0;
    int max_workers = static_cast<int>(default_max_workers());
    std::optional<double> merge_timeout = 100.0;
    PatternList<std::string> missing_module_generators;
    ModuleSystem module_system = ModuleSystem::Node;
    PatternList<std::string> module_name_mappers;
    bool modules_are_use_strict = false;
    bool munge_underscores = false;
    std::vector<std::string> node_main_fields = {"main"};
    bool node_resolver_allow_root_relative = false;
    std::vector<std::string> node_resolver_root_relative_dirnames = {""};
    bool profile = false;
    bool quiet = false;
    ReactRuntime react_runtime = ReactRuntime::Classic;
    int recursion_limit = 10000;
    RegexList relay_integration_excludes;
    std::optional<std::string> relay_integration_module_prefix;
    RegexList relay_integration_module_prefix_includes;
    bool renders_type_validation = false;
    std::vector<std::string> renders_type_validation_includes;
    std::string root;
    std::optional<std::string> root_name;
    bool saved_state_allow_reinit = true;
    SavedStateFetcher saved_state_fetcher = SavedStateFetcher::Dummy;
    bool saved_state_force_recheck = false;
    bool saved_state_no_fallback = false;
    bool saved_state_skip_version_check = false;
    bool saved_state_verify = false;
    SlowToCheckLogging slow_to_check_logging;
    bool strict_es6_import_export = false;
    std::vector<std::string> strict_es6_import_export_excludes;
    StrictModeSettings strict_mode;
    bool strip_root = false;
    std::set<std::string> suppress_types = {"$FlowFixMe"};
    std::string temp_dir = "/tmp/tyck";
    int traces = 0;
    bool use_mixed_in_catch_variables = false;
    std::optional<Verbose> verbose;
    bool wait_for_recheck = false;

    bool operator==(const OptionsData& o) const;
    bool operator!=(const OptionsData& o) const { return !(*this == o); }
};

// The immutable configuration record. Built once through create(), then
// shared by const reference; nothing here mutates after construction.
class Options {
public:
    // Fills derived defaults and rejects an incomplete record.
    static Result<Options> create(OptionsData data);

    // The staging form this record was built from, for layering a new record.
    const OptionsData& data() const { return data_; }

    bool operator==(const Options& o) const { return data_ == o.data_; }
    bool operator!=(const Options& o) const { return !(*this == o); }

    // ---- Accessors ----

    bool all() const { return data_.all; }
    bool any_propagation() const { return data_.any_propagation; }
    bool autoimports() const { return data_.autoimports; }
    bool autoimports_ranked_by_usage() const { return data_.autoimports_ranked_by_usage; }
    bool automatic_require_default() const { return data_.automatic_require_default; }
    bool babel_loose_array_spread() const { return data_.babel_loose_array_spread; }
    CastingSyntax casting_syntax() const { return data_.casting_syntax; }
    ChannelMode channel_mode() const { return data_.channel_mode; }
    ComponentSyntax component_syntax() const { return data_.component_syntax; }
    const std::vector<std::string>& component_syntax_includes() const { return data_.component_syntax_includes; }
    bool component_syntax_deep_read_only() const { return data_.component_syntax_deep_read_only; }
    const std::string& config_hash() const { return data_.config_hash; }
    const std::string& config_name() const { return data_.config_name; }
    bool direct_dependent_files_fix() const { return data_.direct_dependent_files_fix; }
    bool distributed() const { return data_.distributed; }
    bool enable_const_params() const { return data_.enable_const_params; }
    bool enable_relay_integration() const { return data_.enable_relay_integration; }
    const std::map<std::string, std::string>& enabled_rollouts() const { return data_.enabled_rollouts; }
    bool enforce_strict_call_arity() const { return data_.enforce_strict_call_arity; }
    bool enums() const { return data_.enums; }
    bool estimate_recheck_time() const { return data_.estimate_recheck_time; }
    bool exact_by_default() const { return data_.exact_by_default; }
    const std::optional<std::string>& facebook_fbs() const { return data_.facebook_fbs; }
    const std::optional<std::string>& facebook_fbt() const { return data_.facebook_fbt; }
    bool facebook_module_interop() const { return data_.facebook_module_interop; }
    const FileOptions& file_options() const { return data_.file_options; }
    bool format_bracket_spacing() const { return data_.format.bracket_spacing; }
    bool format_single_quotes() const { return data_.format.single_quotes; }
    const GcControl& gc_worker() const { return data_.gc_worker; }
    bool global_find_ref() const { return data_.global_find_ref; }
    bool global_rename() const { return data_.global_rename; }
    const std::optional<std::string>& haste_module_ref_prefix() const { return data_.haste_module_ref_prefix; }
    const std::optional<std::string>& haste_module_ref_prefix_legacy_interop() const {
        return data_.haste_module_ref_prefix_legacy_interop;
    }
    const PatternList<std::string>& haste_name_reducers() const { return data_.haste_name_reducers; }
    const std::vector<std::string>& haste_paths_excludes() const { return data_.haste_paths_excludes; }
    const std::vector<std::string>& haste_paths_includes() const { return data_.haste_paths_includes; }
    bool include_suppressions() const { return data_.include_suppressions; }
    bool incremental_error_collation() const { return data_.incremental_error_collation; }
    bool is_debug_mode() const { return data_.debug; }
    bool is_quiet() const { return data_.quiet; }
    const JsxMode& jsx() const { return data_.jsx; }
    bool lazy_mode() const { return data_.lazy_mode; }
    const LintSettings& lint_severities() const { return data_.lint_severities; }
    const std::string& log_file() const { return data_.log_file; }
    const std::map<std::string, LogSaving>& log_saving() const { return data_.log_saving; }
    bool long_lived_workers() const { return data_.long_lived_workers; }
    int max_files_checked_per_worker() const { return data_.max_files_checked_per_worker; }
    int max_header_tokens() const { return data_.max_header_tokens; }
    int max_literal_length() const { return data_.max_literal_length; }
    double max_seconds_for_check_per_worker() const { return data_.max_seconds_for_check_per_worker; }
    int max_trace_depth() const { return data_.traces; }
    int max_workers() const { return data_.max_workers; }
    std::optional<double> merge_timeout() const { return data_.merge_timeout; }
    const PatternList<std::string>& missing_module_generators() const { return data_.missing_module_generators; }
    const PatternList<std::string>& module_name_mappers() const { return data_.module_name_mappers; }
    ModuleSystem module_system() const { return data_.module_system; }
    bool modules_are_use_strict() const { return data_.modules_are_use_strict; }
    const std::vector<std::string>& node_main_fields() const { return data_.node_main_fields; }
    bool node_resolver_allow_root_relative() const { return data_.node_resolver_allow_root_relative; }
    const std::vector<std::string>& node_resolver_root_relative_dirnames() const {
        return data_.node_resolver_root_relative_dirnames;
    }
    ReactRuntime react_runtime() const { return data_.react_runtime; }
    int recursion_limit() const { return data_.recursion_limit; }
    const RegexList& relay_integration_excludes() const { return data_.relay_integration_excludes; }
    const std::optional<std::string>& relay_integration_module_prefix() const {
        return data_.relay_integration_module_prefix;
    }
    const RegexList& relay_integration_module_prefix_includes() const {
        return data_.relay_integration_module_prefix_includes;
    }
    bool renders_type_validation() const { return data_.renders_type_validation; }
    const std::vector<std::string>& renders_type_validation_includes() const {
        return data_.renders_type_validation_includes;
    }
    const std::string& root() const { return data_.root; }
    const std::optional<std::string>& root_name() const { return data_.root_name; }
    bool saved_state_allow_reinit() const { return data_.saved_state_allow_reinit; }
    SavedStateFetcher saved_state_fetcher() const { return data_.saved_state_fetcher; }
    bool saved_state_force_recheck() const { return data_.saved_state_force_recheck; }
    bool saved_state_no_fallback() const { return data_.saved_state_no_fallback; }
    bool saved_state_skip_version_check() const { return data_.saved_state_skip_version_check; }
    bool saved_state_verify() const { return data_.saved_state_verify; }
    bool should_ignore_non_literal_requires() const { return data_.ignore_non_literal_requires; }
    bool should_include_warnings() const { return data_.include_warnings; }
    bool should_munge_underscores() const { return data_.munge_underscores; }
    bool should_strip_root() const { return data_.strip_root; }
    const SlowToCheckLogging& slow_to_check_logging() const { return data_.slow_to_check_logging; }
    bool strict_es6_import_export() const { return data_.strict_es6_import_export; }
    const std::vector<std::string>& strict_es6_import_export_excludes() const {
        return data_.strict_es6_import_export_excludes;
    }
    const StrictModeSettings& strict_mode() const { return data_.strict_mode; }
    const std::set<std::string>& suppress_types() const { return data_.suppress_types; }
    const std::string& temp_dir() const { return data_.temp_dir; }
    bool use_mixed_in_catch_variables() const { return data_.use_mixed_in_catch_variables; }
    const std::optional<Verbose>& verbose() const { return data_.verbose; }
    bool wait_for_recheck() const { return data_.wait_for_recheck; }

    // ---- Derived decisions ----

    // Component syntax is fully checked. Implies parse_component_syntax().
    bool typecheck_component_syntax() const;
    bool parse_component_syntax() const;

    // Type-check component syntax globally, or because the file's normalized
    // path starts with a configured include. The include test is a raw string
    // prefix: "src/foo" also covers "src/foobar/x.js".
    bool typecheck_component_syntax_in_file(const FileKey& file) const;

    // Same widening rule as above, for renders type validation.
    bool renders_type_validation_in_file(const FileKey& file) const;

    // The global flag narrowed by raw-prefix excludes.
    bool strict_es6_import_export_in_file(const FileKey& file) const;

    // Quiet always wins over profile.
    bool should_profile() const;

    bool relay_integration_in_file(const FileKey& file) const;
    std::optional<std::string> relay_integration_module_prefix_for_file(const FileKey& file) const;

    // Whether `path` may define a haste module name. Always false for Node.
    bool is_haste_path(const std::string& path) const;

    // Value configured for a rollout; nullopt when the rollout is not active.
    std::optional<std::string> rollout_variant(const std::string& rollout) const;
    bool rollout_enabled(const std::string& rollout, const std::string& variant) const;

    Severity lint_severity(const std::string& rule) const;
    bool is_strict_lint(const std::string& rule) const;

    std::optional<LogSaving> log_saving_for(const std::string& event) const;

    // Module name after the first matching mapper, nullopt when none match.
    std::optional<std::string> map_module_name(const std::string& name) const;

    // Generator command for a module that failed to resolve.
    std::optional<std::string> missing_module_generator(const std::string& name) const;

    // Haste name for a file path after the first matching reducer.
    std::optional<std::string> reduce_haste_name(const std::string& path) const;

private:
    explicit Options(OptionsData data) : data_(std::move(data)) {}

    OptionsData data_;
};

const char* module_system_name(ModuleSystem m);
const char* saved_state_fetcher_name(SavedStateFetcher f);
const char* react_runtime_name(ReactRuntime r);
const char* component_syntax_name(ComponentSyntax c);
const char* casting_syntax_name(CastingSyntax c);
const char* channel_mode_name(ChannelMode c);

} // namespace tyck
