#include <tyck/config.hpp>
#include <tyck/log.hpp>
#include <tomlplusplus/toml.hpp>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>
#include <unordered_map>

namespace tyck {

namespace fs = std::filesystem;

namespace {

// ---------------------------------------------------------------------------
// Node readers
// ---------------------------------------------------------------------------

std::optional<int> node_int(const toml::node& val) {
    auto i = val.as_integer();
    if (!i) return std::nullopt;
    int64_t v = i->get();
    if (v < INT_MIN || v > INT_MAX) return std::nullopt;
    return static_cast<int>(v);
}

std::optional<double> node_double(const toml::node& val) {
    if (auto f = val.as_floating_point()) return f->get();
    if (auto i = val.as_integer()) return static_cast<double>(i->get());
    return std::nullopt;
}

std::optional<std::vector<std::string>> node_string_list(const toml::node& val) {
    auto arr = val.as_array();
    if (!arr) return std::nullopt;
    std::vector<std::string> out;
    for (const auto& el : *arr) {
        auto s = el.as_string();
        if (!s) return std::nullopt;
        out.push_back(s->get());
    }
    return out;
}

TyckError type_error(const std::string& key, const char* expected) {
    return TyckError{TyckError::Config, "option '" + key + "' must be " + expected};
}

// ---------------------------------------------------------------------------
// Member setters
// ---------------------------------------------------------------------------

template<typename S>
using Setter = std::function<Status(const std::string& key, const toml::node& val, S& target)>;

template<typename S>
using SetterMap = std::unordered_map<std::string, Setter<S>>;

template<typename S>
Setter<S> bool_member(bool S::*m) {
    return [m](const std::string& key, const toml::node& val, S& target) -> Status {
        auto v = val.value<bool>();
        if (!v) return type_error(key, "a boolean");
        target.*m = *v;
        return ok_status();
    };
}

template<typename S>
Setter<S> int_member(int S::*m) {
    return [m](const std::string& key, const toml::node& val, S& target) -> Status {
        auto v = node_int(val);
        if (!v) return type_error(key, "an integer");
        target.*m = *v;
        return ok_status();
    };
}

template<typename S>
Setter<S> opt_int_member(std::optional<int> S::*m) {
    return [m](const std::string& key, const toml::node& val, S& target) -> Status {
        auto v = node_int(val);
        if (!v) return type_error(key, "an integer");
        target.*m = *v;
        return ok_status();
    };
}

template<typename S>
Setter<S> double_member(double S::*m) {
    return [m](const std::string& key, const toml::node& val, S& target) -> Status {
        auto v = node_double(val);
        if (!v) return type_error(key, "a number");
        target.*m = *v;
        return ok_status();
    };
}

template<typename S>
Setter<S> opt_double_member(std::optional<double> S::*m) {
    return [m](const std::string& key, const toml::node& val, S& target) -> Status {
        auto v = node_double(val);
        if (!v) return type_error(key, "a number");
        target.*m = *v;
        return ok_status();
    };
}

template<typename S>
Setter<S> string_member(std::string S::*m) {
    return [m](const std::string& key, const toml::node& val, S& target) -> Status {
        auto v = val.as_string();
        if (!v) return type_error(key, "a string");
        target.*m = v->get();
        return ok_status();
    };
}

template<typename S>
Setter<S> opt_string_member(std::optional<std::string> S::*m) {
    return [m](const std::string& key, const toml::node& val, S& target) -> Status {
        auto v = val.as_string();
        if (!v) return type_error(key, "a string");
        target.*m = v->get();
        return ok_status();
    };
}

template<typename S>
Setter<S> string_list_member(std::vector<std::string> S::*m) {
    return [m](const std::string& key, const toml::node& val, S& target) -> Status {
        auto v = node_string_list(val);
        if (!v) return type_error(key, "an array of strings");
        target.*m = std::move(*v);
        return ok_status();
    };
}

template<typename S>
Setter<S> regex_list_member(RegexList S::*m) {
    return [m](const std::string& key, const toml::node& val, S& target) -> Status {
        auto v = node_string_list(val);
        if (!v) return type_error(key, "an array of regular expressions");
        auto compiled = RegexList::compile(*v);
        if (compiled.is_err()) {
            TyckError err = std::move(compiled).error();
            err.message = "option '" + key + "': " + err.message;
            return err;
        }
        target.*m = std::move(compiled).value();
        return ok_status();
    };
}

template<typename S, typename E>
Setter<S> enum_member(E S::*m, std::vector<std::pair<std::string, E>> names) {
    return [m, names](const std::string& key, const toml::node& val, S& target) -> Status {
        auto v = val.as_string();
        if (!v) return type_error(key, "a string");
        for (const auto& [name, e] : names) {
            if (name == v->get()) {
                target.*m = e;
                return ok_status();
            }
        }
        std::string expected;
        for (const auto& entry : names) {
            if (!expected.empty()) expected += ", ";
            expected += entry.first;
        }
        return TyckError{TyckError::Config,
            "option '" + key + "' has unknown value '" + v->get() + "'",
            "expected one of: " + expected};
    };
}

template<typename S>
Status apply_section(const toml::table& tbl, const std::string& section,
                     const SetterMap<S>& setters, S& target) {
    for (const auto& [key, val] : tbl) {
        std::string k(key);
        auto it = setters.find(k);
        if (it == setters.end()) {
            log::warn("ignoring unknown option '%s.%s'", section.c_str(), k.c_str());
            continue;
        }
        TYCK_TRY(it->second(section + "." + k, val, target));
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Section tables
// ---------------------------------------------------------------------------

const SetterMap<OptionsData>& options_setters() {
    using D = OptionsData;
    static const SetterMap<D> setters = {
        {"all", bool_member(&D::all)},
        {"any_propagation", bool_member(&D::any_propagation)},
        {"autoimports", bool_member(&D::autoimports)},
        {"autoimports_ranked_by_usage", bool_member(&D::autoimports_ranked_by_usage)},
        {"automatic_require_default", bool_member(&D::automatic_require_default)},
        {"babel_loose_array_spread", bool_member(&D::babel_loose_array_spread)},
        {"casting_syntax", enum_member(&D::casting_syntax, {
            {"colon", CastingSyntax::Colon},
            {"as", CastingSyntax::As},
            {"both", CastingSyntax::Both}})},
        {"channel_mode", enum_member(&D::channel_mode, {
            {"pipe", ChannelMode::Pipe},
            {"socket", ChannelMode::Socket}})},
        {"component_syntax", enum_member(&D::component_syntax, {
            {"off", ComponentSyntax::Off},
            {"parsing", ComponentSyntax::Parsing},
            {"full", ComponentSyntax::FullSupport}})},
        {"component_syntax_includes", string_list_member(&D::component_syntax_includes)},
        {"component_syntax_deep_read_only", bool_member(&D::component_syntax_deep_read_only)},
        {"config_hash", string_member(&D::config_hash)},
        {"config_name", string_member(&D::config_name)},
        {"debug", bool_member(&D::debug)},
        {"direct_dependent_files_fix", bool_member(&D::direct_dependent_files_fix)},
        {"distributed", bool_member(&D::distributed)},
        {"enable_const_params", bool_member(&D::enable_const_params)},
        {"enforce_strict_call_arity", bool_member(&D::enforce_strict_call_arity)},
        {"enums", bool_member(&D::enums)},
        {"estimate_recheck_time", bool_member(&D::estimate_recheck_time)},
        {"exact_by_default", bool_member(&D::exact_by_default)},
        {"facebook_fbs", opt_string_member(&D::facebook_fbs)},
        {"facebook_fbt", opt_string_member(&D::facebook_fbt)},
        {"facebook_module_interop", bool_member(&D::facebook_module_interop)},
        {"global_find_ref", bool_member(&D::global_find_ref)},
        {"global_rename", bool_member(&D::global_rename)},
        {"haste_module_ref_prefix", opt_string_member(&D::haste_module_ref_prefix)},
        {"haste_module_ref_prefix_legacy_interop",
            opt_string_member(&D::haste_module_ref_prefix_legacy_interop)},
        {"haste_paths_excludes", string_list_member(&D::haste_paths_excludes)},
        {"haste_paths_includes", string_list_member(&D::haste_paths_includes)},
        {"ignore_non_literal_requires", bool_member(&D::ignore_non_literal_requires)},
        {"include_suppressions", bool_member(&D::include_suppressions)},
        {"include_warnings", bool_member(&D::include_warnings)},
        {"incremental_error_collation", bool_member(&D::incremental_error_collation)},
        {"jsx_pragma", [](const std::string& key, const toml::node& val, D& d) -> Status {
            auto v = val.as_string();
            if (!v) return type_error(key, "a string");
            // An empty pragma switches back to the React runtime
            d.jsx = v->get().empty() ? JsxMode::react() : JsxMode::with_pragma(v->get());
            return ok_status();
        }},
        {"lazy_mode", bool_member(&D::lazy_mode)},
        {"log_file", string_member(&D::log_file)},
        {"long_lived_workers", bool_member(&D::long_lived_workers)},
        {"max_files_checked_per_worker", int_member(&D::max_files_checked_per_worker)},
        {"max_header_tokens", int_member(&D::max_header_tokens)},
        {"max_literal_length", int_member(&D::max_literal_length)},
        {"max_seconds_for_check_per_worker", double_member(&D::max_seconds_for_check_per_worker)},
        {"max_workers", int_member(&D::max_workers)},
        // 0 disables the merge timeout
        {"merge_timeout", [](const std::string& key, const toml::node& val, D& d) -> Status {
            auto v = node_double(val);
            if (!v) return type_error(key, "a number");
            if (*v == 0.0) d.merge_timeout = std::nullopt;
            else d.merge_timeout = *v;
            return ok_status();
        }},
        {"module_system", enum_member(&D::module_system, {
            {"node", ModuleSystem::Node},
            {"haste", ModuleSystem::Haste}})},
        {"modules_are_use_strict", bool_member(&D::modules_are_use_strict)},
        {"munge_underscores", bool_member(&D::munge_underscores)},
        {"node_main_fields", string_list_member(&D::node_main_fields)},
        {"node_resolver_allow_root_relative", bool_member(&D::node_resolver_allow_root_relative)},
        {"node_resolver_root_relative_dirnames",
            string_list_member(&D::node_resolver_root_relative_dirnames)},
        {"profile", bool_member(&D::profile)},
        {"quiet", bool_member(&D::quiet)},
        {"react_runtime", enum_member(&D::react_runtime, {
            {"automatic", ReactRuntime::Automatic},
            {"classic", ReactRuntime::Classic}})},
        {"recursion_limit", int_member(&D::recursion_limit)},
        {"renders_type_validation", bool_member(&D::renders_type_validation)},
        {"renders_type_validation_includes", string_list_member(&D::renders_type_validation_includes)},
        {"root_name", opt_string_member(&D::root_name)},
        {"saved_state_allow_reinit", bool_member(&D::saved_state_allow_reinit)},
        {"saved_state_fetcher", enum_member(&D::saved_state_fetcher, {
            {"none", SavedStateFetcher::Dummy},
            {"local", SavedStateFetcher::Local},
            {"scm", SavedStateFetcher::Scm},
            {"fb", SavedStateFetcher::Fb}})},
        {"saved_state_force_recheck", bool_member(&D::saved_state_force_recheck)},
        {"saved_state_no_fallback", bool_member(&D::saved_state_no_fallback)},
        {"saved_state_skip_version_check", bool_member(&D::saved_state_skip_version_check)},
        {"saved_state_verify", bool_member(&D::saved_state_verify)},
        {"strict_es6_import_export", bool_member(&D::strict_es6_import_export)},
        {"strict_es6_import_export_excludes", string_list_member(&D::strict_es6_import_export_excludes)},
        {"strip_root", bool_member(&D::strip_root)},
        {"suppress_types", [](const std::string& key, const toml::node& val, D& d) -> Status {
            auto v = node_string_list(val);
            if (!v) return type_error(key, "an array of strings");
            d.suppress_types = std::set<std::string>(v->begin(), v->end());
            return ok_status();
        }},
        {"temp_dir", string_member(&D::temp_dir)},
        {"traces", int_member(&D::traces)},
        {"use_mixed_in_catch_variables", bool_member(&D::use_mixed_in_catch_variables)},
        {"wait_for_recheck", bool_member(&D::wait_for_recheck)},
    };
    return setters;
}

const SetterMap<OptionsData>& relay_setters() {
    using D = OptionsData;
    static const SetterMap<D> setters = {
        {"enabled", bool_member(&D::enable_relay_integration)},
        {"excludes", regex_list_member(&D::relay_integration_excludes)},
        {"module_prefix", opt_string_member(&D::relay_integration_module_prefix)},
        {"module_prefix_includes", regex_list_member(&D::relay_integration_module_prefix_includes)},
    };
    return setters;
}

const SetterMap<FormatOptions>& format_setters() {
    static const SetterMap<FormatOptions> setters = {
        {"bracket_spacing", bool_member(&FormatOptions::bracket_spacing)},
        {"single_quotes", bool_member(&FormatOptions::single_quotes)},
    };
    return setters;
}

const SetterMap<GcControl>& gc_setters() {
    using G = GcControl;
    static const SetterMap<G> setters = {
        {"minor_heap_size", opt_int_member(&G::minor_heap_size)},
        {"major_heap_increment", opt_int_member(&G::major_heap_increment)},
        {"space_overhead", opt_int_member(&G::space_overhead)},
        {"window_size", opt_int_member(&G::window_size)},
        {"custom_major_ratio", opt_int_member(&G::custom_major_ratio)},
        {"custom_minor_ratio", opt_int_member(&G::custom_minor_ratio)},
        {"custom_minor_max_size", opt_int_member(&G::custom_minor_max_size)},
    };
    return setters;
}

const SetterMap<FileOptions>& files_setters() {
    using F = FileOptions;
    static const SetterMap<F> setters = {
        {"default_lib_dir", opt_string_member(&F::default_lib_dir)},
        {"ignores", regex_list_member(&F::ignores)},
        {"untyped", regex_list_member(&F::untyped)},
        {"declarations", regex_list_member(&F::declarations)},
        {"includes", string_list_member(&F::includes)},
        {"lib_paths", string_list_member(&F::lib_paths)},
        {"module_file_exts", string_list_member(&F::module_file_exts)},
        {"module_resource_exts", string_list_member(&F::module_resource_exts)},
        {"multi_platform", bool_member(&F::multi_platform)},
        {"node_resolver_dirnames", string_list_member(&F::node_resolver_dirnames)},
        {"implicitly_include_root", bool_member(&F::implicitly_include_root)},
    };
    return setters;
}

const SetterMap<Verbose>& verbose_setters() {
    static const SetterMap<Verbose> setters = {
        {"indent", int_member(&Verbose::indent)},
        {"depth", int_member(&Verbose::depth)},
        {"enabled_during_flowlib", bool_member(&Verbose::enabled_during_flowlib)},
        {"focused_files", [](const std::string& key, const toml::node& val, Verbose& v) -> Status {
            auto files = node_string_list(val);
            if (!files) return type_error(key, "an array of strings");
            v.focused_files = std::move(*files);
            return ok_status();
        }},
    };
    return setters;
}

const SetterMap<SlowToCheckLogging>& slow_logging_setters() {
    using L = SlowToCheckLogging;
    static const SetterMap<L> setters = {
        {"slow_files_logging_threshold_time", opt_double_member(&L::slow_files_logging_threshold_time)},
        {"slow_expressions_logging_threshold", opt_int_member(&L::slow_expressions_logging_threshold)},
    };
    return setters;
}

const SetterMap<LogSaving>& log_saving_setters() {
    static const SetterMap<LogSaving> setters = {
        {"threshold_time_ms", int_member(&LogSaving::threshold_time_ms)},
        {"limit", opt_int_member(&LogSaving::limit)},
        {"rate", double_member(&LogSaving::rate)},
    };
    return setters;
}

// ---------------------------------------------------------------------------
// Special sections
// ---------------------------------------------------------------------------

// [[name]] arrays of { pattern, <value_key> } tables. A present array
// replaces the whole list so the configured order is kept exactly.
Status read_pattern_list(const toml::node& node, const std::string& name,
                         const char* value_key, bool translate,
                         PatternList<std::string>& out) {
    auto arr = node.as_array();
    if (!arr) return type_error(name, "an array of tables");

    std::vector<std::pair<std::string, std::string>> raw;
    for (const auto& el : *arr) {
        auto tbl = el.as_table();
        if (!tbl) return type_error(name, "an array of tables");
        auto pattern = (*tbl)["pattern"].value<std::string>();
        auto value = (*tbl)[value_key].value<std::string>();
        if (!pattern || !value) {
            return TyckError{TyckError::Config,
                "each '" + name + "' entry needs 'pattern' and '" + value_key + "'"};
        }
        raw.emplace_back(*pattern, translate ? translate_backrefs(*value) : *value);
    }

    auto compiled = PatternList<std::string>::compile(raw);
    if (compiled.is_err()) {
        TyckError err = std::move(compiled).error();
        err.message = name + ": " + err.message;
        return err;
    }
    out = std::move(compiled).value();
    return ok_status();
}

Status read_lints(const toml::table& tbl, LintSettings& lints) {
    for (const auto& [key, val] : tbl) {
        std::string rule(key);
        auto s = val.value<std::string>();
        if (!s) return type_error("lints." + rule, "a severity string");
        auto sev = parse_severity(*s);
        if (sev.is_err()) {
            TyckError err = std::move(sev).error();
            err.message = "lints." + rule + ": " + err.message;
            return err;
        }
        // "all" sets the fallback severity for rules never mentioned
        if (rule == "all") lints = lints.with_default(sev.value());
        else lints = lints.with_value(rule, sev.value());
    }
    return ok_status();
}

Status read_rollouts(const toml::table& tbl, std::map<std::string, std::string>& rollouts) {
    for (const auto& [key, val] : tbl) {
        std::string name(key);
        auto s = val.value<std::string>();
        if (!s) return type_error("rollouts." + name, "a string");
        rollouts[name] = *s;
    }
    return ok_status();
}

Status read_log_saving(const toml::table& tbl, std::map<std::string, LogSaving>& out) {
    for (const auto& [key, val] : tbl) {
        std::string event(key);
        auto sub = val.as_table();
        if (!sub) return type_error("log_saving." + event, "a table");
        LogSaving saving;
        auto it = out.find(event);
        if (it != out.end()) saving = it->second;
        TYCK_TRY(apply_section(*sub, "log_saving." + event, log_saving_setters(), saving));
        out[event] = saving;
    }
    return ok_status();
}

Result<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TyckError{TyckError::IO, "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Result<std::string>::ok(ss.str());
}

std::optional<bool> parse_env_bool(const std::string& s) {
    if (s == "1" || s == "true") return true;
    if (s == "0" || s == "false") return false;
    return std::nullopt;
}

} // namespace

// ---------------------------------------------------------------------------
// apply_config
// ---------------------------------------------------------------------------

Status apply_config(OptionsData& target, const std::string& toml_str) {
    // Changes land in a copy so a failing document leaves `target` untouched.
    OptionsData data = target;
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return TyckError{TyckError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    for (const auto& [key, node] : doc) {
        std::string section(key);

        if (section == "module_name_mappers") {
            TYCK_TRY(read_pattern_list(node, section, "replacement", true, data.module_name_mappers));
            continue;
        }
        if (section == "haste_name_reducers") {
            TYCK_TRY(read_pattern_list(node, section, "replacement", true, data.haste_name_reducers));
            continue;
        }
        if (section == "missing_module_generators") {
            TYCK_TRY(read_pattern_list(node, section, "generator", false, data.missing_module_generators));
            continue;
        }

        auto tbl = node.as_table();
        if (!tbl) {
            log::warn("ignoring top-level key '%s': expected a [section]", section.c_str());
            continue;
        }

        if (section == "options") {
            TYCK_TRY(apply_section(*tbl, section, options_setters(), data));
        } else if (section == "relay") {
            TYCK_TRY(apply_section(*tbl, section, relay_setters(), data));
        } else if (section == "format") {
            TYCK_TRY(apply_section(*tbl, section, format_setters(), data.format));
        } else if (section == "gc") {
            TYCK_TRY(apply_section(*tbl, section, gc_setters(), data.gc_worker));
        } else if (section == "files") {
            TYCK_TRY(apply_section(*tbl, section, files_setters(), data.file_options));
        } else if (section == "slow_to_check_logging") {
            TYCK_TRY(apply_section(*tbl, section, slow_logging_setters(), data.slow_to_check_logging));
        } else if (section == "verbose") {
            Verbose v = data.verbose.value_or(Verbose{});
            TYCK_TRY(apply_section(*tbl, section, verbose_setters(), v));
            data.verbose = std::move(v);
        } else if (section == "lints") {
            TYCK_TRY(read_lints(*tbl, data.lint_severities));
        } else if (section == "strict") {
            if (auto rules = (*tbl)["rules"].as_array()) {
                auto list = node_string_list(*rules);
                if (!list) return type_error("strict.rules", "an array of strings");
                data.strict_mode = StrictModeSettings(std::set<std::string>(list->begin(), list->end()));
            }
        } else if (section == "rollouts") {
            TYCK_TRY(read_rollouts(*tbl, data.enabled_rollouts));
        } else if (section == "log_saving") {
            TYCK_TRY(read_log_saving(*tbl, data.log_saving));
        } else {
            log::warn("ignoring unknown config section [%s]", section.c_str());
        }
    }

    target = std::move(data);
    return ok_status();
}

Status load_config(OptionsData& data, const std::string& path) {
    auto contents = read_file(path);
    if (contents.is_err()) return std::move(contents).error();
    auto st = apply_config(data, contents.value());
    if (st.is_err()) {
        TyckError err = std::move(st).error();
        err.file = path;
        return err;
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// apply_env
// ---------------------------------------------------------------------------

Status apply_env(OptionsData& data) {
    if (const char* env = std::getenv("TYCK_TEMP_DIR")) {
        if (*env == '\0') {
            return TyckError{TyckError::InvalidArg, "TYCK_TEMP_DIR is set but empty"};
        }
        data.temp_dir = env;
    }

    if (const char* env = std::getenv("TYCK_MAX_WORKERS")) {
        char* end = nullptr;
        long n = std::strtol(env, &end, 10);
        if (*env == '\0' || *end != '\0' || n < 1 || n > INT_MAX) {
            return TyckError{TyckError::InvalidArg,
                std::string("TYCK_MAX_WORKERS must be a positive integer, got '") + env + "'"};
        }
        data.max_workers = static_cast<int>(n);
    }

    if (const char* env = std::getenv("TYCK_QUIET")) {
        auto v = parse_env_bool(env);
        if (!v) {
            return TyckError{TyckError::InvalidArg,
                std::string("TYCK_QUIET must be 0, 1, true or false, got '") + env + "'"};
        }
        data.quiet = *v;
    }

    if (const char* env = std::getenv("TYCK_PROFILE")) {
        auto v = parse_env_bool(env);
        if (!v) {
            return TyckError{TyckError::InvalidArg,
                std::string("TYCK_PROFILE must be 0, 1, true or false, got '") + env + "'"};
        }
        data.profile = *v;
    }

    if (const char* env = std::getenv("TYCK_SAVED_STATE_FETCHER")) {
        std::string name(env);
        if (name == "none") data.saved_state_fetcher = SavedStateFetcher::Dummy;
        else if (name == "local") data.saved_state_fetcher = SavedStateFetcher::Local;
        else if (name == "scm") data.saved_state_fetcher = SavedStateFetcher::Scm;
        else if (name == "fb") data.saved_state_fetcher = SavedStateFetcher::Fb;
        else {
            return TyckError{TyckError::InvalidArg,
                "unknown TYCK_SAVED_STATE_FETCHER '" + name + "'",
                "expected one of: none, local, scm, fb"};
        }
    }

    return ok_status();
}

// ---------------------------------------------------------------------------
// effective_options
// ---------------------------------------------------------------------------

Result<Options> effective_options(const std::string& root,
                                  const std::vector<std::string>& layers) {
    OptionsData data;
    data.root = root;

    std::string hashed;
    for (const auto& path : layers) {
        std::error_code ec;
        if (path.empty() || !fs::exists(path, ec)) {
            log::debug("config layer not found, skipping: %s", path.c_str());
            continue;
        }
        auto contents = read_file(path);
        if (contents.is_err()) return std::move(contents).error();
        auto st = apply_config(data, contents.value());
        if (st.is_err()) {
            TyckError err = std::move(st).error();
            err.file = path;
            return err;
        }
        hashed += contents.value();
        log::debug("applied config layer %s", path.c_str());
    }

    TYCK_TRY(apply_env(data));

    if (data.config_hash.empty()) {
        data.config_hash = config_fingerprint(hashed);
    }
    return Options::create(std::move(data));
}

// FNV-1a, 64 bit
std::string config_fingerprint(const std::string& contents) {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : contents) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(h));
    return std::string(buf);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.tyck/config.toml";
}

std::string project_config_path(const std::string& root, const std::string& config_name) {
    return (fs::path(root) / (config_name + ".toml")).string();
}

} // namespace tyck
