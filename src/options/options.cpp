#include <tyck/options.hpp>
#include <tyck/log.hpp>
#include <filesystem>
#include <thread>

namespace tyck {

namespace fs = std::filesystem;

unsigned default_max_workers() {
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

bool GcControl::operator==(const GcControl& o) const {
    return minor_heap_size == o.minor_heap_size &&
           major_heap_increment == o.major_heap_increment &&
           space_overhead == o.space_overhead &&
           window_size == o.window_size &&
           custom_major_ratio == o.custom_major_ratio &&
           custom_minor_ratio == o.custom_minor_ratio &&
           custom_minor_max_size == o.custom_minor_max_size;
}

bool FileOptions::operator==(const FileOptions& o) const {
    return default_lib_dir == o.default_lib_dir &&
           ignores == o.ignores &&
           untyped == o.untyped &&
           declarations == o.declarations &&
           includes == o.includes &&
           lib_paths == o.lib_paths &&
           module_file_exts == o.module_file_exts &&
           module_resource_exts == o.module_resource_exts &&
           multi_platform == o.multi_platform &&
           node_resolver_dirnames == o.node_resolver_dirnames &&
           implicitly_include_root == o.implicitly_include_root;
}

bool OptionsData::operator==(const OptionsData& o) const {
    return all == o.all &&
           any_propagation == o.any_propagation &&
           autoimports == o.autoimports &&
           autoimports_ranked_by_usage == o.autoimports_ranked_by_usage &&
           automatic_require_default == o.automatic_require_default &&
           babel_loose_array_spread == o.babel_loose_array_spread &&
           casting_syntax == o.casting_syntax &&
           channel_mode == o.channel_mode &&
           component_syntax == o.component_syntax &&
           component_syntax_includes == o.component_syntax_includes &&
           component_syntax_deep_read_only == o.component_syntax_deep_read_only &&
           config_hash == o.config_hash &&
           config_name == o.config_name &&
           debug == o.debug &&
           direct_dependent_files_fix == o.direct_dependent_files_fix &&
           distributed == o.distributed &&
           enable_const_params == o.enable_const_params &&
           enable_relay_integration == o.enable_relay_integration &&
           enabled_rollouts == o.enabled_rollouts &&
           enforce_strict_call_arity == o.enforce_strict_call_arity &&
           enums == o.enums &&
           estimate_recheck_time == o.estimate_recheck_time &&
           exact_by_default == o.exact_by_default &&
           facebook_fbs == o.facebook_fbs &&
           facebook_fbt == o.facebook_fbt &&
           facebook_module_interop == o.facebook_module_interop &&
           file_options == o.file_options &&
           format == o.format &&
           gc_worker == o.gc_worker &&
           global_find_ref == o.global_find_ref &&
           global_rename == o.global_rename &&
           haste_module_ref_prefix == o.haste_module_ref_prefix &&
           haste_module_ref_prefix_legacy_interop == o.haste_module_ref_prefix_legacy_interop &&
           haste_name_reducers == o.haste_name_reducers &&
           haste_paths_excludes == o.haste_paths_excludes &&
           haste_paths_includes == o.haste_paths_includes &&
           ignore_non_literal_requires == o.ignore_non_literal_requires &&
           include_suppressions == o.include_suppressions &&
           include_warnings == o.include_warnings &&
           incremental_error_collation == o.incremental_error_collation &&
           jsx == o.jsx &&
           lazy_mode == o.lazy_mode &&
           lint_severities == o.lint_severities &&
           log_file == o.log_file &&
           log_saving == o.log_saving &&
           long_lived_workers == o.long_lived_workers &&
           max_files_checked_per_worker == o.max_files_checked_per_worker &&
           max_header_tokens == o.max_header_tokens &&
           max_literal_length == o.max_literal_length &&
           max_seconds_for_check_per_worker == o.max_seconds_for_check_per_worker &&
           max_workers == o.max_workers &&
           merge_timeout == o.merge_timeout &&
           missing_module_generators == o.missing_module_generators &&
           module_system == o.module_system &&
           module_name_mappers == o.module_name_mappers &&
           modules_are_use_strict == o.modules_are_use_strict &&
           munge_underscores == o.munge_underscores &&
           node_main_fields == o.node_main_fields &&
           node_resolver_allow_root_relative == o.node_resolver_allow_root_relative &&
           node_resolver_root_relative_dirnames == o.node_resolver_root_relative_dirnames &&
           profile == o.profile &&
           quiet == o.quiet &&
           react_runtime == o.react_runtime &&
           recursion_limit == o.recursion_limit &&
           relay_integration_excludes == o.relay_integration_excludes &&
           relay_integration_module_prefix == o.relay_integration_module_prefix &&
           relay_integration_module_prefix_includes == o.relay_integration_module_prefix_includes &&
           renders_type_validation == o.renders_type_validation &&
           renders_type_validation_includes == o.renders_type_validation_includes &&
           root == o.root &&
           root_name == o.root_name &&
           saved_state_allow_reinit == o.saved_state_allow_reinit &&
           saved_state_fetcher == o.saved_state_fetcher &&
           saved_state_force_recheck == o.saved_state_force_recheck &&
           saved_state_no_fallback == o.saved_state_no_fallback &&
           saved_state_skip_version_check == o.saved_state_skip_version_check &&
           saved_state_verify == o.saved_state_verify &&
           slow_to_check_logging == o.slow_to_check_logging &&
           strict_es6_import_export == o.strict_es6_import_export &&
           strict_es6_import_export_excludes == o.strict_es6_import_export_excludes &&
           strict_mode == o.strict_mode &&
           strip_root == o.strip_root &&
           suppress_types == o.suppress_types &&
           temp_dir == o.temp_dir &&
           traces == o.traces &&
           use_mixed_in_catch_variables == o.use_mixed_in_catch_variables &&
           verbose == o.verbose &&
           wait_for_recheck == o.wait_for_recheck;
}

// ---------------------------------------------------------------------------
// Options::create
// ---------------------------------------------------------------------------

static std::string default_log_file(const std::string& temp_dir, const std::string& root) {
    fs::path root_path(root);
    std::string base = root_path.filename().string();
    if (base.empty()) base = root_path.parent_path().filename().string();
    if (base.empty()) base = "root";
    return (fs::path(temp_dir) / (base + ".log")).string();
}

Result<Options> Options::create(OptionsData data) {
    if (data.root.empty()) {
        return TyckError{TyckError::Config, "project root is not set",
            "pass the directory that contains " + data.config_name};
    }
    if (data.temp_dir.empty()) {
        return TyckError{TyckError::Config, "temp dir cannot be empty"};
    }
    if (data.max_workers < 1) {
        return TyckError{TyckError::Config,
            "max_workers must be at least 1, got " + std::to_string(data.max_workers)};
    }
    if (data.recursion_limit < 1) {
        return TyckError{TyckError::Config,
            "recursion_limit must be at least 1, got " + std::to_string(data.recursion_limit)};
    }
    if (data.max_literal_length < 0) {
        return TyckError{TyckError::Config, "max_literal_length cannot be negative"};
    }
    if (data.traces < 0) {
        return TyckError{TyckError::Config, "traces cannot be negative"};
    }
    if (data.max_files_checked_per_worker < 1) {
        return TyckError{TyckError::Config, "max_files_checked_per_worker must be at least 1"};
    }
    if (data.jsx.kind == JsxMode::Kind::Pragma && data.jsx.pragma.empty()) {
        return TyckError{TyckError::Config, "jsx pragma cannot be empty",
            "set a callee such as \"h\", or use the react mode"};
    }
    for (const auto& [event, saving] : data.log_saving) {
        if (saving.rate < 0.0 || saving.rate > 1.0) {
            return TyckError{TyckError::Config,
                "log saving rate for '" + event + "' must be within [0, 1]"};
        }
    }

    if (data.log_file.empty()) {
        data.log_file = default_log_file(data.temp_dir, data.root);
    }

    log::debug("options created for root '%s' (%d workers, module system %s)",
        data.root.c_str(), data.max_workers, module_system_name(data.module_system));
    return Result<Options>::ok(Options(std::move(data)));
}

// ---------------------------------------------------------------------------
// Enum names
// ---------------------------------------------------------------------------

const char* module_system_name(ModuleSystem m) {
    switch (m) {
        case ModuleSystem::Node:  return "node";
        case ModuleSystem::Haste: return "haste";
    }
    return "unknown";
}

const char* saved_state_fetcher_name(SavedStateFetcher f) {
    switch (f) {
        case SavedStateFetcher::Dummy: return "none";
        case SavedStateFetcher::Local: return "local";
        case SavedStateFetcher::Scm:   return "scm";
        case SavedStateFetcher::Fb:    return "fb";
    }
    return "unknown";
}

const char* react_runtime_name(ReactRuntime r) {
    switch (r) {
        case ReactRuntime::Automatic: return "automatic";
        case ReactRuntime::Classic:   return "classic";
    }
    return "unknown";
}

const char* component_syntax_name(ComponentSyntax c) {
    switch (c) {
        case ComponentSyntax::Off:         return "off";
        case ComponentSyntax::Parsing:     return "parsing";
        case ComponentSyntax::FullSupport: return "full";
    }
    return "unknown";
}

const char* casting_syntax_name(CastingSyntax c) {
    switch (c) {
        case CastingSyntax::Colon: return "colon";
        case CastingSyntax::As:    return "as";
        case CastingSyntax::Both:  return "both";
    }
    return "unknown";
}

const char* channel_mode_name(ChannelMode c) {
    switch (c) {
        case ChannelMode::Pipe:   return "pipe";
        case ChannelMode::Socket: return "socket";
    }
    return "unknown";
}

} // namespace tyck
