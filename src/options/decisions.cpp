#include <tyck/options.hpp>
#include <tyck/path_match.hpp>
#include <algorithm>

namespace tyck {

// No default labels below: a new ComponentSyntax variant must be handled
// here explicitly (-Wswitch flags the omission).

bool Options::typecheck_component_syntax() const {
    switch (data_.component_syntax) {
        case ComponentSyntax::Off:
        case ComponentSyntax::Parsing:
            return false;
        case ComponentSyntax::FullSupport:
            return true;
    }
    return false;
}

bool Options::parse_component_syntax() const {
    switch (data_.component_syntax) {
        case ComponentSyntax::Off:
            return false;
        case ComponentSyntax::Parsing:
        case ComponentSyntax::FullSupport:
            return true;
    }
    return false;
}

bool Options::typecheck_component_syntax_in_file(const FileKey& file) const {
    if (typecheck_component_syntax()) return true;
    const auto& dirs = data_.component_syntax_includes;
    if (dirs.empty()) return false;
    return has_any_prefix(file.normalized(), dirs);
}

bool Options::renders_type_validation_in_file(const FileKey& file) const {
    if (data_.renders_type_validation) return true;
    const auto& dirs = data_.renders_type_validation_includes;
    if (dirs.empty()) return false;
    return has_any_prefix(file.normalized(), dirs);
}

bool Options::strict_es6_import_export_in_file(const FileKey& file) const {
    if (!data_.strict_es6_import_export) return false;
    return !has_any_prefix(file.normalized(), data_.strict_es6_import_export_excludes);
}

bool Options::should_profile() const {
    return data_.profile && !data_.quiet;
}

bool Options::relay_integration_in_file(const FileKey& file) const {
    if (!data_.enable_relay_integration) return false;
    return !data_.relay_integration_excludes.matches_any(file.to_string());
}

std::optional<std::string> Options::relay_integration_module_prefix_for_file(const FileKey& file) const {
    const auto& prefix = data_.relay_integration_module_prefix;
    if (!prefix) return std::nullopt;
    const auto& includes = data_.relay_integration_module_prefix_includes;
    if (includes.empty() || includes.matches_any(file.to_string())) return prefix;
    return std::nullopt;
}

bool Options::is_haste_path(const std::string& path) const {
    switch (data_.module_system) {
        case ModuleSystem::Node:
            return false;
        case ModuleSystem::Haste:
            break;
    }
    auto matches = [&](const std::string& glob) {
        return path_glob_match(expand_project_root(glob, data_.root), path);
    };
    const auto& inc = data_.haste_paths_includes;
    const auto& exc = data_.haste_paths_excludes;
    return std::any_of(inc.begin(), inc.end(), matches) &&
           std::none_of(exc.begin(), exc.end(), matches);
}

std::optional<std::string> Options::rollout_variant(const std::string& rollout) const {
    auto it = data_.enabled_rollouts.find(rollout);
    if (it == data_.enabled_rollouts.end()) return std::nullopt;
    return it->second;
}

bool Options::rollout_enabled(const std::string& rollout, const std::string& variant) const {
    auto v = rollout_variant(rollout);
    return v && *v == variant;
}

Severity Options::lint_severity(const std::string& rule) const {
    return data_.lint_severities.get_value(rule);
}

bool Options::is_strict_lint(const std::string& rule) const {
    return data_.strict_mode.contains(rule);
}

std::optional<LogSaving> Options::log_saving_for(const std::string& event) const {
    auto it = data_.log_saving.find(event);
    if (it == data_.log_saving.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> Options::map_module_name(const std::string& name) const {
    return rewrite_first(data_.module_name_mappers, name);
}

std::optional<std::string> Options::missing_module_generator(const std::string& name) const {
    const std::string* gen = data_.missing_module_generators.find(name);
    if (!gen) return std::nullopt;
    return *gen;
}

std::optional<std::string> Options::reduce_haste_name(const std::string& path) const {
    return rewrite_first(data_.haste_name_reducers, path);
}

} // namespace tyck
