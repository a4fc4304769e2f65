#pragma once

#include <tyck/options.hpp>
#include <tyck/result.hpp>
#include <string>
#include <vector>

namespace tyck {

// Overlay the keys present in a TOML document onto `data`. Keys that are
// absent leave `data` untouched, so layers compose by applying them in order.
// On error `data` is left exactly as it was. `jsx_pragma = ""` restores the
// React runtime set by an earlier layer.
Status apply_config(OptionsData& data, const std::string& toml_str);

// Read a TOML file and apply it. Errors carry the file path.
Status load_config(OptionsData& data, const std::string& path);

// Overlay TYCK_TEMP_DIR, TYCK_MAX_WORKERS, TYCK_QUIET, TYCK_PROFILE and
// TYCK_SAVED_STATE_FETCHER when set.
Status apply_env(OptionsData& data);

// Build the record from defaults, each existing config layer in order, then
// the environment. Missing layer files are skipped.
Result<Options> effective_options(const std::string& root,
                                  const std::vector<std::string>& layers);

// Stable hex fingerprint of config contents, used for config_hash.
std::string config_fingerprint(const std::string& contents);

// ~/.tyck/config.toml, or "" when no home directory is known.
std::string global_config_path();

// <root>/<config_name>.toml
std::string project_config_path(const std::string& root, const std::string& config_name);

} // namespace tyck
