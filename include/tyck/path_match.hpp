#pragma once

#include <string>
#include <vector>

namespace tyck {

// Replace '/' with the host directory separator. Identity on POSIX hosts.
std::string normalize_filename_dir_sep(const std::string& path);

// True when `path` starts with any entry of `prefixes`, compared as raw,
// case-sensitive strings. Not segment-aware: "src/foo" is a prefix of
// "src/foobar/x.js". An empty list never matches.
bool has_any_prefix(const std::string& path, const std::vector<std::string>& prefixes);

// Substitute every "<PROJECT_ROOT>" token in `pattern` with `root`.
std::string expand_project_root(const std::string& pattern, const std::string& root);

// Match a path glob against a path (both compared with forward slashes).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more whole path segments).
bool path_glob_match(const std::string& pattern, const std::string& path);

} // namespace tyck
