#pragma once

#include <cstdio>
#include <optional>
#include <string>

namespace tyck::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Parse "trace".."error" (as used by TYCK_LOG). Unknown names give nullopt.
std::optional<Level> parse_level(const std::string& name);

// Apply TYCK_LOG from the environment if it names a valid level.
void init_from_env();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (defaults to stderr). Passing nullptr restores stderr.
void set_output(std::FILE* out);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace tyck::log
