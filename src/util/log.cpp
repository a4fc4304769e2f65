#include <tyck/log.hpp>
#include <cstdarg>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace tyck::log {

static Level s_level = Warn;
static bool s_color_initialized = false;
static bool s_color_enabled = false;
static std::FILE* s_out = nullptr;

static std::FILE* out_stream() {
    return s_out ? s_out : stderr;
}

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(out_stream()));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

std::optional<Level> parse_level(const std::string& name) {
    if (name == "trace") return Trace;
    if (name == "debug") return Debug;
    if (name == "info")  return Info;
    if (name == "warn")  return Warn;
    if (name == "error") return Error;
    return std::nullopt;
}

void init_from_env() {
    const char* env = std::getenv("TYCK_LOG");
    if (!env) return;
    if (auto lvl = parse_level(env)) {
        s_level = *lvl;
    } else {
        warn("ignoring unknown TYCK_LOG level '%s'", env);
    }
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_output(std::FILE* out) {
    s_out = out;
    s_color_initialized = false;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[31m";
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    init_color();

    std::FILE* out = out_stream();
    if (s_color_enabled) {
        std::fprintf(out, "tyck %s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "tyck %s: ", level_name(lvl));
    }

    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

#define TYCK_DEFINE_LOG_FN(name, lvl)      \
    void name(const char* fmt, ...) {      \
        va_list args;                      \
        va_start(args, fmt);               \
        log_message(lvl, fmt, args);       \
        va_end(args);                      \
    }

TYCK_DEFINE_LOG_FN(trace, Trace)
TYCK_DEFINE_LOG_FN(debug, Debug)
TYCK_DEFINE_LOG_FN(info, Info)
TYCK_DEFINE_LOG_FN(warn, Warn)
TYCK_DEFINE_LOG_FN(error, Error)

#undef TYCK_DEFINE_LOG_FN

} // namespace tyck::log
