#include <ctext/log.hpp>
#include <ctext/lang/token.hpp>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace ctext::log {

static Level s_level = Info;
static std::FILE* s_stream = nullptr;

static bool detect_color(std::FILE* f) {
    return isatty(fileno(f)) != 0;
}

// Settled at static init and by set_stream() / set_color_enabled(), never
// from the logging path
static bool s_color_explicit = false;
static bool s_color_enabled = detect_color(stderr);

static std::FILE* out() {
    return s_stream ? s_stream : stderr;
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

bool enabled(Level lvl) {
    return lvl >= s_level;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_explicit = true;
}

bool is_color_enabled() {
    return s_color_enabled;
}

void set_stream(std::FILE* stream) {
    s_stream = stream;
    if (!s_color_explicit) s_color_enabled = detect_color(out());
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

bool parse_level(const std::string& name, Level& lvl) {
    for (Level l : {Trace, Debug, Info, Warn, Error}) {
        if (name == level_name(l)) {
            lvl = l;
            return true;
        }
    }
    return false;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static const char* reset_color() {
    return "\033[0m";
}

static void log_message(Level lvl, const char* prefix, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;

    std::FILE* f = out();
    if (prefix) {
        std::fprintf(f, "%s: ", prefix);
    }
    if (s_color_enabled) {
        std::fprintf(f, "%s%s%s: ", level_color(lvl), level_name(lvl), reset_color());
    } else {
        std::fprintf(f, "%s: ", level_name(lvl));
    }

    std::vfprintf(f, fmt, args);
    std::fprintf(f, "\n");
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, nullptr, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, nullptr, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, nullptr, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, nullptr, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, nullptr, fmt, args);
    va_end(args);
}

void at(Level lvl, const Position& pos, const char* fmt, ...) {
    if (!enabled(lvl)) return;
    std::string where = pos.str();
    va_list args;
    va_start(args, fmt);
    log_message(lvl, where.c_str(), fmt, args);
    va_end(args);
}

} // namespace ctext::log
