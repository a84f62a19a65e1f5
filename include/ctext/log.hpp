#pragma once

#include <string>
#include <cstdio>

namespace ctext {
struct Position;
}

namespace ctext::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// True when a message at lvl would be written
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (stderr by default). Passing nullptr restores stderr.
// Until set_color_enabled() is called, colour follows whether the stream
// is a terminal.
void set_stream(std::FILE* stream);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Source diagnostic: "<file:line:col>: <level>: <message>"
void at(Level lvl, const Position& pos, const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parse "trace", "debug", "info", "warn" or "error". Returns false for
// anything else and leaves out untouched.
bool parse_level(const std::string& name, Level& out);

} // namespace ctext::log
