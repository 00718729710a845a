#pragma once

#include <quilt/result.hpp>
#include <string>
#include <cstdio>

namespace quilt::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Each call emits one whole line; safe to call from concurrent work units
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parse "trace", "debug", "info", "warn" or "error"
Result<Level> parse_level(const std::string& name);

} // namespace quilt::log
