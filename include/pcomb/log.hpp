#pragma once

#include <pcomb/result.hpp>
#include <string>
#include <cstdio>

namespace pcomb::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// True when a message at lvl would be written
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name(); "warning" is accepted as an alias for warn
Result<Level> parse_level(const std::string& name);

} // namespace pcomb::log
