#pragma once

#include <functional>
#include <optional>
#include <string>

namespace gapline::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// A sink receives every message at or above the current level instead of
// stderr. Host tools use it to route library messages into their own output.
// Install or reset it before analysis threads start; logging itself is safe
// from any thread, but swapping the sink is not. The sink must tolerate
// concurrent calls.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);
void reset_sink();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name(); nullopt for unknown names
std::optional<Level> level_from_name(const std::string& name);

} // namespace gapline::log
