#pragma once

#include <functional>
#include <optional>
#include <string>

namespace vista::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Replace the stderr writer. The sink receives the formatted message
// without the level prefix. Pass an empty function to restore stderr.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// "warn" -> Warn; nullopt for unknown names
std::optional<Level> parse_level(const std::string& name);

} // namespace vista::log
