#pragma once
#include <string>

namespace schemapp::log
{

enum class Level
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/// Parses "DEBUG", "INFO", "WARN"/"WARNING", "ERROR" or "OFF" (any case).
/// Unknown names map to Info.
Level level_from_string(const std::string& name);

void set_level(Level level);
Level level();

inline bool enabled(Level lvl)
{
    return lvl != Level::Off && static_cast<int>(lvl) >= static_cast<int>(level());
}

/// Writes "[schemapp] LEVEL message" to stderr when `lvl` is enabled.
void write(Level lvl, const std::string& message);

inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}
inline void warn(const std::string& message)
{
    write(Level::Warn, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace schemapp::log
