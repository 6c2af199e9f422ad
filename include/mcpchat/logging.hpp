#pragma once
#include <ostream>
#include <string>

namespace mcpchat::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error,
    Off
};

/// Accepts DEBUG, INFO, WARNING/WARN, ERROR, OFF (case-insensitive); unknown names map to Info.
Level level_from_string(const std::string& name);
std::string to_string(Level level);

void set_level(Level level);
Level level();

/// Redirect output (nullptr restores std::cerr). Caller keeps ownership of the stream.
void set_sink(std::ostream* sink);

void write(Level level, const std::string& component, const std::string& message);

inline void debug(const std::string& component, const std::string& message)
{
    write(Level::Debug, component, message);
}
inline void info(const std::string& component, const std::string& message)
{
    write(Level::Info, component, message);
}
inline void warn(const std::string& component, const std::string& message)
{
    write(Level::Warning, component, message);
}
inline void error(const std::string& component, const std::string& message)
{
    write(Level::Error, component, message);
}

} // namespace mcpchat::log
