#include "mcpchat/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace mcpchat::log
{
namespace
{

std::atomic<Level> current_level{Level::Info};
std::mutex sink_mutex;
std::ostream* sink_stream = nullptr;

} // namespace

Level level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG" || upper == "TRACE")
        return Level::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return Level::Warning;
    if (upper == "ERROR" || upper == "CRITICAL")
        return Level::Error;
    if (upper == "OFF" || upper == "NONE")
        return Level::Off;
    return Level::Info;
}

std::string to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        return "OFF";
    }
    return "INFO";
}

void set_level(Level level)
{
    current_level = level;
}

Level level()
{
    return current_level;
}

void set_sink(std::ostream* sink)
{
    std::lock_guard<std::mutex> lock(sink_mutex);
    sink_stream = sink;
}

void write(Level level, const std::string& component, const std::string& message)
{
    if (level == Level::Off || level < current_level.load())
        return;
    std::lock_guard<std::mutex> lock(sink_mutex);
    std::ostream& out = sink_stream ? *sink_stream : std::cerr;
    out << "[mcpchat] [" << to_string(level) << "] " << component << ": " << message << std::endl;
}

} // namespace mcpchat::log
