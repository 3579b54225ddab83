#include "schemapp/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace schemapp::log
{

namespace
{
std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_write_mutex;

const char* level_name(Level lvl)
{
    switch (lvl)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        return "OFF";
    }
    return "INFO";
}
} // namespace

Level level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return Level::Debug;
    if (upper == "WARN" || upper == "WARNING")
        return Level::Warn;
    if (upper == "ERROR")
        return Level::Error;
    if (upper == "OFF")
        return Level::Off;
    return Level::Info;
}

void set_level(Level lvl)
{
    g_level.store(static_cast<int>(lvl));
}

Level level()
{
    return static_cast<Level>(g_level.load());
}

void write(Level lvl, const std::string& message)
{
    if (!enabled(lvl))
        return;
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[schemapp] " << level_name(lvl) << " " << message << std::endl;
}

} // namespace schemapp::log
