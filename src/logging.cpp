#include "logging.hpp"

#include "fmt/chrono.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <mutex>

namespace logging
{

static std::atomic<level> c_level {level::info};

static std::mutex c_write_mutex;

static const char* level_name(level lvl)
{
    switch(lvl)
    {
        case level::debug: return "debug";
        case level::info: return "info";
        case level::warn: return "warn";
        case level::error: return "error";
    }
    return "?";
}

void set_level(level lvl)
{
    c_level.store(lvl);
}

level get_level()
{
    return c_level.load();
}

std::optional<level> level_from_string(std::string_view name)
{
    if(name == "debug")
        return level::debug;
    else if(name == "info")
        return level::info;
    else if(name == "warn" || name == "warning")
        return level::warn;
    else if(name == "error")
        return level::error;
    return std::nullopt;
}

void write(level lvl, std::string_view msg)
{
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::lock_guard<std::mutex> lock {c_write_mutex};
    fmt::print(stderr, "[{:%H:%M:%S}] [{}] {}\n", fmt::localtime(now), level_name(lvl), msg);
}

} // namespace logging
