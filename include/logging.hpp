#ifndef TVCAST_LOGGING_HPP
#define TVCAST_LOGGING_HPP

#include <string_view>
#include <optional>
#include <utility>

#include "fmt/format.h"

namespace logging
{

enum class level
{
    debug,
    info,
    warn,
    error
};

void set_level(level lvl);

level get_level();

std::optional<level> level_from_string(std::string_view name);

void write(level lvl, std::string_view msg);

template<typename... Args>
void debug(fmt::format_string<Args...> format_str, Args&&... args)
{
    if(get_level() <= level::debug)
        write(level::debug, fmt::format(format_str, std::forward<Args>(args)...));
}

template<typename... Args>
void info(fmt::format_string<Args...> format_str, Args&&... args)
{
    if(get_level() <= level::info)
        write(level::info, fmt::format(format_str, std::forward<Args>(args)...));
}

template<typename... Args>
void warn(fmt::format_string<Args...> format_str, Args&&... args)
{
    if(get_level() <= level::warn)
        write(level::warn, fmt::format(format_str, std::forward<Args>(args)...));
}

template<typename... Args>
void error(fmt::format_string<Args...> format_str, Args&&... args)
{
    write(level::error, fmt::format(format_str, std::forward<Args>(args)...));
}

} // namespace logging

#endif
