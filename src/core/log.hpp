#pragma once

#include <format>
#include <iostream>
#include <string_view>
#include <utility>

namespace tile_streamer
{
namespace logging
{

template <typename... Args> inline auto info(std::format_string<Args...> fmt, Args &&...args) -> void
{
  std::cout << "[tiles] " << std::format(fmt, std::forward<Args>(args)...) << std::endl;
}

// Verbose per-tile messages, only printed when the debug flag is set
template <typename... Args> inline auto debug(bool enabled, std::format_string<Args...> fmt, Args &&...args) -> void
{
  if (!enabled)
    return;
  std::cout << "[tiles:debug] " << std::format(fmt, std::forward<Args>(args)...) << std::endl;
}

template <typename... Args> inline auto warn(std::format_string<Args...> fmt, Args &&...args) -> void
{
  std::cerr << "[tiles:warn] " << std::format(fmt, std::forward<Args>(args)...) << std::endl;
}

} // namespace logging
} // namespace tile_streamer
