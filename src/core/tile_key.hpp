#pragma once

#include <cstdint>
#include <format>
#include <string>
#include <tuple>

namespace tile_streamer
{

// One tile in one pyramid level
struct tile_key_t
{
  uint32_t x = 0;
  uint32_t y = 0;
  int zoom = 0;

  auto operator==(const tile_key_t &other) const -> bool = default;

  auto operator<(const tile_key_t &other) const -> bool
  {
    return std::tie(zoom, x, y) < std::tie(other.zoom, other.x, other.y);
  }

  // "z/x/y", same layout as the tile server URLs
  auto to_string() const -> std::string
  {
    return std::format("{}/{}/{}", zoom, x, y);
  }
};

} // namespace tile_streamer
