#include "core/tile_pyramid.hpp"
#include <algorithm>
#include <cmath>

namespace tile_streamer
{
namespace pyramid
{

auto tile_block_t::contains(uint32_t x, uint32_t y) const -> bool
{
  return x >= min_x && x <= max_x && y >= min_y && y <= max_y;
}

auto tile_block_t::contains(const tile_key_t &key) const -> bool
{
  return key.zoom == zoom && contains(key.x, key.y);
}

auto tile_block_t::tile_count() const -> uint64_t
{
  return static_cast<uint64_t>(max_x - min_x + 1) * static_cast<uint64_t>(max_y - min_y + 1);
}

auto tile_block_t::keys() const -> std::vector<tile_key_t>
{
  std::vector<tile_key_t> out;
  out.reserve(static_cast<size_t>(tile_count()));
  for (uint32_t x = min_x;; ++x)
  {
    for (uint32_t y = min_y;; ++y)
    {
      out.push_back({x, y, zoom});
      if (y == max_y)
        break;
    }
    if (x == max_x)
      break;
  }
  return out;
}

auto max_tile_index(int zoom) -> uint32_t
{
  if (zoom <= 0)
    return 0;
  if (zoom >= 32)
    return UINT32_MAX;
  return static_cast<uint32_t>((uint64_t{1} << zoom) - 1);
}

auto world_to_tile_space(double pos, int zoom, double world_size) -> double
{
  double n = static_cast<double>(uint64_t{1} << std::max(zoom, 0));
  return pos / world_size * n;
}

auto world_to_tile(double pos_x, double pos_z, int zoom, double world_size) -> std::pair<uint32_t, uint32_t>
{
  double max_index = static_cast<double>(max_tile_index(zoom));
  double tx = std::floor(world_to_tile_space(pos_x, zoom, world_size));
  double ty = std::floor(world_to_tile_space(pos_z, zoom, world_size));

  tx = std::clamp(tx, 0.0, max_index);
  ty = std::clamp(ty, 0.0, max_index);
  return {static_cast<uint32_t>(tx), static_cast<uint32_t>(ty)};
}

auto tile_center(const tile_key_t &key, double world_size) -> vec3_t
{
  double tile_size = world_size / static_cast<double>(uint64_t{1} << std::max(key.zoom, 0));
  return {(key.x + 0.5) * tile_size, 0.0, (key.y + 0.5) * tile_size};
}

auto reproject(const tile_key_t &key, int target_zoom) -> tile_block_t
{
  if (target_zoom < key.zoom)
  {
    int d = key.zoom - target_zoom;
    uint32_t x = d >= 32 ? 0 : key.x >> d;
    uint32_t y = d >= 32 ? 0 : key.y >> d;
    return {x, y, x, y, target_zoom};
  }

  if (target_zoom > key.zoom)
  {
    int d = target_zoom - key.zoom;
    uint32_t span = static_cast<uint32_t>(uint64_t{1} << d);
    uint32_t start_x = key.x << d;
    uint32_t start_y = key.y << d;
    return {start_x, start_y, start_x + span - 1, start_y + span - 1, target_zoom};
  }

  return {key.x, key.y, key.x, key.y, key.zoom};
}

auto reproject_keys(const tile_key_t &key, int target_zoom) -> std::vector<tile_key_t>
{
  return reproject(key, target_zoom).keys();
}

auto axis_distance(const tile_block_t &block, uint32_t x, uint32_t y) -> std::pair<uint32_t, uint32_t>
{
  uint32_t dx = 0;
  uint32_t dy = 0;

  if (x < block.min_x)
    dx = block.min_x - x;
  else if (x > block.max_x)
    dx = x - block.max_x;

  if (y < block.min_y)
    dy = block.min_y - y;
  else if (y > block.max_y)
    dy = y - block.max_y;

  return {dx, dy};
}

auto manhattan_distance(const tile_block_t &block, uint32_t x, uint32_t y) -> uint32_t
{
  auto [dx, dy] = axis_distance(block, x, y);
  return dx + dy;
}

} // namespace pyramid
} // namespace tile_streamer
