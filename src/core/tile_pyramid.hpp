#pragma once

#include "core/camera.hpp"
#include "core/tile_key.hpp"
#include <cstdint>
#include <utility>
#include <vector>

namespace tile_streamer
{
namespace pyramid
{

// Inclusive rectangle of tiles at one zoom level
struct tile_block_t
{
  uint32_t min_x = 0;
  uint32_t min_y = 0;
  uint32_t max_x = 0;
  uint32_t max_y = 0;
  int zoom = 0;

  auto contains(uint32_t x, uint32_t y) const -> bool;
  auto contains(const tile_key_t &key) const -> bool;
  auto tile_count() const -> uint64_t;
  auto keys() const -> std::vector<tile_key_t>;
};

// 2^zoom - 1
auto max_tile_index(int zoom) -> uint32_t;

// Continuous tile-space coordinate of a render-space position (no clamping)
auto world_to_tile_space(double pos, int zoom, double world_size) -> double;

// Slippy-map tile containing the render-space point (pos_x, pos_z), clamped to the pyramid
auto world_to_tile(double pos_x, double pos_z, int zoom, double world_size) -> std::pair<uint32_t, uint32_t>;

// Render-space centre of the tile on the ground plane
auto tile_center(const tile_key_t &key, double world_size) -> vec3_t;

// Coarser target: the single covering tile (many-to-one, lossy).
// Finer target: the full 2^d x 2^d block the tile covers.
// Same zoom: identity.
auto reproject(const tile_key_t &key, int target_zoom) -> tile_block_t;

// Same as reproject() but enumerated
auto reproject_keys(const tile_key_t &key, int target_zoom) -> std::vector<tile_key_t>;

// Per-axis distance from (x, y) to the nearest tile of the block, 0 when inside
auto axis_distance(const tile_block_t &block, uint32_t x, uint32_t y) -> std::pair<uint32_t, uint32_t>;

// Manhattan distance from (x, y) to the nearest tile of the block
auto manhattan_distance(const tile_block_t &block, uint32_t x, uint32_t y) -> uint32_t;

} // namespace pyramid
} // namespace tile_streamer
