#pragma once

#include "core/tile_key.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tile_streamer
{

// Persistent content pinned at the overlay zoom level
struct overlay_entry_t
{
  uint32_t x = 0;
  uint32_t y = 0;
  std::string name;
  std::string description;
};

enum class overlay_class_t
{
  none,
  exact,         // the overlay tile itself at the overlay zoom
  corresponding, // a coarser or finer tile that covers / is covered by one
};

class overlay_index_t
{
public:
  explicit overlay_index_t(int overlay_zoom = 17);

  auto get_overlay_zoom() const -> int;

  // Replaces an existing entry at the same coordinates
  auto add(const overlay_entry_t &entry) -> void;
  auto remove(uint32_t x, uint32_t y) -> bool;
  auto clear() -> void;

  auto size() const -> size_t;
  auto empty() const -> bool;
  auto entries() const -> const std::map<std::pair<uint32_t, uint32_t>, overlay_entry_t> &;

  auto find(uint32_t x, uint32_t y) const -> const overlay_entry_t *;

  // Key sits at the overlay zoom and names an entry
  auto is_overlay_key(const tile_key_t &key) const -> bool;

  // Exact overlay key, or reprojection of the key intersects an entry
  auto corresponds(const tile_key_t &key) const -> bool;

  auto classify(const tile_key_t &key) const -> overlay_class_t;

  // Entries whose footprint at `zoom` lies within `max_distance` (Manhattan)
  // of the camera tile (center_x, center_y). Returned as keys at the overlay zoom.
  auto entries_near(uint32_t center_x, uint32_t center_y, int zoom, uint32_t max_distance) const -> std::vector<tile_key_t>;

private:
  int m_overlay_zoom;
  std::map<std::pair<uint32_t, uint32_t>, overlay_entry_t> m_entries;
};

} // namespace tile_streamer
