#pragma once

#include "core/camera.hpp"
#include "core/tile_cache.hpp"
#include <cstdint>
#include <vector>

namespace tile_streamer
{
namespace scheduler
{

struct tile_candidate_t
{
  tile_key_t key;
  uint32_t distance = 0;          // Manhattan distance from the camera tile
  uint32_t adjusted_distance = 0; // halved for overlay-corresponding tiles
  bool overlay = false;
};

struct schedule_report_t
{
  std::vector<tile_key_t> overlay_dispatched;
  std::vector<tile_key_t> dispatched;
  size_t skipped_claimed = 0;
};

// Tiles loaded on each side of the camera tile: 3 / 4 / 5 / 6
auto visible_range(int zoom) -> uint32_t;

// New plain-tile fetches allowed per tick: 8 / 10 / 12
auto concurrency_budget(int zoom) -> size_t;

// Overlay entries close enough to be fetched at the overlay zoom
auto overlay_candidates(const tile_cache_t &cache, const camera_state_t &camera) -> std::vector<tile_key_t>;

// Candidate window around the camera at the current zoom, frustum-filtered
// and sorted by adjusted distance (stable, so ties keep enumeration order)
auto plan(const tile_cache_t &cache, const camera_state_t &camera) -> std::vector<tile_candidate_t>;

// One scheduling pass: overlay fetches first (unbudgeted), then the plan up to the budget
auto run(tile_cache_t &cache, const camera_state_t &camera) -> schedule_report_t;

} // namespace scheduler
} // namespace tile_streamer
