#pragma once

#include "core/camera.hpp"
#include "core/render_sink.hpp"
#include "core/tile_cache.hpp"

namespace tile_streamer
{
namespace eviction
{

struct sweep_report_t
{
  bool ran = false;
  size_t evicted = 0;
  size_t pruned = 0;
};

// 180s exact overlay, 90s corresponding overlay, 45s plain (with default config)
auto timeout_for(const streamer_config_t &config, overlay_class_t overlay_class) -> double;

// Refreshes last_used of active tiles near the camera, returns how many were touched
auto update_visible_tiles(tile_cache_t &cache, const camera_state_t &camera, double now) -> size_t;

// True on the ticks where the elapsed counter sits on a cleanup boundary
auto is_sweep_due(const streamer_config_t &config, double total_time) -> bool;

// Unthrottled sweep: evicts expired tiles (never exact overlay tiles) and
// prunes stale request claims
auto sweep(tile_cache_t &cache, render_sink_t &sink, double now) -> sweep_report_t;

// Advances the elapsed counter by dt and sweeps when due
auto cleanup_old_tiles(tile_cache_t &cache, render_sink_t &sink, double now, double dt) -> sweep_report_t;

} // namespace eviction
} // namespace tile_streamer
