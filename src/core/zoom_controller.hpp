#pragma once

#include "core/camera.hpp"
#include "core/render_sink.hpp"
#include "core/tile_cache.hpp"
#include <optional>

namespace tile_streamer
{
namespace zoom
{

// Height must clear a threshold by this much before it matches
constexpr double HYSTERESIS_BAND = 1.0;
// Extra margin before committing to a coarser zoom
constexpr double ZOOM_OUT_GUARD = 3.0;
// Side of the preload block is 2 * PRELOAD_RANGE + 1
constexpr int PRELOAD_RANGE = 2;

struct zoom_decision_t
{
  int target_zoom = 0;
  double band_min_height = 0.0; // min_height of the matched threshold, 0 if none matched
};

struct zoom_report_t
{
  bool changed = false;
  int old_zoom = 0;
  int new_zoom = 0;
  size_t preloaded = 0;
  size_t retired = 0;
  size_t pruned = 0;
};

// First threshold (from the top) with height >= min_height + 1, guarded
// against zooming out until height >= min_height + 3
auto select_zoom(const streamer_config_t &config, int current_zoom, double height) -> zoom_decision_t;

// Neighbouring zoom the camera is drifting toward while the zoom is steady
auto predict_neighbor_zoom(const streamer_config_t &config, int current_zoom, const zoom_decision_t &decision, double height) -> std::optional<int>;

// Requests the 5x5 block around the camera at `zoom`, outside the scheduler budget
auto preload_block(tile_cache_t &cache, const camera_state_t &camera, int zoom) -> size_t;

// After a zoom change: despawns far or off-level tiles (overlay tiles stay)
// and prunes request claims outside the wider keep window
auto retire_distant_tiles(tile_cache_t &cache, render_sink_t &sink, const camera_state_t &camera, int new_zoom) -> zoom_report_t;

auto update(tile_cache_t &cache, render_sink_t &sink, const camera_state_t &camera) -> zoom_report_t;

} // namespace zoom
} // namespace tile_streamer
