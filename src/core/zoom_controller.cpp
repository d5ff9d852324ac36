#include "core/zoom_controller.hpp"
#include "core/demand_scheduler.hpp"
#include "core/log.hpp"
#include "core/tile_pyramid.hpp"
#include <algorithm>
#include <cstdlib>
#include <vector>

namespace tile_streamer
{
namespace zoom
{

// Zoom levels further than this from the new one are dropped
constexpr int MAX_LEVEL_DISTANCE = 2;
constexpr uint32_t RETIRE_RANGE_FACTOR = 4;
constexpr uint32_t PRUNE_RANGE_FACTOR = 5;

namespace
{

// Footprint of `key` at `zoom` lies more than `limit` tiles away on either axis,
// or the key sits too many levels away
auto outside_window(const tile_key_t &key, int zoom, uint32_t center_x, uint32_t center_y, uint32_t limit) -> bool
{
  if (std::abs(key.zoom - zoom) > MAX_LEVEL_DISTANCE)
    return true;

  auto [dx, dy] = pyramid::axis_distance(pyramid::reproject(key, zoom), center_x, center_y);
  return dx > limit || dy > limit;
}

} // namespace

auto select_zoom(const streamer_config_t &config, int current_zoom, double height) -> zoom_decision_t
{
  zoom_decision_t decision;
  decision.target_zoom = current_zoom;

  for (const auto &threshold : config.height_thresholds)
  {
    if (height >= threshold.min_height + HYSTERESIS_BAND)
    {
      decision.target_zoom = threshold.zoom;
      decision.band_min_height = threshold.min_height;
      break;
    }
  }

  // Zooming out needs the camera well past the threshold
  if (decision.target_zoom < current_zoom && height < decision.band_min_height + ZOOM_OUT_GUARD)
    decision.target_zoom = current_zoom;

  decision.target_zoom = std::clamp(decision.target_zoom, config.min_zoom, config.max_zoom);
  return decision;
}

auto predict_neighbor_zoom(const streamer_config_t &config, int current_zoom, const zoom_decision_t &decision, double height) -> std::optional<int>
{
  double band = decision.band_min_height;

  if (height > band + band * 0.7)
  {
    // Climbing, the coarser level comes next
    if (current_zoom > config.min_zoom)
      return current_zoom - 1;
  }
  else if (height < band + band * 0.3)
  {
    if (current_zoom < config.max_zoom)
      return current_zoom + 1;
  }
  return std::nullopt;
}

auto preload_block(tile_cache_t &cache, const camera_state_t &camera, int zoom) -> size_t
{
  auto [center_x, center_y] = pyramid::world_to_tile(camera.position.x, camera.position.z, zoom, cache.config().world_size);
  int64_t max_index = pyramid::max_tile_index(zoom);
  size_t requested = 0;

  for (int dx = -PRELOAD_RANGE; dx <= PRELOAD_RANGE; dx++)
  {
    for (int dy = -PRELOAD_RANGE; dy <= PRELOAD_RANGE; dy++)
    {
      tile_key_t key{static_cast<uint32_t>(std::clamp<int64_t>(static_cast<int64_t>(center_x) + dx, 0, max_index)),
                     static_cast<uint32_t>(std::clamp<int64_t>(static_cast<int64_t>(center_y) + dy, 0, max_index)), zoom};

      if (cache.request(key))
      {
        logging::debug(cache.config().debug, "Preloading tile for zoom transition {}", key.to_string());
        requested++;
      }
    }
  }
  return requested;
}

auto retire_distant_tiles(tile_cache_t &cache, render_sink_t &sink, const camera_state_t &camera, int new_zoom) -> zoom_report_t
{
  zoom_report_t report;

  const auto &overlays = cache.overlays();
  auto &registry = cache.registry();
  uint32_t range = scheduler::visible_range(new_zoom);
  auto [center_x, center_y] = pyramid::world_to_tile(camera.position.x, camera.position.z, new_zoom, cache.config().world_size);

  std::vector<std::pair<tile_key_t, entity_handle_t>> retired;
  for (const auto &[key, record] : registry.records())
  {
    if (record.state != tile_state_t::active || overlays.is_overlay_key(key))
      continue;

    if (outside_window(key, new_zoom, center_x, center_y, range * RETIRE_RANGE_FACTOR))
      retired.emplace_back(key, record.entity);
  }

  for (const auto &[key, entity] : retired)
  {
    sink.destroy_entity(entity);
    registry.erase(key);
  }
  report.retired = retired.size();

  // In-flight results for pruned claims are dropped when they arrive
  uint32_t keep = range * PRUNE_RANGE_FACTOR;
  uint32_t cx = center_x;
  uint32_t cy = center_y;
  report.pruned = registry.erase_if([&](const tile_key_t &key, const tile_record_t &record)
                                    { return record.state == tile_state_t::requested && !overlays.is_overlay_key(key) && outside_window(key, new_zoom, cx, cy, keep); });

  return report;
}

auto update(tile_cache_t &cache, render_sink_t &sink, const camera_state_t &camera) -> zoom_report_t
{
  const auto &config = cache.config();
  int current_zoom = cache.get_current_zoom();
  double height = camera.position.y;

  auto decision = select_zoom(config, current_zoom, height);

  zoom_report_t report;
  report.old_zoom = current_zoom;
  report.new_zoom = decision.target_zoom;
  report.changed = decision.target_zoom != current_zoom;

  if (report.changed)
  {
    // Both levels are needed while the transition settles
    report.preloaded += preload_block(cache, camera, current_zoom);
    report.preloaded += preload_block(cache, camera, decision.target_zoom);
  }
  else if (auto next = predict_neighbor_zoom(config, current_zoom, decision, height))
  {
    report.preloaded += preload_block(cache, camera, *next);
  }

  if (!report.changed)
    return report;

  cache.set_current_zoom(decision.target_zoom);
  logging::debug(config.debug, "Zoom level changed from {} to {} (camera height: {})", current_zoom, decision.target_zoom, height);

  auto retire = retire_distant_tiles(cache, sink, camera, decision.target_zoom);
  report.retired = retire.retired;
  report.pruned = retire.pruned;
  return report;
}

} // namespace zoom
} // namespace tile_streamer
