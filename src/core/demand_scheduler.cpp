#include "core/demand_scheduler.hpp"
#include "core/log.hpp"
#include "core/tile_pyramid.hpp"
#include <algorithm>
#include <cstdlib>
#include <set>

namespace tile_streamer
{
namespace scheduler
{

// Tiles behind the camera are kept unless they are also far away
constexpr double FRUSTUM_DOT_LIMIT = -0.3;
constexpr double FRUSTUM_DISTANCE_FACTOR = 1.5;
constexpr uint32_t OVERLAY_SEARCH_FACTOR = 3;

auto visible_range(int zoom) -> uint32_t
{
  if (zoom >= 18)
    return 3;
  if (zoom >= 16)
    return 4;
  if (zoom >= 14)
    return 5;
  return 6;
}

auto concurrency_budget(int zoom) -> size_t
{
  if (zoom >= 17)
    return 8;
  if (zoom >= 15)
    return 10;
  return 12;
}

auto overlay_candidates(const tile_cache_t &cache, const camera_state_t &camera) -> std::vector<tile_key_t>
{
  int zoom = cache.get_current_zoom();
  auto [center_x, center_y] = pyramid::world_to_tile(camera.position.x, camera.position.z, zoom, cache.config().world_size);
  return cache.overlays().entries_near(center_x, center_y, zoom, visible_range(zoom) * OVERLAY_SEARCH_FACTOR);
}

auto plan(const tile_cache_t &cache, const camera_state_t &camera) -> std::vector<tile_candidate_t>
{
  const auto &config = cache.config();
  int zoom = cache.get_current_zoom();
  int64_t range = visible_range(zoom);
  int64_t max_index = pyramid::max_tile_index(zoom);

  auto [center_x, center_y] = pyramid::world_to_tile(camera.position.x, camera.position.z, zoom, config.world_size);

  // Frustum test runs in tile units of the current zoom
  vec3_t eye{pyramid::world_to_tile_space(camera.position.x, zoom, config.world_size),
             pyramid::world_to_tile_space(camera.position.y, zoom, config.world_size),
             pyramid::world_to_tile_space(camera.position.z, zoom, config.world_size)};
  vec3_t forward = camera.forward.normalized();

  std::vector<tile_candidate_t> candidates;
  std::set<std::pair<uint32_t, uint32_t>> seen;

  for (int64_t dx = -range; dx <= range; dx++)
  {
    for (int64_t dy = -range; dy <= range; dy++)
    {
      auto tile_x = static_cast<uint32_t>(std::clamp<int64_t>(center_x + dx, 0, max_index));
      auto tile_y = static_cast<uint32_t>(std::clamp<int64_t>(center_y + dy, 0, max_index));

      // Clamping folds the window onto the pyramid edge
      if (!seen.insert({tile_x, tile_y}).second)
        continue;

      tile_key_t key{tile_x, tile_y, zoom};

      vec3_t to_tile = vec3_t{tile_x + 0.5, 0.0, tile_y + 0.5} - eye;
      double dist = to_tile.length();
      double dot = to_tile.normalized().dot(forward);
      if (dot < FRUSTUM_DOT_LIMIT && dist > range * FRUSTUM_DISTANCE_FACTOR)
        continue;

      tile_candidate_t candidate;
      candidate.key = key;
      candidate.distance = static_cast<uint32_t>(std::llabs(static_cast<int64_t>(tile_x) - center_x) +
                                                 std::llabs(static_cast<int64_t>(tile_y) - center_y));
      candidate.overlay = cache.overlays().corresponds(key);
      candidate.adjusted_distance = candidate.overlay ? candidate.distance / 2 : candidate.distance;
      candidates.push_back(candidate);
    }
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const tile_candidate_t &a, const tile_candidate_t &b) { return a.adjusted_distance < b.adjusted_distance; });
  return candidates;
}

auto run(tile_cache_t &cache, const camera_state_t &camera) -> schedule_report_t
{
  schedule_report_t report;
  bool debug = cache.config().debug;

  // Overlay content always loads at full fidelity, outside the budget
  auto overlays = overlay_candidates(cache, camera);
  logging::debug(debug && !overlays.empty(), "Found {} overlay entries near camera", overlays.size());
  for (const auto &key : overlays)
  {
    if (cache.request(key))
    {
      logging::debug(debug, "Loading overlay tile {}", key.to_string());
      report.overlay_dispatched.push_back(key);
    }
  }

  int zoom = cache.get_current_zoom();
  size_t budget = concurrency_budget(zoom);

  for (const auto &candidate : plan(cache, camera))
  {
    if (report.dispatched.size() >= budget)
      break;

    if (cache.is_claimed(candidate.key))
    {
      report.skipped_claimed++;
      continue;
    }

    cache.request(candidate.key);
    report.dispatched.push_back(candidate.key);
    logging::debug(debug, "Loading {} tile {}", candidate.overlay ? "overlay-corresponding" : "regular", candidate.key.to_string());
  }

  return report;
}

} // namespace scheduler
} // namespace tile_streamer
