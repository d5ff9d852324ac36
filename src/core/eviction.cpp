#include "core/eviction.hpp"
#include "core/log.hpp"
#include "core/tile_pyramid.hpp"
#include <cmath>
#include <vector>

namespace tile_streamer
{
namespace eviction
{

auto timeout_for(const streamer_config_t &config, overlay_class_t overlay_class) -> double
{
  switch (overlay_class)
  {
  case overlay_class_t::exact:
    return config.overlay_timeout;
  case overlay_class_t::corresponding:
    return config.overlay_timeout / 2.0;
  case overlay_class_t::none:
    break;
  }
  return config.tile_timeout;
}

auto update_visible_tiles(tile_cache_t &cache, const camera_state_t &camera, double now) -> size_t
{
  const auto &config = cache.config();
  size_t touched = 0;

  for (auto &[key, record] : cache.registry().records())
  {
    if (record.state != tile_state_t::active)
      continue;

    double limit = cache.overlays().is_overlay_key(key) ? config.overlay_visibility_distance : config.visibility_distance;
    double distance = camera.position.distance(pyramid::tile_center(key, config.world_size));
    if (distance < limit)
    {
      record.last_used = now;
      touched++;
    }
  }
  return touched;
}

auto is_sweep_due(const streamer_config_t &config, double total_time) -> bool
{
  return std::fmod(total_time, config.cleanup_interval) <= config.cleanup_tolerance;
}

auto sweep(tile_cache_t &cache, render_sink_t &sink, double now) -> sweep_report_t
{
  sweep_report_t report;
  report.ran = true;

  const auto &config = cache.config();
  const auto &overlays = cache.overlays();
  auto &registry = cache.registry();

  std::vector<std::pair<tile_key_t, entity_handle_t>> expired;
  for (const auto &[key, record] : registry.records())
  {
    if (record.state != tile_state_t::active)
      continue;

    auto overlay_class = overlays.classify(key);
    // Exact overlay tiles stay for good
    if (overlay_class == overlay_class_t::exact)
      continue;

    if (now - record.last_used > timeout_for(config, overlay_class))
      expired.emplace_back(key, record.entity);
  }

  for (const auto &[key, entity] : expired)
  {
    sink.destroy_entity(entity);
    registry.erase(key);
  }
  report.evicted = expired.size();

  // Claims that never turned into an entity. A fetch still in flight keeps the key claimed
  // through the pipeline and its late result is ignored
  report.pruned = registry.erase_if([&](const tile_key_t &key, const tile_record_t &record)
                                    { return record.state == tile_state_t::requested && !overlays.is_overlay_key(key); });

  logging::debug(config.debug && report.evicted > 0, "Cleaned up {} unused tiles", report.evicted);
  return report;
}

auto cleanup_old_tiles(tile_cache_t &cache, render_sink_t &sink, double now, double dt) -> sweep_report_t
{
  double total = cache.add_time(dt);
  if (!is_sweep_due(cache.config(), total))
    return {};

  return sweep(cache, sink, now);
}

} // namespace eviction
} // namespace tile_streamer
