#include "core/application_stage.hpp"
#include "core/log.hpp"

namespace tile_streamer
{
namespace application
{

auto apply_result(tile_cache_t &cache, render_sink_t &sink, fetch_result_t result, double now) -> bool
{
  const auto &key = result.key;
  bool debug = cache.config().debug;

  // Late result for a key that was pruned (or already resolved)
  if (cache.registry().state(key) != tile_state_t::requested)
  {
    logging::debug(debug, "Ignoring result for untracked tile {}", key.to_string());
    return false;
  }

  auto overlay_class = cache.overlays().classify(key);
  bool is_exact = overlay_class == overlay_class_t::exact;
  bool needs_overlay_visual = overlay_class != overlay_class_t::none;

  entity_handle_t entity = 0;
  if (result.image && result.image->is_valid())
  {
    if (needs_overlay_visual)
    {
      logging::debug(debug, "Creating {} overlay tile {}", is_exact ? "exact" : "corresponding", key.to_string());
      result.image->apply_overlay_treatment();
    }
    else
    {
      logging::debug(debug, "Creating regular tile {}", key.to_string());
    }
    entity = sink.create_tile_entity(key, *result.image);
  }
  else
  {
    logging::debug(debug, "Creating fallback entity for tile {}", key.to_string());
    if (needs_overlay_visual)
      entity = sink.create_overlay_fallback_entity(key, is_exact ? EXACT_OVERLAY_TINT : CORRESPONDING_OVERLAY_TINT);
    else
      entity = sink.create_fallback_entity(key);
  }

  if (is_exact)
  {
    if (const auto *entry = cache.overlays().find(key.x, key.y))
      sink.attach_overlay_metadata(entity, *entry);
  }

  sink.attach_tile_metadata(entity, key, now);
  cache.registry().activate(key, entity, now);
  return true;
}

auto apply_pending(tile_cache_t &cache, render_sink_t &sink, double now) -> apply_report_t
{
  apply_report_t report;

  // Lock is released before any entity is built
  auto results = cache.pipeline().drain_results();

  for (auto &result : results)
  {
    bool has_image = result.image && result.image->is_valid();
    if (!apply_result(cache, sink, std::move(result), now))
    {
      report.ignored++;
      continue;
    }

    if (has_image)
      report.created++;
    else
      report.fallbacks++;
  }

  return report;
}

} // namespace application
} // namespace tile_streamer
