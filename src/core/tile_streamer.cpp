#include "core/tile_streamer.hpp"

namespace tile_streamer
{

tile_streamer_t::tile_streamer_t(streamer_config_t config, std::shared_ptr<tile_source_t> source, render_sink_t &sink)
    : m_cache(std::move(config), std::move(source)), m_sink(sink)
{
}

auto tile_streamer_t::tick(const std::optional<camera_state_t> &camera, double now, double dt) -> tick_report_t
{
  tick_report_t report;
  report.camera_present = camera.has_value();

  if (camera)
  {
    report.zoom = zoom::update(m_cache, m_sink, *camera);
    report.schedule = scheduler::run(m_cache, *camera);
  }

  m_cache.pipeline().reap();
  report.applied = application::apply_pending(m_cache, m_sink, now);

  if (camera)
    report.refreshed = eviction::update_visible_tiles(m_cache, *camera, now);

  // The sweep only looks at timestamps, it runs with or without a camera
  report.sweep = eviction::cleanup_old_tiles(m_cache, m_sink, now, dt);

  return report;
}

auto tile_streamer_t::cache() -> tile_cache_t &
{
  return m_cache;
}

auto tile_streamer_t::cache() const -> const tile_cache_t &
{
  return m_cache;
}

auto tile_streamer_t::overlays() -> overlay_index_t &
{
  return m_cache.overlays();
}

auto tile_streamer_t::get_stats() const -> streamer_stats_t
{
  streamer_stats_t stats;
  stats.current_zoom = m_cache.get_current_zoom();
  stats.active_tiles = m_cache.registry().active_count();
  stats.requested_tiles = m_cache.registry().requested_count();
  stats.in_flight = m_cache.pipeline().outstanding_count();
  stats.dispatched_total = m_cache.pipeline().dispatched_count();
  stats.overlay_entries = m_cache.overlays().size();
  return stats;
}

auto tile_streamer_t::wait_for_fetches() -> void
{
  m_cache.pipeline().wait_idle();
}

} // namespace tile_streamer
