#include "core/tile_cache.hpp"

namespace tile_streamer
{

tile_cache_t::tile_cache_t(streamer_config_t config, std::shared_ptr<tile_source_t> source)
    : m_config(std::move(config)), m_overlays(m_config.overlay_zoom), m_pipeline(std::move(source), m_config.debug),
      m_current_zoom(m_config.initial_zoom)
{
}

auto tile_cache_t::config() const -> const streamer_config_t &
{
  return m_config;
}

auto tile_cache_t::overlays() -> overlay_index_t &
{
  return m_overlays;
}

auto tile_cache_t::overlays() const -> const overlay_index_t &
{
  return m_overlays;
}

auto tile_cache_t::registry() -> tile_registry_t &
{
  return m_registry;
}

auto tile_cache_t::registry() const -> const tile_registry_t &
{
  return m_registry;
}

auto tile_cache_t::pipeline() -> fetch_pipeline_t &
{
  return m_pipeline;
}

auto tile_cache_t::pipeline() const -> const fetch_pipeline_t &
{
  return m_pipeline;
}

auto tile_cache_t::get_current_zoom() const -> int
{
  return m_current_zoom;
}

auto tile_cache_t::set_current_zoom(int zoom) -> void
{
  m_current_zoom = zoom;
}

auto tile_cache_t::get_total_time() const -> double
{
  return m_total_time;
}

auto tile_cache_t::add_time(double dt) -> double
{
  m_total_time += dt;
  return m_total_time;
}

auto tile_cache_t::is_claimed(const tile_key_t &key) const -> bool
{
  return m_registry.contains(key) || m_pipeline.is_outstanding(key);
}

auto tile_cache_t::request(const tile_key_t &key) -> bool
{
  if (is_claimed(key))
    return false;

  m_registry.mark_requested(key);
  m_pipeline.dispatch(key);
  return true;
}

} // namespace tile_streamer
