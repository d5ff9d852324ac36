#pragma once

#include "core/config.hpp"
#include "core/fetch_pipeline.hpp"
#include "core/overlay_index.hpp"
#include "core/tile_registry.hpp"
#include <memory>

namespace tile_streamer
{

// All streaming state, passed explicitly to every stage of a tick
class tile_cache_t
{
public:
  tile_cache_t(streamer_config_t config, std::shared_ptr<tile_source_t> source);

  auto config() const -> const streamer_config_t &;

  auto overlays() -> overlay_index_t &;
  auto overlays() const -> const overlay_index_t &;

  auto registry() -> tile_registry_t &;
  auto registry() const -> const tile_registry_t &;

  auto pipeline() -> fetch_pipeline_t &;
  auto pipeline() const -> const fetch_pipeline_t &;

  auto get_current_zoom() const -> int;
  auto set_current_zoom(int zoom) -> void;

  auto get_total_time() const -> double;
  auto add_time(double dt) -> double;

  // Requested, waiting in the result queue, or active
  auto is_claimed(const tile_key_t &key) const -> bool;

  // Claims and dispatches an unclaimed key; false if it was already claimed
  auto request(const tile_key_t &key) -> bool;

private:
  streamer_config_t m_config;
  overlay_index_t m_overlays;
  tile_registry_t m_registry;
  fetch_pipeline_t m_pipeline;
  int m_current_zoom;
  double m_total_time = 0.0;
};

} // namespace tile_streamer
