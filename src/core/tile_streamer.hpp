#pragma once

#include "core/application_stage.hpp"
#include "core/camera.hpp"
#include "core/demand_scheduler.hpp"
#include "core/eviction.hpp"
#include "core/render_sink.hpp"
#include "core/tile_cache.hpp"
#include "core/zoom_controller.hpp"
#include <memory>
#include <optional>

namespace tile_streamer
{

struct tick_report_t
{
  bool camera_present = false;
  zoom::zoom_report_t zoom;
  scheduler::schedule_report_t schedule;
  application::apply_report_t applied;
  size_t refreshed = 0;
  eviction::sweep_report_t sweep;
};

struct streamer_stats_t
{
  int current_zoom = 0;
  size_t active_tiles = 0;
  size_t requested_tiles = 0;
  size_t in_flight = 0;
  uint64_t dispatched_total = 0;
  size_t overlay_entries = 0;
};

class tile_streamer_t
{
public:
  tile_streamer_t(streamer_config_t config, std::shared_ptr<tile_source_t> source, render_sink_t &sink);

  // One main-loop step. `now` is the elapsed time in seconds, `dt` the frame delta.
  // Without a camera the camera-driven stages are skipped.
  auto tick(const std::optional<camera_state_t> &camera, double now, double dt) -> tick_report_t;

  auto cache() -> tile_cache_t &;
  auto cache() const -> const tile_cache_t &;
  auto overlays() -> overlay_index_t &;

  auto get_stats() const -> streamer_stats_t;

  // Blocks until in-flight fetches finish; for shutdown and tests
  auto wait_for_fetches() -> void;

private:
  tile_cache_t m_cache;
  render_sink_t &m_sink;
};

} // namespace tile_streamer
