#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "core/geo_math.hpp"
#include "core/http_tile_source.hpp"
#include "core/log.hpp"
#include "core/tile_streamer.hpp"

constexpr const char *CONFIG_FILE = "tile_streamer.json";
constexpr const char *OVERLAY_FILE = "overlays.json";

namespace tile_streamer
{

// Stands in for a renderer: hands out handles and logs the lifecycle
class console_render_sink_t : public render_sink_t
{
public:
  explicit console_render_sink_t(bool verbose) : m_verbose(verbose)
  {
  }

  auto create_tile_entity(const tile_key_t &key, const tile_image_t &image) -> entity_handle_t override
  {
    logging::debug(m_verbose, "spawn tile {} ({}x{}, {} bytes)", key.to_string(), image.get_width(), image.get_height(), image.get_pixels().size());
    return spawn();
  }

  auto create_fallback_entity(const tile_key_t &key) -> entity_handle_t override
  {
    logging::debug(m_verbose, "spawn fallback {}", key.to_string());
    return spawn();
  }

  auto create_overlay_fallback_entity(const tile_key_t &key, float tint_intensity) -> entity_handle_t override
  {
    logging::debug(m_verbose, "spawn overlay fallback {} (green {:.1f})", key.to_string(), tint_intensity);
    return spawn();
  }

  auto destroy_entity(entity_handle_t handle) -> void override
  {
    logging::debug(m_verbose, "despawn entity {}", handle);
    m_live--;
  }

  auto attach_tile_metadata(entity_handle_t, const tile_key_t &, double) -> void override
  {
  }

  auto attach_overlay_metadata(entity_handle_t handle, const overlay_entry_t &entry) -> void override
  {
    logging::info("Overlay '{}' attached to entity {}", entry.name, handle);
  }

  auto get_live_count() const -> long
  {
    return m_live;
  }

private:
  auto spawn() -> entity_handle_t
  {
    m_live++;
    return ++m_next_handle;
  }

  bool m_verbose;
  entity_handle_t m_next_handle = 0;
  long m_live = 0;
};

} // namespace tile_streamer

// Usage: tile_streamer [config.json] [overlays.json] [seconds] [lat] [lon]
int main(int argc, char **argv)
{
  using namespace tile_streamer;

  std::string config_file = argc > 1 ? argv[1] : CONFIG_FILE;
  std::string overlay_file = argc > 2 ? argv[2] : OVERLAY_FILE;
  double duration = argc > 3 ? std::atof(argv[3]) : 20.0;
  double lat = argc > 4 ? std::atof(argv[4]) : 51.5074;
  double lon = argc > 5 ? std::atof(argv[5]) : -0.1278;

  streamer_config_t config;
  if (!load_config(config_file, config))
  {
    logging::warn("Using default configuration ({} not loaded)", config_file);
    if (!save_config(config_file, config))
      logging::warn("Could not write default configuration to {}", config_file);
  }

  auto source = std::make_shared<http_tile_source_t>(config.source, config.debug);
  console_render_sink_t sink(config.debug);
  tile_streamer_t streamer(config, source, sink);

  if (!load_overlay_entries(overlay_file, streamer.overlays()))
    logging::warn("No overlay entries loaded from {}", overlay_file);

  logging::info("Streaming from {} with {} overlay entries", source->get_name(), streamer.overlays().size());

  double wx, wy;
  geo::lat_lon_to_world(lat, lon, wx, wy);

  // Scripted descent: start high, sink toward the ground while drifting east
  const double dt = 1.0 / 30.0;
  const double start_height = 600.0;
  const double end_height = 10.0;

  camera_state_t camera;
  camera.forward = vec3_t{0.3, -1.0, 0.0}.normalized();

  double now = 0.0;
  double next_report = 0.0;
  while (now < duration)
  {
    double t = duration > 0.0 ? now / duration : 1.0;
    camera.position.x = wx * config.world_size + t * 20.0;
    camera.position.z = wy * config.world_size;
    camera.position.y = start_height + (end_height - start_height) * t;

    streamer.tick(camera, now, dt);

    if (now >= next_report)
    {
      auto stats = streamer.get_stats();
      logging::info("t={:.1f}s height={:.0f} zoom={} active={} requested={} in_flight={} live_entities={}", now, camera.position.y,
                    stats.current_zoom, stats.active_tiles, stats.requested_tiles, stats.in_flight, sink.get_live_count());
      next_report += 1.0;
    }

    std::this_thread::sleep_for(std::chrono::duration<double>(dt));
    now += dt;
  }

  streamer.wait_for_fetches();
  auto stats = streamer.get_stats();
  logging::info("Done: {} fetches dispatched, {} tiles active at zoom {}", stats.dispatched_total, stats.active_tiles, stats.current_zoom);
  return 0;
}
