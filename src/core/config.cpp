#include "core/config.hpp"
#include "core/geo_math.hpp"
#include "core/log.hpp"
#include "core/tile_pyramid.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tile_streamer
{

namespace
{

auto source_kind_to_string(tile_source_kind_t kind) -> const char *
{
  switch (kind)
  {
  case tile_source_kind_t::OSM:
    return "osm";
  case tile_source_kind_t::TERRARIUM:
    return "terrarium";
  case tile_source_kind_t::SATELLITE:
    return "satellite";
  case tile_source_kind_t::CUSTOM:
    return "custom";
  }
  return "osm";
}

auto source_kind_from_string(const std::string &name, tile_source_kind_t fallback) -> tile_source_kind_t
{
  if (name == "osm")
    return tile_source_kind_t::OSM;
  if (name == "terrarium")
    return tile_source_kind_t::TERRARIUM;
  if (name == "satellite")
    return tile_source_kind_t::SATELLITE;
  if (name == "custom")
    return tile_source_kind_t::CUSTOM;

  logging::warn("Unknown tile source '{}', keeping default", name);
  return fallback;
}

auto read_json(const std::string &filename, json &j) -> bool
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    return false;
  }

  try
  {
    file >> j;
  }
  catch (const json::parse_error &e)
  {
    logging::warn("JSON parse error in {}: {}", filename, e.what());
    return false;
  }
  return true;
}

} // namespace

auto validate_config(const streamer_config_t &config) -> bool
{
  if (config.world_size <= 0.0)
  {
    logging::warn("Config: world_size must be positive");
    return false;
  }
  if (config.min_zoom < 0 || config.max_zoom > 30 || config.min_zoom > config.max_zoom)
  {
    logging::warn("Config: invalid zoom range {}..{}", config.min_zoom, config.max_zoom);
    return false;
  }
  if (config.initial_zoom < config.min_zoom || config.initial_zoom > config.max_zoom)
  {
    logging::warn("Config: initial_zoom outside zoom range");
    return false;
  }
  if (config.overlay_zoom < 0 || config.overlay_zoom > 30)
  {
    logging::warn("Config: overlay_zoom out of range");
    return false;
  }
  if (config.height_thresholds.empty())
  {
    logging::warn("Config: height_thresholds must not be empty");
    return false;
  }
  for (size_t i = 1; i < config.height_thresholds.size(); i++)
  {
    if (config.height_thresholds[i].min_height > config.height_thresholds[i - 1].min_height)
    {
      logging::warn("Config: height_thresholds must be sorted by descending min_height");
      return false;
    }
  }
  if (config.cleanup_interval <= 0.0)
  {
    logging::warn("Config: cleanup_interval must be positive");
    return false;
  }
  if (config.source.kind == tile_source_kind_t::CUSTOM && config.source.url_template.empty())
  {
    logging::warn("Config: custom source needs a url_template");
    return false;
  }
  return true;
}

auto save_config(const std::string &filename, const streamer_config_t &config) -> bool
{
  json j;

  j["world_size"] = config.world_size;
  j["zoom"] = {{"min", config.min_zoom}, {"max", config.max_zoom}, {"initial", config.initial_zoom}, {"overlay", config.overlay_zoom}};

  json thresholds = json::array();
  for (const auto &t : config.height_thresholds)
  {
    thresholds.push_back({{"min_height", t.min_height}, {"zoom", t.zoom}});
  }
  j["height_thresholds"] = thresholds;

  j["visibility"] = {{"tile", config.visibility_distance}, {"overlay", config.overlay_visibility_distance}};
  j["timeouts"] = {{"tile", config.tile_timeout}, {"overlay", config.overlay_timeout}};
  j["cleanup"] = {{"interval", config.cleanup_interval}, {"tolerance", config.cleanup_tolerance}};

  j["source"] = {{"kind", source_kind_to_string(config.source.kind)},
                 {"url_template", config.source.url_template},
                 {"user_agent", config.source.user_agent},
                 {"timeout_ms", config.source.timeout_ms}};

  j["debug"] = config.debug;

  std::ofstream file(filename);
  if (!file.is_open())
  {
    return false;
  }

  file << j.dump(4);
  return true;
}

auto load_config(const std::string &filename, streamer_config_t &config) -> bool
{
  json j;
  if (!read_json(filename, j))
    return false;

  // Work on a copy so a bad file leaves the caller's defaults alone
  streamer_config_t loaded = config;
  try
  {
    loaded.world_size = j.value("world_size", loaded.world_size);

    if (j.contains("zoom"))
    {
      loaded.min_zoom = j["zoom"].value("min", loaded.min_zoom);
      loaded.max_zoom = j["zoom"].value("max", loaded.max_zoom);
      loaded.initial_zoom = j["zoom"].value("initial", loaded.initial_zoom);
      loaded.overlay_zoom = j["zoom"].value("overlay", loaded.overlay_zoom);
    }

    if (j.contains("height_thresholds") && j["height_thresholds"].is_array())
    {
      loaded.height_thresholds.clear();
      for (const auto &item : j["height_thresholds"])
      {
        loaded.height_thresholds.push_back({item.value("min_height", 0.0), item.value("zoom", loaded.initial_zoom)});
      }
    }

    if (j.contains("visibility"))
    {
      loaded.visibility_distance = j["visibility"].value("tile", loaded.visibility_distance);
      loaded.overlay_visibility_distance = j["visibility"].value("overlay", loaded.overlay_visibility_distance);
    }

    if (j.contains("timeouts"))
    {
      loaded.tile_timeout = j["timeouts"].value("tile", loaded.tile_timeout);
      loaded.overlay_timeout = j["timeouts"].value("overlay", loaded.overlay_timeout);
    }

    if (j.contains("cleanup"))
    {
      loaded.cleanup_interval = j["cleanup"].value("interval", loaded.cleanup_interval);
      loaded.cleanup_tolerance = j["cleanup"].value("tolerance", loaded.cleanup_tolerance);
    }

    if (j.contains("source"))
    {
      const auto &s = j["source"];
      loaded.source.kind = source_kind_from_string(s.value("kind", std::string(source_kind_to_string(loaded.source.kind))), loaded.source.kind);
      loaded.source.url_template = s.value("url_template", loaded.source.url_template);
      loaded.source.user_agent = s.value("user_agent", loaded.source.user_agent);
      loaded.source.timeout_ms = s.value("timeout_ms", loaded.source.timeout_ms);
    }

    loaded.debug = j.value("debug", loaded.debug);
  }
  catch (const json::type_error &e)
  {
    logging::warn("Config type error in {}: {}", filename, e.what());
    return false;
  }

  if (!validate_config(loaded))
    return false;

  config = loaded;
  return true;
}

auto save_overlay_entries(const std::string &filename, const overlay_index_t &overlays) -> bool
{
  json j = json::array();
  for (const auto &[coords, entry] : overlays.entries())
  {
    j.push_back({{"x", entry.x}, {"y", entry.y}, {"name", entry.name}, {"description", entry.description}});
  }

  std::ofstream file(filename);
  if (!file.is_open())
  {
    return false;
  }

  file << j.dump(4);
  return true;
}

auto load_overlay_entries(const std::string &filename, overlay_index_t &overlays) -> bool
{
  json j;
  if (!read_json(filename, j))
    return false;

  if (!j.is_array())
  {
    logging::warn("Overlay file {} must contain an array", filename);
    return false;
  }

  int zoom = overlays.get_overlay_zoom();
  uint32_t max_index = pyramid::max_tile_index(zoom);
  std::vector<overlay_entry_t> loaded;

  try
  {
    for (const auto &item : j)
    {
      overlay_entry_t entry;
      entry.name = item.value("name", "Unnamed overlay");
      entry.description = item.value("description", "");

      if (item.contains("x") && item.contains("y"))
      {
        entry.x = item["x"].get<uint32_t>();
        entry.y = item["y"].get<uint32_t>();
      }
      else if (item.contains("lat") && item.contains("lon"))
      {
        double wx, wy;
        geo::lat_lon_to_world(item["lat"].get<double>(), item["lon"].get<double>(), wx, wy);

        int tx, ty;
        geo::world_to_tile(wx, wy, zoom, tx, ty);
        if (tx < 0 || ty < 0)
        {
          logging::warn("Overlay entry '{}' lies outside zoom {}, skipped", entry.name, zoom);
          continue;
        }
        entry.x = static_cast<uint32_t>(tx);
        entry.y = static_cast<uint32_t>(ty);
      }
      else
      {
        logging::warn("Overlay entry '{}' has no position, skipped", entry.name);
        continue;
      }

      if (entry.x > max_index || entry.y > max_index)
      {
        logging::warn("Overlay entry '{}' lies outside zoom {}, skipped", entry.name, zoom);
        continue;
      }

      loaded.push_back(entry);
    }
  }
  catch (const json::type_error &e)
  {
    logging::warn("Overlay type error in {}: {}", filename, e.what());
    return false;
  }

  for (const auto &entry : loaded)
  {
    overlays.add(entry);
  }
  return true;
}

} // namespace tile_streamer
