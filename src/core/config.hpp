#pragma once

#include "core/overlay_index.hpp"
#include <string>
#include <vector>

namespace tile_streamer
{

enum class tile_source_kind_t
{
  OSM,
  TERRARIUM,
  SATELLITE,
  CUSTOM
};

struct height_threshold_t
{
  double min_height = 0.0;
  int zoom = 0;
};

struct source_config_t
{
  tile_source_kind_t kind = tile_source_kind_t::OSM;
  // Only used for CUSTOM, with {z} {x} {y} placeholders
  std::string url_template;
  std::string user_agent = "TileStreamer/0.1";
  int timeout_ms = 10000;
};

struct streamer_config_t
{
  // Side of the Web Mercator square in render units (one unit per zoom-17 tile)
  double world_size = 131072.0;

  int min_zoom = 2;
  int max_zoom = 19;
  int initial_zoom = 15;
  int overlay_zoom = 17;

  // Ordered from highest to lowest min_height, first match wins
  std::vector<height_threshold_t> height_thresholds = {
      {2000.0, 10}, {1000.0, 11}, {500.0, 12}, {250.0, 13}, {120.0, 14},
      {60.0, 15},   {30.0, 16},   {15.0, 17},  {5.0, 18},   {0.0, 19},
  };

  double visibility_distance = 30.0;
  double overlay_visibility_distance = 50.0;

  double tile_timeout = 45.0;
  // Corresponding overlay tiles get half of this
  double overlay_timeout = 180.0;

  double cleanup_interval = 5.0;
  double cleanup_tolerance = 0.05;

  source_config_t source;

  bool debug = false;
};

auto validate_config(const streamer_config_t &config) -> bool;

auto load_config(const std::string &filename, streamer_config_t &config) -> bool;
auto save_config(const std::string &filename, const streamer_config_t &config) -> bool;

// Entries carry either "x"/"y" at the overlay zoom or "lat"/"lon"
auto load_overlay_entries(const std::string &filename, overlay_index_t &overlays) -> bool;
auto save_overlay_entries(const std::string &filename, const overlay_index_t &overlays) -> bool;

} // namespace tile_streamer
