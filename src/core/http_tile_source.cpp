#include "core/http_tile_source.hpp"
#include "core/log.hpp"
#include <cpr/cpr.h>
#include <format>
#include <utility>

namespace tile_streamer
{

namespace
{

auto replace_all(std::string text, const std::string &token, const std::string &value) -> std::string
{
  size_t pos = 0;
  while ((pos = text.find(token, pos)) != std::string::npos)
  {
    text.replace(pos, token.size(), value);
    pos += value.size();
  }
  return text;
}

} // namespace

http_tile_source_t::http_tile_source_t(source_config_t config, bool debug) : m_config(std::move(config)), m_debug(debug)
{
}

http_tile_source_t::~http_tile_source_t()
{
}

auto http_tile_source_t::get_name() const -> const char *
{
  switch (m_config.kind)
  {
  case tile_source_kind_t::OSM:
    return "OpenStreetMap";
  case tile_source_kind_t::TERRARIUM:
    return "Terrarium";
  case tile_source_kind_t::SATELLITE:
    return "Esri World Imagery";
  case tile_source_kind_t::CUSTOM:
    return "Custom";
  }
  return "Unknown";
}

auto http_tile_source_t::make_url(const tile_key_t &key) const -> std::string
{
  switch (m_config.kind)
  {
  case tile_source_kind_t::OSM:
    return std::format("https://tile.openstreetmap.org/{}/{}/{}.png", key.zoom, key.x, key.y);
  case tile_source_kind_t::TERRARIUM:
    // AWS Terrain Tiles (Mapzen Terrarium)
    return std::format("https://s3.amazonaws.com/elevation-tiles-prod/"
                       "terrarium/{}/{}/{}.png",
                       key.zoom, key.x, key.y);
  case tile_source_kind_t::SATELLITE:
    // Esri World Imagery (Satellite), note y before x
    return std::format("https://server.arcgisonline.com/ArcGIS/rest/services/"
                       "World_Imagery/MapServer/tile/{}/{}/{}",
                       key.zoom, key.y, key.x);
  case tile_source_kind_t::CUSTOM:
    break;
  }

  std::string url = replace_all(m_config.url_template, "{z}", std::to_string(key.zoom));
  url = replace_all(url, "{x}", std::to_string(key.x));
  return replace_all(url, "{y}", std::to_string(key.y));
}

auto http_tile_source_t::fetch(const tile_key_t &key) -> std::optional<tile_image_t>
{
  std::string url = make_url(key);
  if (url.empty())
  {
    logging::warn("No URL for tile {} (empty url_template?)", key.to_string());
    return std::nullopt;
  }

  cpr::Response r = cpr::Get(cpr::Url{url}, cpr::Header{{"User-Agent", m_config.user_agent}}, cpr::Timeout{m_config.timeout_ms});

  if (r.error)
  {
    logging::debug(m_debug, "Tile {} request failed: {}", key.to_string(), r.error.message);
    return std::nullopt;
  }

  if (r.status_code != 200)
  {
    logging::debug(m_debug, "Tile {} returned HTTP {}", key.to_string(), r.status_code);
    return std::nullopt;
  }

  tile_image_t image;
  if (!image.load_from_memory(reinterpret_cast<const unsigned char *>(r.text.data()), r.text.size()))
  {
    return std::nullopt;
  }
  return image;
}

} // namespace tile_streamer
