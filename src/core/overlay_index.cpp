#include "core/overlay_index.hpp"
#include "core/tile_pyramid.hpp"

namespace tile_streamer
{

overlay_index_t::overlay_index_t(int overlay_zoom) : m_overlay_zoom(overlay_zoom)
{
}

auto overlay_index_t::get_overlay_zoom() const -> int
{
  return m_overlay_zoom;
}

auto overlay_index_t::add(const overlay_entry_t &entry) -> void
{
  m_entries[{entry.x, entry.y}] = entry;
}

auto overlay_index_t::remove(uint32_t x, uint32_t y) -> bool
{
  return m_entries.erase({x, y}) > 0;
}

auto overlay_index_t::clear() -> void
{
  m_entries.clear();
}

auto overlay_index_t::size() const -> size_t
{
  return m_entries.size();
}

auto overlay_index_t::empty() const -> bool
{
  return m_entries.empty();
}

auto overlay_index_t::entries() const -> const std::map<std::pair<uint32_t, uint32_t>, overlay_entry_t> &
{
  return m_entries;
}

auto overlay_index_t::find(uint32_t x, uint32_t y) const -> const overlay_entry_t *
{
  auto it = m_entries.find({x, y});
  if (it == m_entries.end())
    return nullptr;
  return &it->second;
}

auto overlay_index_t::is_overlay_key(const tile_key_t &key) const -> bool
{
  return key.zoom == m_overlay_zoom && m_entries.contains({key.x, key.y});
}

auto overlay_index_t::corresponds(const tile_key_t &key) const -> bool
{
  if (key.zoom == m_overlay_zoom)
    return is_overlay_key(key);

  if (key.zoom > m_overlay_zoom)
  {
    // Finer tile: its single covering tile at overlay zoom must be an entry
    auto covering = pyramid::reproject(key, m_overlay_zoom);
    return m_entries.contains({covering.min_x, covering.min_y});
  }

  // Coarser tile: any entry inside the block it covers at overlay zoom
  auto block = pyramid::reproject(key, m_overlay_zoom);
  if (block.tile_count() <= m_entries.size())
  {
    for (const auto &k : block.keys())
    {
      if (m_entries.contains({k.x, k.y}))
        return true;
    }
    return false;
  }

  for (const auto &[coords, entry] : m_entries)
  {
    if (block.contains(coords.first, coords.second))
      return true;
  }
  return false;
}

auto overlay_index_t::classify(const tile_key_t &key) const -> overlay_class_t
{
  if (is_overlay_key(key))
    return overlay_class_t::exact;
  if (key.zoom != m_overlay_zoom && corresponds(key))
    return overlay_class_t::corresponding;
  return overlay_class_t::none;
}

auto overlay_index_t::entries_near(uint32_t center_x, uint32_t center_y, int zoom, uint32_t max_distance) const -> std::vector<tile_key_t>
{
  std::vector<tile_key_t> out;
  for (const auto &[coords, entry] : m_entries)
  {
    tile_key_t key{coords.first, coords.second, m_overlay_zoom};
    auto footprint = pyramid::reproject(key, zoom);
    if (pyramid::manhattan_distance(footprint, center_x, center_y) <= max_distance)
    {
      out.push_back(key);
    }
  }
  return out;
}

} // namespace tile_streamer
