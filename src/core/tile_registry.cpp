#include "core/tile_registry.hpp"

namespace tile_streamer
{

auto tile_registry_t::state(const tile_key_t &key) const -> tile_state_t
{
  auto it = m_records.find(key);
  if (it == m_records.end())
    return tile_state_t::unrequested;
  return it->second.state;
}

auto tile_registry_t::contains(const tile_key_t &key) const -> bool
{
  return m_records.contains(key);
}

auto tile_registry_t::mark_requested(const tile_key_t &key) -> bool
{
  return m_records.try_emplace(key).second;
}

auto tile_registry_t::activate(const tile_key_t &key, entity_handle_t entity, double now) -> bool
{
  auto it = m_records.find(key);
  if (it == m_records.end() || it->second.state != tile_state_t::requested)
    return false;

  it->second.state = tile_state_t::active;
  it->second.entity = entity;
  it->second.last_used = now;
  return true;
}

auto tile_registry_t::touch(const tile_key_t &key, double now) -> void
{
  auto it = m_records.find(key);
  if (it != m_records.end() && it->second.state == tile_state_t::active)
    it->second.last_used = now;
}

auto tile_registry_t::find(const tile_key_t &key) const -> const tile_record_t *
{
  auto it = m_records.find(key);
  if (it == m_records.end())
    return nullptr;
  return &it->second;
}

auto tile_registry_t::erase(const tile_key_t &key) -> bool
{
  return m_records.erase(key) > 0;
}

auto tile_registry_t::erase_if(const std::function<bool(const tile_key_t &, const tile_record_t &)> &pred) -> size_t
{
  return std::erase_if(m_records, [&](const auto &item) { return pred(item.first, item.second); });
}

auto tile_registry_t::records() const -> const std::map<tile_key_t, tile_record_t> &
{
  return m_records;
}

auto tile_registry_t::records() -> std::map<tile_key_t, tile_record_t> &
{
  return m_records;
}

auto tile_registry_t::active_count() const -> size_t
{
  size_t count = 0;
  for (const auto &[key, record] : m_records)
  {
    if (record.state == tile_state_t::active)
      count++;
  }
  return count;
}

auto tile_registry_t::requested_count() const -> size_t
{
  return m_records.size() - active_count();
}

auto tile_registry_t::size() const -> size_t
{
  return m_records.size();
}

} // namespace tile_streamer
