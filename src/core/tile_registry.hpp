#pragma once

#include "core/render_sink.hpp"
#include "core/tile_key.hpp"
#include <functional>
#include <map>
#include <vector>

namespace tile_streamer
{

// Keys absent from the registry are unrequested. Results waiting in the
// fetch queue are still `requested` here.
enum class tile_state_t
{
  unrequested,
  requested,
  active
};

struct tile_record_t
{
  tile_state_t state = tile_state_t::requested;
  entity_handle_t entity = 0;
  double last_used = 0.0;
};

class tile_registry_t
{
public:
  auto state(const tile_key_t &key) const -> tile_state_t;
  auto contains(const tile_key_t &key) const -> bool;

  // Claims the key for a fetch; false if it is already claimed or active
  auto mark_requested(const tile_key_t &key) -> bool;

  // requested -> active; false if the key is not awaiting a result
  auto activate(const tile_key_t &key, entity_handle_t entity, double now) -> bool;

  auto touch(const tile_key_t &key, double now) -> void;

  auto find(const tile_key_t &key) const -> const tile_record_t *;
  auto erase(const tile_key_t &key) -> bool;

  // Drops every record the predicate selects, returns how many went
  auto erase_if(const std::function<bool(const tile_key_t &, const tile_record_t &)> &pred) -> size_t;

  auto records() const -> const std::map<tile_key_t, tile_record_t> &;
  auto records() -> std::map<tile_key_t, tile_record_t> &;

  auto active_count() const -> size_t;
  auto requested_count() const -> size_t;
  auto size() const -> size_t;

private:
  std::map<tile_key_t, tile_record_t> m_records;
};

} // namespace tile_streamer
