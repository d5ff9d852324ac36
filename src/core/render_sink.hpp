#pragma once

#include "core/overlay_index.hpp"
#include "core/tile_image.hpp"
#include "core/tile_key.hpp"
#include <cstdint>

namespace tile_streamer
{

using entity_handle_t = uint64_t;

// Host side of the render entity lifecycle. The streamer only decides when
// entities are created or destroyed; meshes, materials and textures live here.
class render_sink_t
{
public:
  virtual ~render_sink_t() = default;

  virtual auto create_tile_entity(const tile_key_t &key, const tile_image_t &image) -> entity_handle_t = 0;
  virtual auto create_fallback_entity(const tile_key_t &key) -> entity_handle_t = 0;

  // Green placeholder, tint_intensity is the green channel (0.7 exact, 0.5 corresponding)
  virtual auto create_overlay_fallback_entity(const tile_key_t &key, float tint_intensity) -> entity_handle_t = 0;

  virtual auto destroy_entity(entity_handle_t handle) -> void = 0;

  virtual auto attach_tile_metadata(entity_handle_t handle, const tile_key_t &key, double last_used) -> void = 0;
  virtual auto attach_overlay_metadata(entity_handle_t handle, const overlay_entry_t &entry) -> void = 0;
};

} // namespace tile_streamer
