#pragma once

#include "core/tile_image.hpp"
#include "core/tile_key.hpp"
#include <optional>

namespace tile_streamer
{

class tile_source_t
{
public:
  virtual ~tile_source_t() = default;

  // Blocking retrieval, called from fetch worker threads.
  // std::nullopt means the tile could not be produced; the caller shows a fallback.
  virtual auto fetch(const tile_key_t &key) -> std::optional<tile_image_t> = 0;

  // Name/Type of source
  virtual auto get_name() const -> const char * = 0;
};

} // namespace tile_streamer
